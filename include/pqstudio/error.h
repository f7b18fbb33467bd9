#ifndef PQSTUDIO_ERROR_H
#define PQSTUDIO_ERROR_H

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file error.h
 * @brief Error handling framework for the pqstudio round-trip engine.
 *
 * Every failure in the engine is described by a StudioError: an ErrorCode that
 * classifies it, a severity, and optional cell coordinates (column name, row
 * index and the offending input text). Pipelines, codecs and storage throw
 * StudioException; the Session facade converts those into Result<T> values.
 * Export warnings are accumulated in an ErrorCollector.
 *
 * @see StudioException for the exception carried through the pipelines
 * @see ErrorCollector for best-effort warning collection during export
 */

namespace pqstudio {

/**
 * @brief Error codes representing the classes of failure the engine reports.
 *
 * Error codes are grouped by category:
 * - Codec boundary (DECODE_ERROR, ENCODE_ERROR)
 * - Schema errors (UNSUPPORTED_TYPE, SCHEMA_MISMATCH)
 * - Caller errors (UNKNOWN_COLUMN, INDEX_OUT_OF_RANGE)
 * - User input errors at commit (NULLABILITY_VIOLATION, TYPE_COERCION)
 * - General errors (IO_ERROR, EXPORT_ERROR, CANCELLED, INTERNAL_ERROR)
 */
enum class ErrorCode {
  NONE = 0, ///< No error

  // Codec boundary
  DECODE_ERROR, ///< Columnar bytes or decoded table handle are malformed
  ENCODE_ERROR, ///< Table violates the codec's structural constraints

  // Schema errors
  UNSUPPORTED_TYPE, ///< Source field uses a type outside the LogicalType set
  SCHEMA_MISMATCH,  ///< Internal invariant violation between schema and data

  // Caller errors
  UNKNOWN_COLUMN,     ///< Column name not present in the catalog
  INDEX_OUT_OF_RANGE, ///< Row index outside the current row sequence

  // User input errors
  NULLABILITY_VIOLATION, ///< Null value in a non-nullable column
  TYPE_COERCION,         ///< Edited text cannot be converted to the column type

  // General errors
  IO_ERROR,      ///< Storage read or write failure
  EXPORT_ERROR,  ///< Export target could not be produced
  CANCELLED,     ///< Operation abandoned by the caller
  INTERNAL_ERROR ///< Unexpected internal failure
};

/**
 * @brief Severity levels for engine errors.
 *
 * @note The enum values avoid names that collide with Windows macros.
 */
enum class ErrorSeverity {
  WARNING,     ///< Non-fatal issue, operation continues (export cell fallback)
  RECOVERABLE, ///< User can correct the input and retry (coercion failures)
  FATAL        ///< Operation cannot succeed for this input (codec, IO, schema)
};

/**
 * @brief Default severity for an error code.
 *
 * User input errors are RECOVERABLE, everything else is FATAL. Warnings are
 * only produced explicitly by exporters.
 */
ErrorSeverity default_severity(ErrorCode code);

/**
 * @brief Detailed information about a single engine error.
 *
 * Cell-level errors carry the column name, the row index (0-based, position in
 * the edit buffer at the time of the operation) and the offending input.
 *
 * @example
 * @code
 * auto err = StudioError::at_cell(ErrorCode::TYPE_COERCION, "age", 3, "12.5",
 *                                 "cannot convert to INT32: value is not an integer");
 * std::cout << err.to_string() << std::endl;
 * // [ERROR] TYPE_COERCION in column 'age' at row 3 (input "12.5"): cannot convert ...
 * @endcode
 */
struct StudioError {
  ErrorCode code = ErrorCode::NONE;                 ///< Classification of the error
  ErrorSeverity severity = ErrorSeverity::FATAL;    ///< Severity level
  std::string column;                               ///< Column name, empty when not cell-level
  std::optional<size_t> row;                        ///< Row index, when cell-level
  std::optional<std::string> input;                 ///< Offending input text, when known
  std::string message;                              ///< Human-readable description

  StudioError() = default;

  /**
   * @brief Construct an error with a message and the code's default severity.
   */
  StudioError(ErrorCode c, std::string msg)
      : code(c), severity(default_severity(c)), message(std::move(msg)) {}

  /**
   * @brief Construct an error with explicit severity.
   */
  StudioError(ErrorCode c, ErrorSeverity s, std::string msg)
      : code(c), severity(s), message(std::move(msg)) {}

  /**
   * @brief Construct a cell-level error naming column, row and input.
   */
  static StudioError at_cell(ErrorCode c, std::string column, size_t row,
                             std::optional<std::string> input, std::string msg) {
    StudioError err(c, std::move(msg));
    err.column = std::move(column);
    err.row = row;
    err.input = std::move(input);
    return err;
  }

  /**
   * @brief Convert the error to a human-readable string.
   *
   * @return Formatted string with severity, code, location and message.
   */
  std::string to_string() const;
};

/**
 * @brief Error handling modes for collectors.
 */
enum class ErrorMode {
  FAIL_FAST,  ///< Stop on the first recorded error
  PERMISSIVE, ///< Record everything, stop only on FATAL
  BEST_EFFORT ///< Record everything, never request a stop
};

/**
 * @brief Collects warnings and errors during best-effort operations.
 *
 * Exporters record one WARNING per cell they could not represent faithfully.
 * The collector stops storing entries once max_errors is reached and counts
 * the rest as suppressed.
 *
 * @note Thread Safety: ErrorCollector is NOT thread-safe. Use one collector per
 *       thread and combine them with merge_from().
 */
class ErrorCollector {
public:
  /** @brief Default maximum number of entries to store */
  static constexpr size_t DEFAULT_MAX_ERRORS = 10000;

  explicit ErrorCollector(ErrorMode mode = ErrorMode::PERMISSIVE,
                          size_t max_errors = DEFAULT_MAX_ERRORS)
      : mode_(mode), max_errors_(max_errors) {}

  /**
   * @brief Add an error to the collection.
   *
   * FATAL errors are tracked even when the entry itself is suppressed, so
   * should_stop() stays accurate.
   */
  void add_error(const StudioError& error) {
    if (error.severity == ErrorSeverity::FATAL) {
      has_fatal_ = true;
    }
    if (errors_.size() >= max_errors_) {
      ++suppressed_count_;
      return;
    }
    errors_.push_back(error);
  }

  /**
   * @brief Record a WARNING for a single cell.
   */
  void add_warning(ErrorCode code, const std::string& column, size_t row,
                   const std::string& message) {
    StudioError err(code, ErrorSeverity::WARNING, message);
    err.column = column;
    err.row = row;
    add_error(err);
  }

  bool at_error_limit() const { return errors_.size() >= max_errors_; }

  /**
   * @brief Check whether the caller should stop based on mode and errors.
   */
  bool should_stop() const {
    if (mode_ == ErrorMode::BEST_EFFORT)
      return false;
    if (mode_ == ErrorMode::FAIL_FAST && !errors_.empty())
      return true;
    return has_fatal_;
  }

  bool has_errors() const { return !errors_.empty(); }
  bool has_fatal_errors() const { return has_fatal_; }
  size_t error_count() const { return errors_.size(); }

  /// Number of stored entries with WARNING severity
  size_t warning_count() const {
    return static_cast<size_t>(
        std::count_if(errors_.begin(), errors_.end(), [](const StudioError& e) {
          return e.severity == ErrorSeverity::WARNING;
        }));
  }

  const std::vector<StudioError>& errors() const { return errors_; }

  /**
   * @brief Get a summary string of all recorded entries.
   */
  std::string summary() const;

  void clear() {
    errors_.clear();
    has_fatal_ = false;
    suppressed_count_ = 0;
  }

  ErrorMode mode() const { return mode_; }
  void set_mode(ErrorMode mode) { mode_ = mode; }
  void set_max_errors(size_t max_errors) { max_errors_ = max_errors; }
  size_t max_errors() const { return max_errors_; }

  /// Entries dropped after max_errors was reached
  size_t suppressed_count() const { return suppressed_count_; }

  /**
   * @brief Merge entries from another collector, respecting max_errors.
   */
  void merge_from(const ErrorCollector& other) {
    suppressed_count_ += other.suppressed_count_;
    if (other.has_fatal_) {
      has_fatal_ = true;
    }

    size_t available = max_errors_ > errors_.size() ? max_errors_ - errors_.size() : 0;
    size_t to_copy = std::min(available, other.errors_.size());
    suppressed_count_ += other.errors_.size() - to_copy;

    errors_.insert(errors_.end(), other.errors_.begin(),
                   other.errors_.begin() + static_cast<std::ptrdiff_t>(to_copy));
  }

private:
  ErrorMode mode_;
  size_t max_errors_;
  std::vector<StudioError> errors_;
  bool has_fatal_ = false;
  size_t suppressed_count_ = 0;
};

/**
 * @brief Exception carrying a StudioError through the pipelines.
 *
 * Thrown by LoadPipeline, CommitPipeline, codecs and storage. The Session
 * facade catches it and reports the contained error through Result<T>.
 *
 * @example
 * @code
 * try {
 *     auto table = pipeline.run(buffer.snapshot());
 * } catch (const pqstudio::StudioException& e) {
 *     std::cerr << e.error().to_string() << std::endl;
 * }
 * @endcode
 */
class StudioException : public std::runtime_error {
public:
  explicit StudioException(StudioError error)
      : std::runtime_error(error.to_string()), error_(std::move(error)) {}

  StudioException(ErrorCode code, const std::string& message)
      : StudioException(StudioError(code, message)) {}

  const StudioError& error() const { return error_; }
  ErrorCode code() const { return error_.code; }

private:
  StudioError error_;
};

/**
 * @brief Convert an ErrorCode to its string representation.
 *
 * @return C-string name of the error code (e.g., "TYPE_COERCION")
 */
const char* error_code_to_string(ErrorCode code);

/**
 * @brief Convert an ErrorSeverity to its string representation.
 *
 * @return C-string name of the severity ("WARNING", "ERROR", "FATAL")
 */
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace pqstudio

#endif // PQSTUDIO_ERROR_H
