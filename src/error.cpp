#include "pqstudio/error.h"

#include <sstream>

namespace pqstudio {

ErrorSeverity default_severity(ErrorCode code) {
  switch (code) {
  case ErrorCode::NULLABILITY_VIOLATION:
  case ErrorCode::TYPE_COERCION:
  case ErrorCode::UNKNOWN_COLUMN:
  case ErrorCode::INDEX_OUT_OF_RANGE:
  case ErrorCode::CANCELLED:
    return ErrorSeverity::RECOVERABLE;
  default:
    return ErrorSeverity::FATAL;
  }
}

const char* error_code_to_string(ErrorCode code) {
  // LCOV_EXCL_BR_START - exhaustive switch
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::DECODE_ERROR:
    return "DECODE_ERROR";
  case ErrorCode::ENCODE_ERROR:
    return "ENCODE_ERROR";
  case ErrorCode::UNSUPPORTED_TYPE:
    return "UNSUPPORTED_TYPE";
  case ErrorCode::SCHEMA_MISMATCH:
    return "SCHEMA_MISMATCH";
  case ErrorCode::UNKNOWN_COLUMN:
    return "UNKNOWN_COLUMN";
  case ErrorCode::INDEX_OUT_OF_RANGE:
    return "INDEX_OUT_OF_RANGE";
  case ErrorCode::NULLABILITY_VIOLATION:
    return "NULLABILITY_VIOLATION";
  case ErrorCode::TYPE_COERCION:
    return "TYPE_COERCION";
  case ErrorCode::IO_ERROR:
    return "IO_ERROR";
  case ErrorCode::EXPORT_ERROR:
    return "EXPORT_ERROR";
  case ErrorCode::CANCELLED:
    return "CANCELLED";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN";
  }
  // LCOV_EXCL_BR_STOP
}

const char* error_severity_to_string(ErrorSeverity severity) {
  switch (severity) {
  case ErrorSeverity::WARNING:
    return "WARNING";
  case ErrorSeverity::RECOVERABLE:
    return "ERROR";
  case ErrorSeverity::FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

std::string StudioError::to_string() const {
  std::ostringstream ss;
  ss << "[" << error_severity_to_string(severity) << "] " << error_code_to_string(code);

  if (!column.empty()) {
    ss << " in column '" << column << "'";
  }
  if (row.has_value()) {
    ss << " at row " << *row;
  }
  if (input.has_value()) {
    ss << " (input \"" << *input << "\")";
  }
  ss << ": " << message;

  return ss.str();
}

std::string ErrorCollector::summary() const {
  if (errors_.empty()) {
    return "No errors";
  }

  std::ostringstream ss;
  size_t warnings = 0, errors = 0, fatal = 0;

  for (const auto& err : errors_) {
    switch (err.severity) {
    case ErrorSeverity::WARNING:
      warnings++;
      break;
    case ErrorSeverity::RECOVERABLE:
      errors++;
      break;
    case ErrorSeverity::FATAL:
      fatal++;
      break;
    }
  }

  ss << "Total: " << errors_.size() << " (Warnings: " << warnings << ", Errors: " << errors
     << ", Fatal: " << fatal << ")";
  if (suppressed_count_ > 0) {
    ss << ", " << suppressed_count_ << " suppressed";
  }

  ss << "\n\nDetails:\n";
  for (const auto& err : errors_) {
    ss << err.to_string() << "\n";
  }

  return ss.str();
}

} // namespace pqstudio
