#pragma once

#include "edit_buffer.h"
#include "error.h"
#include "options.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pqstudio {

enum class ExportFormat : uint8_t { CSV = 0, JSON = 1, XLSX = 2 };

// "csv", "json", "xlsx"
const char* export_format_name(ExportFormat format);

// File extension without the dot (same as the name)
const char* export_format_extension(ExportFormat format);

// Case-insensitive; also accepts "excel" for XLSX
std::optional<ExportFormat> parse_export_format(std::string_view name);

// "export_<unix-millis>.<ext>"
std::string default_export_filename(ExportFormat format,
                                    std::chrono::system_clock::time_point now =
                                        std::chrono::system_clock::now());

struct ExportResult {
  size_t rows = 0;  // Data rows written (header excluded)
  size_t bytes = 0; // Size of the produced document
  std::string target; // Path written by Session::export_to, empty otherwise
  ErrorCollector warnings{ErrorMode::BEST_EFFORT};
};

/**
 * @brief Flattens a snapshot into CSV, JSON or an XLSX workbook.
 *
 * Export is best-effort: a cell the target format cannot represent exactly
 * is replaced (null for non-finite JSON numbers, U+FFFD for invalid UTF-8 in
 * JSON and XLSX, text for numbers a spreadsheet would round) and a WARNING is
 * recorded in the result. Only problems with the document as a whole throw
 * StudioException(EXPORT_ERROR), e.g. an invalid worksheet name.
 *
 * The snapshot is read-only; exporting never touches the edit buffer or the
 * commit path.
 */
class ExportPipeline {
public:
  explicit ExportPipeline(ExportOptions options = {}) : options_(std::move(options)) {}

  // Appends the document to `sink`
  ExportResult run(const Snapshot& snapshot, ExportFormat format,
                   std::vector<uint8_t>& sink) const;

  const ExportOptions& options() const { return options_; }

private:
  ExportOptions options_;
};

// Convenience wrapper around ExportPipeline::run
ExportResult export_snapshot(const Snapshot& snapshot, ExportFormat format,
                             std::vector<uint8_t>& sink, const ExportOptions& options = {});

} // namespace pqstudio
