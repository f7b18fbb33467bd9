#include "pqstudio/export_pipeline.h"

#include "exporters.h"

#include <algorithm>
#include <cctype>

namespace pqstudio {

const char* export_format_name(ExportFormat format) {
  switch (format) {
  case ExportFormat::CSV:
    return "csv";
  case ExportFormat::JSON:
    return "json";
  case ExportFormat::XLSX:
    return "xlsx";
  default:
    return "unknown";
  }
}

const char* export_format_extension(ExportFormat format) { return export_format_name(format); }

std::optional<ExportFormat> parse_export_format(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "csv")
    return ExportFormat::CSV;
  if (lower == "json")
    return ExportFormat::JSON;
  if (lower == "xlsx" || lower == "excel")
    return ExportFormat::XLSX;
  return std::nullopt;
}

std::string default_export_filename(ExportFormat format,
                                    std::chrono::system_clock::time_point now) {
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "export_" + std::to_string(millis) + "." + export_format_extension(format);
}

ExportResult ExportPipeline::run(const Snapshot& snapshot, ExportFormat format,
                                 std::vector<uint8_t>& sink) const {
  ExportResult result;
  result.warnings.set_max_errors(options_.max_warnings);

  if (format == ExportFormat::CSV && (options_.separator == '"' || options_.separator == '\n' ||
                                      options_.separator == '\r')) {
    throw StudioException(ErrorCode::EXPORT_ERROR, "invalid CSV separator");
  }

  size_t start = sink.size();
  switch (format) {
  case ExportFormat::CSV:
  case ExportFormat::JSON: {
    std::string text;
    if (format == ExportFormat::CSV)
      exporters::write_csv(snapshot, options_, text, result.warnings);
    else
      exporters::write_json(snapshot, options_, text, result.warnings);
    sink.insert(sink.end(), text.begin(), text.end());
    break;
  }
  case ExportFormat::XLSX:
    exporters::write_xlsx(snapshot, options_, sink, result.warnings);
    break;
  default:
    throw StudioException(ErrorCode::EXPORT_ERROR, "unknown export format");
  }

  result.rows = snapshot.row_count();
  result.bytes = sink.size() - start;
  return result;
}

ExportResult export_snapshot(const Snapshot& snapshot, ExportFormat format,
                             std::vector<uint8_t>& sink, const ExportOptions& options) {
  ExportPipeline pipeline(options);
  return pipeline.run(snapshot, format, sink);
}

} // namespace pqstudio
