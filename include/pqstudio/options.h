#pragma once

#include "error.h"
#include "types.h"

#include <functional>
#include <string>

namespace pqstudio {

// Progress callback: (units_done, units_total) -> should_continue
using ProgressCallback = std::function<bool(size_t, size_t)>;

// Parquet writing options
struct ParquetOptions {
  // Stored uncompressed when the selected codec is not compiled in
  Compression compression = Compression::ZSTD;
  int compression_level = 3; // zstd default level

  size_t row_group_size = 1'000'000; // Rows per row group, one data page per column chunk
  size_t num_threads = 0;            // Column encoding threads, 0 = auto-detect, 1 = serial

  bool write_statistics = true;

  // Written into FileMetaData.created_by
  std::string created_by = "pqstudio version 0.1.0";
};

// Load pipeline options
struct LoadOptions {
  size_t max_rows = 0; // 0 = all rows
  // Rows materialized per progress report
  size_t progress_interval = 4096;
  ProgressCallback progress = nullptr;
};

// Commit pipeline options
struct CommitOptions {
  size_t num_threads = 0; // 0 = auto-detect, 1 = build columns on the calling thread
  ProgressCallback progress = nullptr;
};

// Export pipeline options.
// CSV writes Null and an empty string alike as an empty field, so the two are
// indistinguishable in CSV output; a one-column row holding either is a blank
// line. JSON and XLSX keep them apart.
struct ExportOptions {
  char separator = ',';             // CSV field separator
  bool include_header = true;       // CSV/XLSX header row
  bool include_row_numbers = false; // Prepend the 1-based display row number ("SN")
  int json_indent = 2;              // Spaces per nesting level, 0 = compact
  std::string sheet_name = "Data";  // XLSX worksheet name
  size_t max_warnings = ErrorCollector::DEFAULT_MAX_ERRORS;
};

// Combined options for a Session
struct StudioOptions {
  ParquetOptions parquet;
  LoadOptions load;
  CommitOptions commit;
  ExportOptions exports;

  bool verbose = false;
  bool timing = false;
};

} // namespace pqstudio
