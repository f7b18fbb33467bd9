#pragma once

#include "codec.h"
#include "edit_buffer.h"
#include "export_pipeline.h"
#include "options.h"
#include "schema_catalog.h"
#include "storage.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace pqstudio {

// Outcome of a successful load
struct LoadSummary {
  std::shared_ptr<const SchemaCatalog> catalog;
  size_t rows = 0;
  size_t source_rows = 0; // Rows in the file; more than `rows` for a preview
};

// What the status bar shows
struct StatusSummary {
  std::string file = "None"; // Current file path, "None" before the first load
  size_t rows = 0;
  size_t columns = 0;
  bool dirty = false;
  bool preview = false; // Loaded with LoadOptions.max_rows below the file's row count

  // "File: data.parquet | Rows: 3 | Columns: 2 | Modified"
  std::string to_string() const;
};

/**
 * @brief UI-facing facade over storage, codec and the pipelines.
 *
 * Owns the edit buffer of the current generation. Every operation reports
 * failure through Result instead of throwing; a failed load or commit leaves
 * the session exactly as it was.
 *
 * @example
 * @code
 * pqstudio::Session session;
 * auto loaded = session.load("data.parquet");
 * if (!loaded) {
 *     std::cerr << loaded.error.to_string() << std::endl;
 *     return 1;
 * }
 * session.edit(0, "age", "42");
 * if (auto saved = session.save(); !saved) {
 *     std::cerr << saved.error.to_string() << std::endl;
 * }
 * @endcode
 */
class Session {
public:
  // FileStorage and ParquetCodec configured from options.parquet
  explicit Session(StudioOptions options = {});
  Session(StudioOptions options, std::shared_ptr<Storage> storage, std::shared_ptr<Codec> codec);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Read, decode and materialize `path`. On success the path becomes the
  // current file and last_path().
  Result<LoadSummary> load(const std::string& path);

  Result<void> edit(size_t row, const std::string& column, const std::string& text);
  Result<void> set_null(size_t row, const std::string& column);

  // New row count
  Result<size_t> delete_rows(const std::set<size_t>& indices);

  Result<void> select(size_t row);
  Result<void> deselect(size_t row);
  Result<void> toggle_selection(size_t row);
  Result<void> clear_selection();
  std::set<size_t> selected() const;
  Result<size_t> delete_selected();

  // Encoded file bytes of the current rows. Fails for a preview, which does
  // not hold every row of the file.
  Result<std::vector<uint8_t>> commit();

  // Commit and write to `path` (empty = current file), then mark clean
  Result<void> save(const std::string& path = "");

  // Export the current rows. An empty target means default_export_filename().
  Result<ExportResult> export_to(ExportFormat format, const std::string& target = "");

  StatusSummary status() const;

  bool has_table() const;
  const std::vector<Row>& rows() const;     // empty without a table
  Snapshot snapshot() const;                // @throws StudioException without a table
  std::shared_ptr<const SchemaCatalog> catalog() const; // nullptr without a table
  const EditBuffer* buffer() const;         // nullptr without a table

  const std::string& current_path() const;
  const std::string& last_path() const;

  const StudioOptions& options() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pqstudio
