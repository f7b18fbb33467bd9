#pragma once

#include "cell.h"
#include "cow_buffer.h"
#include "load_pipeline.h"
#include "schema_catalog.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace pqstudio {

/**
 * @brief Immutable view of an EditBuffer at one point in time.
 *
 * Shares the catalog and the row storage with the buffer. A later mutation of
 * the buffer clones the rows first, so a snapshot never changes.
 */
class Snapshot {
public:
  Snapshot(std::shared_ptr<const SchemaCatalog> catalog, CowBuffer<Row> rows)
      : catalog_(std::move(catalog)), rows_(std::move(rows)) {}

  const SchemaCatalog& catalog() const { return *catalog_; }
  std::shared_ptr<const SchemaCatalog> catalog_ptr() const { return catalog_; }

  const std::vector<Row>& rows() const { return rows_.as_vec(); }
  size_t row_count() const { return rows_.size(); }
  size_t column_count() const { return catalog_->size(); }
  const Cell& cell(size_t row, size_t col) const { return rows_[row][col]; }

private:
  std::shared_ptr<const SchemaCatalog> catalog_;
  CowBuffer<Row> rows_;
};

/**
 * @brief The only mutable state of a session: rows, edits, deletions and
 *        the current row selection.
 *
 * Rows are addressed by position. Deleting rows shifts positions, so every
 * deletion clears the selection. The column count never changes.
 *
 * @note Thread Safety: single mutator. Snapshots may be read from any thread.
 */
class EditBuffer {
public:
  explicit EditBuffer(LoadResult loaded);

  /**
   * @brief Store user text for a cell, to be coerced at commit.
   *
   * Text in a BOOL column that is a recognized boolean form is stored as a
   * typed value immediately.
   *
   * @throws StudioException INDEX_OUT_OF_RANGE or UNKNOWN_COLUMN
   */
  void set_cell(size_t row, const std::string& column, const std::string& raw_text);

  // @throws StudioException INDEX_OUT_OF_RANGE or UNKNOWN_COLUMN
  void set_null(size_t row, const std::string& column);

  // Store a typed value. @throws SCHEMA_MISMATCH when it does not match the column
  void set_value(size_t row, const std::string& column, Cell value);

  // Remove rows by position, keeping survivors in order. Out-of-range indices
  // are ignored. Returns the new row count.
  size_t delete_rows(const std::set<size_t>& indices);

  // Selection (positions in the current row sequence)
  void select(size_t row);
  void deselect(size_t row);
  void toggle_selection(size_t row);
  void clear_selection() { selection_.clear(); }
  bool is_selected(size_t row) const { return selection_.count(row) != 0; }
  const std::set<size_t>& selected() const { return selection_; }

  // Delete the selected rows, then clear the selection
  size_t delete_selected();

  Snapshot snapshot() const { return Snapshot(catalog_, rows_.share()); }

  const std::vector<Row>& rows() const { return rows_.as_vec(); }
  size_t row_count() const { return rows_.size(); }
  size_t column_count() const { return catalog_->size(); }
  const Cell& cell(size_t row, size_t col) const;
  const SchemaCatalog& catalog() const { return *catalog_; }
  std::shared_ptr<const SchemaCatalog> catalog_ptr() const { return catalog_; }

  // Mutations since load or the last mark_clean()
  size_t edit_count() const { return edit_count_; }
  bool dirty() const { return edit_count_ > 0; }
  void mark_clean() { edit_count_ = 0; }

private:
  Cell& mutable_cell(size_t row, size_t col);
  void check_row(size_t row, const std::string& column) const;

  std::shared_ptr<const SchemaCatalog> catalog_;
  CowBuffer<Row> rows_;
  std::set<size_t> selection_;
  size_t edit_count_ = 0;
};

} // namespace pqstudio
