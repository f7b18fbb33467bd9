#include "pqstudio/edit_buffer.h"

#include "pqstudio/value_parsers.h"

namespace pqstudio {

EditBuffer::EditBuffer(LoadResult loaded)
    : catalog_(std::move(loaded.catalog)), rows_(std::move(loaded.rows)) {
  if (!catalog_) {
    throw StudioException(ErrorCode::INTERNAL_ERROR, "edit buffer requires a schema catalog");
  }
  for (const auto& row : rows_.as_vec()) {
    if (row.size() != catalog_->size()) {
      throw StudioException(ErrorCode::SCHEMA_MISMATCH,
                            "row has " + std::to_string(row.size()) + " cells but the catalog has " +
                                std::to_string(catalog_->size()) + " columns");
    }
  }
}

void EditBuffer::check_row(size_t row, const std::string& column) const {
  if (row >= rows_.size()) {
    StudioError err(ErrorCode::INDEX_OUT_OF_RANGE,
                    "row " + std::to_string(row) + " is outside [0, " +
                        std::to_string(rows_.size()) + ")");
    err.column = column;
    err.row = row;
    throw StudioException(std::move(err));
  }
}

Cell& EditBuffer::mutable_cell(size_t row, size_t col) { return rows_.to_mut()[row][col]; }

const Cell& EditBuffer::cell(size_t row, size_t col) const {
  if (row >= rows_.size() || col >= catalog_->size()) {
    throw StudioException(ErrorCode::INDEX_OUT_OF_RANGE,
                          "cell (" + std::to_string(row) + ", " + std::to_string(col) +
                              ") is outside the table");
  }
  return rows_[row][col];
}

void EditBuffer::set_cell(size_t row, const std::string& column, const std::string& raw_text) {
  size_t col = catalog_->column_index(column);
  check_row(row, column);

  bool flag = false;
  if (catalog_->column(col).type.id == TypeId::BOOL &&
      parse_bool(raw_text, flag) == ParseStatus::OK) {
    mutable_cell(row, col) = Cell::boolean(flag);
  } else {
    mutable_cell(row, col) = Cell::raw(raw_text);
  }
  ++edit_count_;
}

void EditBuffer::set_null(size_t row, const std::string& column) {
  size_t col = catalog_->column_index(column);
  check_row(row, column);
  mutable_cell(row, col) = Cell::null();
  ++edit_count_;
}

void EditBuffer::set_value(size_t row, const std::string& column, Cell value) {
  size_t col = catalog_->column_index(column);
  check_row(row, column);
  const Column& target = catalog_->column(col);
  if (!value.is_raw() && !value.matches(target.type)) {
    StudioError err(ErrorCode::SCHEMA_MISMATCH,
                    "value does not match column type " + target.type.to_string());
    err.column = column;
    err.row = row;
    throw StudioException(std::move(err));
  }
  mutable_cell(row, col) = std::move(value);
  ++edit_count_;
}

size_t EditBuffer::delete_rows(const std::set<size_t>& indices) {
  selection_.clear();

  bool any = false;
  for (size_t idx : indices) {
    if (idx < rows_.size()) {
      any = true;
      break;
    }
  }
  if (!any)
    return rows_.size();

  // Compact in place; the set iterates in ascending order
  std::vector<Row>& rows = rows_.to_mut();
  size_t write = 0;
  auto next_deleted = indices.begin();
  for (size_t read = 0; read < rows.size(); ++read) {
    while (next_deleted != indices.end() && *next_deleted < read)
      ++next_deleted;
    if (next_deleted != indices.end() && *next_deleted == read)
      continue;
    if (write != read)
      rows[write] = std::move(rows[read]);
    ++write;
  }
  rows.resize(write);
  ++edit_count_;
  return rows.size();
}

void EditBuffer::select(size_t row) {
  if (row < rows_.size())
    selection_.insert(row);
}

void EditBuffer::deselect(size_t row) { selection_.erase(row); }

void EditBuffer::toggle_selection(size_t row) {
  if (is_selected(row)) {
    deselect(row);
  } else {
    select(row);
  }
}

size_t EditBuffer::delete_selected() {
  std::set<size_t> doomed;
  doomed.swap(selection_);
  return delete_rows(doomed);
}

} // namespace pqstudio
