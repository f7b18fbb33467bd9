#pragma once

#include "column_vector.h"
#include "types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pqstudio {

// Field of a decoded table as reported by a codec. `type` is empty when the
// source type has no LogicalType counterpart; `source_type` then names it.
struct FieldDescriptor {
  std::string name;
  std::optional<LogicalType> type;
  std::string source_type;
  bool nullable = true;

  static FieldDescriptor from_column(const Column& column) {
    return {column.name, column.type, column.type.to_string(), column.nullable};
  }
};

// Column-oriented, immutable table: the boundary object between the engine
// and a codec. Columns with an unsupported field type are absent (nullptr).
class ColumnarTable {
public:
  ColumnarTable(std::vector<FieldDescriptor> fields,
                std::vector<std::unique_ptr<ColumnVector>> columns, size_t num_rows);

  ColumnarTable(const ColumnarTable&) = delete;
  ColumnarTable& operator=(const ColumnarTable&) = delete;

  size_t num_rows() const { return num_rows_; }
  size_t num_columns() const { return fields_.size(); }

  const std::vector<FieldDescriptor>& fields() const { return fields_; }
  const FieldDescriptor& field(size_t i) const { return fields_[i]; }

  // nullptr when the field's type is unsupported
  const ColumnVector* column(size_t i) const { return columns_[i].get(); }

  std::vector<std::string> column_names() const;

  // Field index by name, or std::nullopt
  std::optional<size_t> find_column(const std::string& name) const;

private:
  std::vector<FieldDescriptor> fields_;
  std::vector<std::unique_ptr<ColumnVector>> columns_;
  size_t num_rows_;
};

} // namespace pqstudio
