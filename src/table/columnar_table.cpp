#include "pqstudio/columnar_table.h"

namespace pqstudio {

ColumnarTable::ColumnarTable(std::vector<FieldDescriptor> fields,
                             std::vector<std::unique_ptr<ColumnVector>> columns, size_t num_rows)
    : fields_(std::move(fields)), columns_(std::move(columns)), num_rows_(num_rows) {
  if (columns_.size() != fields_.size()) {
    throw StudioException(ErrorCode::DECODE_ERROR,
                          "table has " + std::to_string(fields_.size()) + " fields but " +
                              std::to_string(columns_.size()) + " columns");
  }
}

std::vector<std::string> ColumnarTable::column_names() const {
  std::vector<std::string> names;
  names.reserve(fields_.size());
  for (const auto& f : fields_) {
    names.push_back(f.name);
  }
  return names;
}

std::optional<size_t> ColumnarTable::find_column(const std::string& name) const {
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name == name)
      return i;
  }
  return std::nullopt;
}

} // namespace pqstudio
