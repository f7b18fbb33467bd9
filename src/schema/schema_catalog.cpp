#include "pqstudio/schema_catalog.h"

#include <sstream>
#include <unordered_set>

namespace pqstudio {

SchemaCatalog::SchemaCatalog(std::vector<Column> columns) : columns_(std::move(columns)) {
  std::unordered_set<std::string> seen;
  for (const auto& col : columns_) {
    if (!seen.insert(col.name).second) {
      throw StudioException(ErrorCode::SCHEMA_MISMATCH, "duplicate column name '" + col.name + "'");
    }
    if (col.type.id == TypeId::DECIMAL &&
        (col.type.precision < 1 || col.type.precision > MAX_DECIMAL_PRECISION ||
         col.type.scale > col.type.precision)) {
      throw StudioException(ErrorCode::SCHEMA_MISMATCH,
                            "column '" + col.name + "' has invalid " + col.type.to_string());
    }
  }
}

SchemaCatalog SchemaCatalog::from_source_table(const ColumnarTable& table) {
  std::vector<Column> columns;
  columns.reserve(table.num_columns());

  for (const auto& field : table.fields()) {
    if (!field.type.has_value()) {
      StudioError err(ErrorCode::UNSUPPORTED_TYPE,
                      "field type " + field.source_type + " has no supported logical type");
      err.column = field.name;
      throw StudioException(std::move(err));
    }
    columns.push_back(Column{field.name, *field.type, field.nullable});
  }

  return SchemaCatalog(std::move(columns));
}

std::vector<std::string> SchemaCatalog::column_names() const {
  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const auto& col : columns_) {
    names.push_back(col.name);
  }
  return names;
}

size_t SchemaCatalog::column_index(const std::string& name) const {
  if (auto idx = find_column(name))
    return *idx;
  StudioError err(ErrorCode::UNKNOWN_COLUMN, "no column named '" + name + "'");
  err.column = name;
  throw StudioException(std::move(err));
}

std::optional<size_t> SchemaCatalog::find_column(const std::string& name) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name == name)
      return i;
  }
  return std::nullopt;
}

SchemaCatalog SchemaCatalog::without_column(const std::string& name) const {
  size_t idx = column_index(name);
  std::vector<Column> columns = columns_;
  columns.erase(columns.begin() + static_cast<std::ptrdiff_t>(idx));
  return SchemaCatalog(std::move(columns));
}

std::string SchemaCatalog::to_string() const {
  std::ostringstream ss;
  for (const auto& col : columns_) {
    ss << col.name << ": " << col.type.to_string();
    if (!col.nullable)
      ss << " NOT NULL";
    ss << "\n";
  }
  return ss.str();
}

} // namespace pqstudio
