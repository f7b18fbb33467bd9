#pragma once

#include "columnar_table.h"
#include "types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pqstudio {

/**
 * @brief Ordered, uniquely named, immutable list of columns.
 *
 * A catalog is derived once per load and shared read-only by every pipeline
 * through std::shared_ptr<const SchemaCatalog>. Operations that would change
 * the shape of a table return a new catalog instead of mutating this one.
 */
class SchemaCatalog {
public:
  SchemaCatalog() = default;

  /**
   * @brief Build a catalog from an explicit column list.
   *
   * @throws StudioException SCHEMA_MISMATCH on duplicate names or an invalid
   *         decimal precision/scale
   */
  explicit SchemaCatalog(std::vector<Column> columns);

  /**
   * @brief Derive the catalog of a decoded table.
   *
   * Field types are taken as declared; nothing is inferred from values.
   *
   * @throws StudioException UNSUPPORTED_TYPE naming the first field whose
   *         source type has no LogicalType counterpart
   */
  static SchemaCatalog from_source_table(const ColumnarTable& table);

  size_t size() const { return columns_.size(); }
  bool empty() const { return columns_.empty(); }

  const Column& column(size_t i) const { return columns_.at(i); }
  const std::vector<Column>& columns() const { return columns_; }
  std::vector<std::string> column_names() const;

  /**
   * @brief Position of a column by name.
   *
   * @throws StudioException UNKNOWN_COLUMN
   */
  size_t column_index(const std::string& name) const;

  std::optional<size_t> find_column(const std::string& name) const;

  // New catalog without the named column (throws UNKNOWN_COLUMN)
  SchemaCatalog without_column(const std::string& name) const;

  bool operator==(const SchemaCatalog& other) const { return columns_ == other.columns_; }
  bool operator!=(const SchemaCatalog& other) const { return !(*this == other); }

  // One line per column: "name: TYPE [NOT NULL]"
  std::string to_string() const;

private:
  std::vector<Column> columns_;
};

} // namespace pqstudio
