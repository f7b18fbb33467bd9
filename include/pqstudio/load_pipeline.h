#pragma once

#include "cell.h"
#include "columnar_table.h"
#include "options.h"
#include "schema_catalog.h"

#include <memory>
#include <optional>
#include <vector>

namespace pqstudio {

// Output of a load: the generation's catalog and its materialized rows
struct LoadResult {
  std::shared_ptr<const SchemaCatalog> catalog;
  std::vector<Row> rows;
};

/**
 * @brief Converts a decoded columnar table into catalog + rows.
 *
 * Stops at the first problem:
 * - UNSUPPORTED_TYPE when a field has no LogicalType
 * - DECODE_ERROR when the table handle is structurally broken
 * - SCHEMA_MISMATCH when a vector disagrees with its field or the row count
 *
 * A load abandoned through the progress callback returns std::nullopt.
 */
class LoadPipeline {
public:
  explicit LoadPipeline(LoadOptions options = {}) : options_(std::move(options)) {}

  std::optional<LoadResult> run(const ColumnarTable& table) const;

private:
  void validate(const ColumnarTable& table, const SchemaCatalog& catalog) const;

  LoadOptions options_;
};

} // namespace pqstudio
