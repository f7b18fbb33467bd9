#include "pqstudio/load_pipeline.h"

#include "pqstudio/value_parsers.h"

#include <algorithm>

namespace pqstudio {

void LoadPipeline::validate(const ColumnarTable& table, const SchemaCatalog& catalog) const {
  for (size_t i = 0; i < catalog.size(); ++i) {
    const Column& col = catalog.column(i);
    const ColumnVector* vec = table.column(i);
    if (vec == nullptr) {
      StudioError err(ErrorCode::DECODE_ERROR, "decoded table has no values for this field");
      err.column = col.name;
      throw StudioException(std::move(err));
    }
    if (vec->type() != col.type) {
      StudioError err(ErrorCode::SCHEMA_MISMATCH, "column vector has type " +
                                                      vec->type().to_string() +
                                                      " but the field declares " +
                                                      col.type.to_string());
      err.column = col.name;
      throw StudioException(std::move(err));
    }
    if (vec->size() != table.num_rows()) {
      StudioError err(ErrorCode::SCHEMA_MISMATCH,
                      "column vector has " + std::to_string(vec->size()) +
                          " values but the table has " + std::to_string(table.num_rows()) +
                          " rows");
      err.column = col.name;
      throw StudioException(std::move(err));
    }
    if (col.type.id == TypeId::DECIMAL) {
      const auto& decimals = static_cast<const DecimalColumnVector&>(*vec);
      for (size_t r = 0; r < decimals.size(); ++r) {
        if (decimals.is_null(r) || decimal_fits(decimals.value(r), col.type.precision))
          continue;
        throw StudioException(StudioError::at_cell(
            ErrorCode::SCHEMA_MISMATCH, col.name, r,
            format_decimal(decimals.value(r), col.type.scale),
            "value has more digits than " + col.type.to_string() + " allows"));
      }
    }
  }
}

std::optional<LoadResult> LoadPipeline::run(const ColumnarTable& table) const {
  auto catalog = std::make_shared<const SchemaCatalog>(SchemaCatalog::from_source_table(table));
  validate(table, *catalog);

  size_t n_rows = table.num_rows();
  if (options_.max_rows > 0)
    n_rows = std::min(n_rows, options_.max_rows);
  const size_t n_cols = catalog->size();
  const size_t interval = std::max<size_t>(options_.progress_interval, 1);

  LoadResult result;
  result.catalog = catalog;
  result.rows.reserve(n_rows);

  for (size_t r = 0; r < n_rows; ++r) {
    if (options_.progress && r % interval == 0 && !options_.progress(r, n_rows))
      return std::nullopt;

    Row row;
    row.reserve(n_cols);
    for (size_t c = 0; c < n_cols; ++c) {
      row.push_back(table.column(c)->cell_at(r));
    }
    result.rows.push_back(std::move(row));
  }

  if (options_.progress && !options_.progress(n_rows, n_rows))
    return std::nullopt;

  return result;
}

} // namespace pqstudio
