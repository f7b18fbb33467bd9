#include "pqstudio/commit_pipeline.h"

#include "pqstudio/value_parsers.h"

#include "BS_thread_pool.hpp"

#include <algorithm>
#include <future>
#include <thread>

namespace pqstudio {

namespace {

[[noreturn]] void throw_coercion(const Column& column, size_t row, const std::string& text,
                                 ParseStatus status) {
  throw StudioException(StudioError::at_cell(
      ErrorCode::TYPE_COERCION, column.name, row, text,
      "cannot convert to " + column.type.to_string() + ": " + parse_status_reason(status)));
}

// Convert edited text to the column type. Empty text means Null for every
// type except STRING and BINARY, where it is a legitimate value.
Cell coerce_text(const std::string& text, const Column& column, size_t row) {
  const LogicalType& type = column.type;
  if (type.id == TypeId::STRING)
    return Cell::string(text);
  if (type.id == TypeId::BINARY)
    return Cell::binary(text);
  if (trim_ascii(text).empty())
    return Cell::null();

  ParseStatus status = ParseStatus::INVALID;
  switch (type.id) {
  case TypeId::BOOL: {
    bool v = false;
    if ((status = parse_bool(text, v)) == ParseStatus::OK)
      return Cell::boolean(v);
    break;
  }
  case TypeId::INT32: {
    int32_t v = 0;
    if ((status = parse_int32(text, v)) == ParseStatus::OK)
      return Cell::int32(v);
    break;
  }
  case TypeId::INT64: {
    int64_t v = 0;
    if ((status = parse_int64(text, v)) == ParseStatus::OK)
      return Cell::int64(v);
    break;
  }
  case TypeId::FLOAT32: {
    float v = 0;
    if ((status = parse_float32(text, v)) == ParseStatus::OK)
      return Cell::float32(v);
    break;
  }
  case TypeId::FLOAT64: {
    double v = 0;
    if ((status = parse_float64(text, v)) == ParseStatus::OK)
      return Cell::float64(v);
    break;
  }
  case TypeId::DATE: {
    int32_t days = 0;
    if ((status = parse_date(text, days)) == ParseStatus::OK)
      return Cell::date(days);
    break;
  }
  case TypeId::TIMESTAMP: {
    int64_t ticks = 0;
    if ((status = parse_timestamp(text, type.unit, type.adjusted_to_utc, ticks)) ==
        ParseStatus::OK)
      return Cell::timestamp(ticks, type.unit);
    break;
  }
  case TypeId::DECIMAL: {
    Int128 unscaled = 0;
    if ((status = parse_decimal(text, type.precision, type.scale, unscaled)) == ParseStatus::OK)
      return Cell::decimal(unscaled, type.precision, type.scale);
    break;
  }
  default:
    break;
  }
  throw_coercion(column, row, text, status);
}

} // namespace

Cell CommitPipeline::coerce_cell(const Cell& cell, const Column& column, size_t row) {
  Cell resolved;
  if (cell.is_raw()) {
    resolved = coerce_text(cell.get<RawEdit>().text, column, row);
  } else if (cell.is_null() || cell.matches(column.type)) {
    resolved = cell;
  } else {
    throw StudioException(StudioError::at_cell(
        ErrorCode::SCHEMA_MISMATCH, column.name, row, cell.to_string(),
        "typed value does not match column type " + column.type.to_string()));
  }

  if (resolved.is_null() && !column.nullable) {
    std::optional<std::string> input;
    if (cell.is_raw())
      input = cell.get<RawEdit>().text;
    throw StudioException(StudioError::at_cell(ErrorCode::NULLABILITY_VIOLATION, column.name, row,
                                               std::move(input),
                                               "null value in a non-nullable column"));
  }
  return resolved;
}

std::unique_ptr<ColumnVector> CommitPipeline::build_column(const Snapshot& snapshot, size_t col) {
  const Column& column = snapshot.catalog().column(col);
  const auto& rows = snapshot.rows();

  auto vec = ColumnVector::create(column.type);
  vec->reserve(rows.size());
  for (size_t r = 0; r < rows.size(); ++r) {
    const Cell& cell = rows[r][col];
    // Fast path: cells loaded from the file are already typed
    if (cell.is_null() && column.nullable) {
      vec->append_null();
    } else if (!cell.is_raw() && !cell.is_null() && cell.matches(column.type)) {
      vec->append(cell);
    } else {
      vec->append(coerce_cell(cell, column, r));
    }
  }
  return vec;
}

std::shared_ptr<ColumnarTable> CommitPipeline::run(const Snapshot& snapshot) const {
  const SchemaCatalog& catalog = snapshot.catalog();
  const size_t n_cols = catalog.size();
  std::vector<std::unique_ptr<ColumnVector>> columns(n_cols);

  size_t num_threads = options_.num_threads;
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0)
      num_threads = 4;
  }
  num_threads = std::min(num_threads, n_cols);

  auto report = [this, n_cols](size_t done) {
    return !options_.progress || options_.progress(done, n_cols);
  };
  auto cancelled = []() {
    return StudioException(ErrorCode::CANCELLED, "commit cancelled by caller");
  };

  if (num_threads <= 1) {
    for (size_t i = 0; i < n_cols; ++i) {
      columns[i] = build_column(snapshot, i);
      if (!report(i + 1))
        throw cancelled();
    }
  } else {
    // Futures are consumed in column order, so the first exception rethrown is
    // the one from the lowest failing column whatever order tasks finished in.
    std::vector<std::future<std::unique_ptr<ColumnVector>>> futures;
    futures.reserve(n_cols);
    BS::thread_pool pool(num_threads);

    for (size_t i = 0; i < n_cols; ++i) {
      futures.push_back(pool.submit_task([&snapshot, i]() { return build_column(snapshot, i); }));
    }

    for (size_t i = 0; i < n_cols; ++i) {
      try {
        columns[i] = futures[i].get();
      } catch (...) {
        pool.purge();
        throw;
      }
      if (!report(i + 1)) {
        pool.purge();
        throw cancelled();
      }
    }
  }

  std::vector<FieldDescriptor> fields;
  fields.reserve(n_cols);
  for (const auto& column : catalog.columns()) {
    fields.push_back(FieldDescriptor::from_column(column));
  }
  return std::make_shared<ColumnarTable>(std::move(fields), std::move(columns),
                                         snapshot.row_count());
}

} // namespace pqstudio
