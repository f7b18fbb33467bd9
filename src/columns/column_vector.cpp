#include "pqstudio/column_vector.h"

#include <cmath>
#include <type_traits>

namespace pqstudio {

namespace {

[[noreturn]] void throw_mismatch(const LogicalType& type, const Cell& cell) {
  throw StudioException(ErrorCode::SCHEMA_MISMATCH,
                        "cell value '" + cell.to_string() + "' does not match column type " +
                            type.to_string());
}

} // namespace

std::unique_ptr<ColumnVector> ColumnVector::create(const LogicalType& type) {
  switch (type.id) {
  case TypeId::BOOL:
    return std::make_unique<BoolColumnVector>(type);
  case TypeId::INT32:
  case TypeId::DATE:
    return std::make_unique<Int32ColumnVector>(type);
  case TypeId::INT64:
  case TypeId::TIMESTAMP:
    return std::make_unique<Int64ColumnVector>(type);
  case TypeId::FLOAT32:
    return std::make_unique<Float32ColumnVector>(type);
  case TypeId::FLOAT64:
    return std::make_unique<Float64ColumnVector>(type);
  case TypeId::DECIMAL:
    return std::make_unique<DecimalColumnVector>(type);
  case TypeId::STRING:
  case TypeId::BINARY:
    return std::make_unique<ByteArrayColumnVector>(type);
  default:
    throw StudioException(ErrorCode::INTERNAL_ERROR,
                          "no column vector for type " + type.to_string());
  }
}

ColumnStatistics ColumnVector::statistics(size_t begin, size_t end) const {
  ColumnStatistics stats;
  const NullBitmap& nulls = null_bitmap();
  if (begin == 0 && end == size()) {
    stats.null_count = static_cast<int64_t>(nulls.null_count());
  } else if (nulls.has_nulls()) {
    for (size_t i = begin; i < end; ++i) {
      if (nulls.is_null(i))
        ++stats.null_count;
    }
  }
  return stats;
}

template <typename T> void FixedWidthColumnVector<T>::append(const Cell& cell) {
  if (cell.is_null()) {
    append_null();
    return;
  }
  if (!cell.matches(type_))
    throw_mismatch(type_, cell);

  if constexpr (std::is_same_v<T, uint8_t>) {
    append_value(cell.get<bool>() ? 1 : 0);
  } else if constexpr (std::is_same_v<T, int32_t>) {
    append_value(type_.id == TypeId::DATE ? cell.get<Date>().days : cell.get<int32_t>());
  } else if constexpr (std::is_same_v<T, int64_t>) {
    append_value(type_.id == TypeId::TIMESTAMP ? cell.get<Timestamp>().value
                                               : cell.get<int64_t>());
  } else if constexpr (std::is_same_v<T, Int128>) {
    append_value(cell.get<Decimal>().unscaled);
  } else {
    append_value(cell.get<T>());
  }
}

template <typename T> Cell FixedWidthColumnVector<T>::cell_at(size_t row) const {
  if (nulls_.is_null(row))
    return Cell::null();

  T v = values_.get(row);
  if constexpr (std::is_same_v<T, uint8_t>) {
    return Cell::boolean(v != 0);
  } else if constexpr (std::is_same_v<T, int32_t>) {
    return type_.id == TypeId::DATE ? Cell::date(v) : Cell::int32(v);
  } else if constexpr (std::is_same_v<T, int64_t>) {
    return type_.id == TypeId::TIMESTAMP ? Cell::timestamp(v, type_.unit) : Cell::int64(v);
  } else if constexpr (std::is_same_v<T, float>) {
    return Cell::float32(v);
  } else if constexpr (std::is_same_v<T, double>) {
    return Cell::float64(v);
  } else {
    return Cell::decimal(v, type_.precision, type_.scale);
  }
}

template <typename T>
ColumnStatistics FixedWidthColumnVector<T>::statistics(size_t begin, size_t end) const {
  ColumnStatistics stats = ColumnVector::statistics(begin, end);
  if constexpr (std::is_same_v<T, uint8_t> || std::is_same_v<T, Int128>) {
    return stats;
  } else {
    bool found = false;
    T min_v{}, max_v{};
    for (size_t i = begin; i < end; ++i) {
      if (nulls_.is_null(i))
        continue;
      T v = values_.get(i);
      if constexpr (std::is_floating_point_v<T>) {
        if (std::isnan(v))
          continue;
      }
      if (!found) {
        min_v = max_v = v;
        found = true;
      } else {
        if (v < min_v)
          min_v = v;
        if (v > max_v)
          max_v = v;
      }
    }
    if (found) {
      stats.min_value = min_v;
      stats.max_value = max_v;
    }
    return stats;
  }
}

template class FixedWidthColumnVector<uint8_t>;
template class FixedWidthColumnVector<int32_t>;
template class FixedWidthColumnVector<int64_t>;
template class FixedWidthColumnVector<float>;
template class FixedWidthColumnVector<double>;
template class FixedWidthColumnVector<Int128>;

void ByteArrayColumnVector::append(const Cell& cell) {
  if (cell.is_null()) {
    append_null();
    return;
  }
  if (!cell.matches(type_))
    throw_mismatch(type_, cell);

  if (type_.id == TypeId::STRING) {
    append_value(cell.get<std::string>());
  } else {
    append_value(cell.get<Binary>().bytes);
  }
}

Cell ByteArrayColumnVector::cell_at(size_t row) const {
  if (nulls_.is_null(row))
    return Cell::null();
  std::string_view v = values_.get(row);
  if (type_.id == TypeId::STRING)
    return Cell::string(std::string(v));
  return Cell::binary(std::string(v));
}

ColumnStatistics ByteArrayColumnVector::statistics(size_t begin, size_t end) const {
  ColumnStatistics stats = ColumnVector::statistics(begin, end);
  if (type_.id != TypeId::STRING)
    return stats;

  // std::string_view compares bytes as unsigned char, matching Parquet's
  // UTF8 sort order
  bool found = false;
  std::string_view min_v, max_v;
  for (size_t i = begin; i < end; ++i) {
    if (nulls_.is_null(i))
      continue;
    std::string_view v = values_.get(i);
    if (!found) {
      min_v = max_v = v;
      found = true;
    } else {
      if (v < min_v)
        min_v = v;
      if (v > max_v)
        max_v = v;
    }
  }
  if (found) {
    stats.min_value = std::string(min_v);
    stats.max_value = std::string(max_v);
  }
  return stats;
}

} // namespace pqstudio
