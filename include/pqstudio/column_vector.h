#pragma once

#include "column_buffers.h"
#include "cell.h"
#include "types.h"

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace pqstudio {

// Statistics for a column chunk
struct ColumnStatistics {
  int64_t null_count = 0;

  // Min/max in the column's physical representation. Left empty for types
  // whose sort order the writer does not track (BOOL, BINARY, DECIMAL) and
  // for columns with no non-NaN values.
  std::variant<std::monostate, int32_t, int64_t, float, double, std::string> min_value;
  std::variant<std::monostate, int32_t, int64_t, float, double, std::string> max_value;

  bool has_min_max() const { return !std::holds_alternative<std::monostate>(min_value); }
};

// Typed column storage: contiguous values plus a validity bitmap. A null
// slot still occupies a default value so row positions line up.
class ColumnVector {
public:
  virtual ~ColumnVector() = default;

  virtual const LogicalType& type() const = 0;
  virtual size_t size() const = 0;
  virtual void reserve(size_t capacity) = 0;

  virtual void append_null() = 0;

  // Append a typed cell. Null is accepted; any value that does not match
  // type() throws StudioException(SCHEMA_MISMATCH).
  virtual void append(const Cell& cell) = 0;

  // Materialize one value as a Cell of this column's type (or Null)
  virtual Cell cell_at(size_t row) const = 0;

  virtual const NullBitmap& null_bitmap() const = 0;

  size_t null_count() const { return null_bitmap().null_count(); }
  bool is_null(size_t row) const { return null_bitmap().is_null(row); }

  // Statistics over rows [begin, end), as written per row group
  virtual ColumnStatistics statistics(size_t begin, size_t end) const;
  ColumnStatistics statistics() const { return statistics(0, size()); }

  // Factory methods
  static std::unique_ptr<ColumnVector> create(const LogicalType& type);
};

// Fixed-width column. Storage type per logical type:
//   BOOL -> uint8_t, INT32/DATE -> int32_t, INT64/TIMESTAMP -> int64_t,
//   FLOAT32 -> float, FLOAT64 -> double, DECIMAL -> Int128 (unscaled)
template <typename T> class FixedWidthColumnVector : public ColumnVector {
public:
  explicit FixedWidthColumnVector(const LogicalType& type) : type_(type) {}

  const LogicalType& type() const override { return type_; }
  size_t size() const override { return values_.size(); }

  void reserve(size_t capacity) override {
    values_.reserve(capacity);
    nulls_.reserve(capacity);
  }

  PQSTUDIO_FORCE_INLINE void append_value(T value) {
    values_.push_back(value);
    nulls_.push_back_valid();
  }

  void append_null() override {
    values_.push_back(T{});
    nulls_.push_back_null();
  }

  void append(const Cell& cell) override;
  Cell cell_at(size_t row) const override;

  const NullBitmap& null_bitmap() const override { return nulls_; }
  using ColumnVector::statistics;
  ColumnStatistics statistics(size_t begin, size_t end) const override;

  // Direct access for encoding
  const NumericBuffer<T>& values() const { return values_; }
  T value(size_t row) const { return values_.get(row); }

private:
  LogicalType type_;
  NumericBuffer<T> values_;
  NullBitmap nulls_;
};

using BoolColumnVector = FixedWidthColumnVector<uint8_t>; // uint8 avoids vector<bool>
using Int32ColumnVector = FixedWidthColumnVector<int32_t>;
using Int64ColumnVector = FixedWidthColumnVector<int64_t>;
using Float32ColumnVector = FixedWidthColumnVector<float>;
using Float64ColumnVector = FixedWidthColumnVector<double>;
using DecimalColumnVector = FixedWidthColumnVector<Int128>;

extern template class FixedWidthColumnVector<uint8_t>;
extern template class FixedWidthColumnVector<int32_t>;
extern template class FixedWidthColumnVector<int64_t>;
extern template class FixedWidthColumnVector<float>;
extern template class FixedWidthColumnVector<double>;
extern template class FixedWidthColumnVector<Int128>;

// Variable-length column for STRING and BINARY
class ByteArrayColumnVector : public ColumnVector {
public:
  explicit ByteArrayColumnVector(const LogicalType& type) : type_(type) {}

  const LogicalType& type() const override { return type_; }
  size_t size() const override { return values_.size(); }

  void reserve(size_t capacity) override {
    values_.reserve(capacity);
    nulls_.reserve(capacity);
  }

  void append_value(std::string_view value) {
    values_.push_back(value);
    nulls_.push_back_valid();
  }

  void append_null() override {
    values_.push_back_empty();
    nulls_.push_back_null();
  }

  void append(const Cell& cell) override;
  Cell cell_at(size_t row) const override;

  const NullBitmap& null_bitmap() const override { return nulls_; }
  using ColumnVector::statistics;
  ColumnStatistics statistics(size_t begin, size_t end) const override;

  const StringBuffer& values() const { return values_; }
  std::string_view value(size_t row) const { return values_.get(row); }

private:
  LogicalType type_;
  StringBuffer values_;
  NullBitmap nulls_;
};

} // namespace pqstudio
