#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#ifdef _MSC_VER
#define PQSTUDIO_FORCE_INLINE __forceinline
#define PQSTUDIO_LIKELY(x) (x)
#else
#define PQSTUDIO_FORCE_INLINE __attribute__((always_inline)) inline
#define PQSTUDIO_LIKELY(x) __builtin_expect(!!(x), 1)
#endif

namespace pqstudio {

/**
 * @brief Validity of each slot of a column vector, one bit per row.
 *
 * A set bit marks a present value. Nothing is allocated while every row is
 * present; the first null materializes the bitmap with all earlier rows set.
 * This maps directly onto Parquet definition levels (0 = null, 1 = value).
 */
class NullBitmap {
public:
  PQSTUDIO_FORCE_INLINE void push_back(bool valid) {
    if (PQSTUDIO_LIKELY(valid))
      push_back_valid();
    else
      push_back_null();
  }

  PQSTUDIO_FORCE_INLINE void push_back_valid() {
    if (!bits_.empty() || nulls_ > 0)
      set_bit(rows_, true);
    ++rows_;
  }

  void push_back_null() {
    if (nulls_ == 0)
      bits_.assign((rows_ + 7) / 8, 0xFF);
    set_bit(rows_, false);
    ++rows_;
    ++nulls_;
  }

  bool is_valid(size_t row) const {
    return nulls_ == 0 || (bits_[row / 8] >> (row % 8)) & 1;
  }
  bool is_null(size_t row) const { return !is_valid(row); }

  size_t size() const { return rows_; }
  size_t null_count() const { return nulls_; }
  bool has_nulls() const { return nulls_ > 0; }

  void reserve(size_t rows) {
    if (nulls_ > 0)
      bits_.reserve((rows + 7) / 8);
  }

private:
  void set_bit(size_t row, bool valid) {
    if (row / 8 >= bits_.size())
      bits_.push_back(0);
    uint8_t mask = static_cast<uint8_t>(1u << (row % 8));
    if (valid)
      bits_[row / 8] |= mask;
    else
      bits_[row / 8] &= static_cast<uint8_t>(~mask);
  }

  std::vector<uint8_t> bits_;
  size_t rows_ = 0;
  size_t nulls_ = 0;
};

// STRING and BINARY values packed end to end. Value i spans
// [offsets[i], offsets[i + 1]); a null slot is an empty span.
class StringBuffer {
public:
  StringBuffer() : offsets_{0} {}

  void reserve(size_t values, size_t total_bytes = 0) {
    offsets_.reserve(values + 1);
    if (total_bytes > 0)
      bytes_.reserve(total_bytes);
  }

  void push_back(std::string_view value) {
    bytes_.insert(bytes_.end(), value.begin(), value.end());
    offsets_.push_back(bytes_.size());
  }

  void push_back_empty() { offsets_.push_back(bytes_.size()); }

  std::string_view get(size_t idx) const {
    return std::string_view(bytes_.data() + offsets_[idx], offsets_[idx + 1] - offsets_[idx]);
  }

  size_t size() const { return offsets_.size() - 1; }

private:
  std::vector<char> bytes_;
  std::vector<uint64_t> offsets_;
};

// Fixed-width values in row order, null slots holding T{}
template <typename T> class NumericBuffer {
public:
  void reserve(size_t n) { values_.reserve(n); }
  PQSTUDIO_FORCE_INLINE void push_back(T value) { values_.push_back(value); }

  T get(size_t idx) const { return values_[idx]; }
  const T* data() const { return values_.data(); }
  size_t size() const { return values_.size(); }

private:
  std::vector<T> values_;
};

} // namespace pqstudio
