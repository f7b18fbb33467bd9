#pragma once

#include "types.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pqstudio {

// Calendar date as days since 1970-01-01
struct Date {
  int32_t days = 0;
  bool operator==(const Date& o) const { return days == o.days; }
};

// Instant as an offset from the Unix epoch in the given unit
struct Timestamp {
  int64_t value = 0;
  TimeUnit unit = TimeUnit::MICROS;
  bool operator==(const Timestamp& o) const { return value == o.value && unit == o.unit; }
};

// Exact decimal: value = unscaled * 10^-scale
struct Decimal {
  Int128 unscaled = 0;
  uint8_t precision = 0;
  uint8_t scale = 0;
  bool operator==(const Decimal& o) const {
    return unscaled == o.unscaled && precision == o.precision && scale == o.scale;
  }
};

// Opaque byte string
struct Binary {
  std::string bytes;
  bool operator==(const Binary& o) const { return bytes == o.bytes; }
};

// Text entered by the user that has not been converted to the column type yet
struct RawEdit {
  std::string text;
  bool operator==(const RawEdit& o) const { return text == o.text; }
};

/**
 * @brief A single value in a row: null, a typed value, or a pending raw edit.
 *
 * Cells produced by loading always hold a value matching their column's type
 * or Null. Editing may store a RawEdit that is resolved at commit time.
 *
 * Construct cells through the named factories; there are no converting
 * constructors so that a string literal never silently becomes a bool.
 */
class Cell {
public:
  using Storage = std::variant<std::monostate, bool, int32_t, int64_t, float, double, std::string,
                               Binary, Date, Timestamp, Decimal, RawEdit>;

  Cell() = default;

  static Cell null() { return Cell(); }
  static Cell boolean(bool v) { return Cell(Storage(std::in_place_type<bool>, v)); }
  static Cell int32(int32_t v) { return Cell(Storage(std::in_place_type<int32_t>, v)); }
  static Cell int64(int64_t v) { return Cell(Storage(std::in_place_type<int64_t>, v)); }
  static Cell float32(float v) { return Cell(Storage(std::in_place_type<float>, v)); }
  static Cell float64(double v) { return Cell(Storage(std::in_place_type<double>, v)); }
  static Cell string(std::string v) {
    return Cell(Storage(std::in_place_type<std::string>, std::move(v)));
  }
  static Cell binary(std::string bytes) {
    return Cell(Storage(std::in_place_type<Binary>, Binary{std::move(bytes)}));
  }
  static Cell date(int32_t days) { return Cell(Storage(std::in_place_type<Date>, Date{days})); }
  static Cell timestamp(int64_t value, TimeUnit unit) {
    return Cell(Storage(std::in_place_type<Timestamp>, Timestamp{value, unit}));
  }
  static Cell decimal(Int128 unscaled, uint8_t precision, uint8_t scale) {
    return Cell(Storage(std::in_place_type<Decimal>, Decimal{unscaled, precision, scale}));
  }
  static Cell raw(std::string text) {
    return Cell(Storage(std::in_place_type<RawEdit>, RawEdit{std::move(text)}));
  }

  bool is_null() const { return std::holds_alternative<std::monostate>(value_); }
  bool is_raw() const { return std::holds_alternative<RawEdit>(value_); }

  template <typename T> bool holds() const { return std::holds_alternative<T>(value_); }

  // Throws std::bad_variant_access when the cell holds another alternative
  template <typename T> const T& get() const { return std::get<T>(value_); }

  const Storage& value() const { return value_; }

  // True when the cell is Null or holds a typed value of exactly this type
  // (same unit for timestamps, same precision and scale for decimals, whose
  // unscaled value must also fit the precision). RawEdit never matches.
  bool matches(const LogicalType& type) const;

  // Canonical text form used for display and export. Null yields "".
  // Binary is rendered as base64, RawEdit as its pending text.
  std::string to_string() const;

  bool operator==(const Cell& other) const;
  bool operator!=(const Cell& other) const { return !(*this == other); }

private:
  explicit Cell(Storage value) : value_(std::move(value)) {}

  Storage value_;
};

// One record, positionally aligned with the catalog's columns
using Row = std::vector<Cell>;

// Encode bytes as standard base64 with padding
std::string base64_encode(std::string_view bytes);

} // namespace pqstudio
