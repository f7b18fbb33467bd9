#pragma once

#include "error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pqstudio {

// 128-bit signed integer backing DECIMAL values (precision up to 38 digits)
__extension__ typedef __int128 Int128;

// Maximum decimal precision representable by Int128
constexpr uint8_t MAX_DECIMAL_PRECISION = 38;

// The closed set of value types the engine understands. Anything a codec
// reports outside this set is rejected at load time.
enum class TypeId : uint8_t {
  BOOL = 0,
  INT32 = 1,
  INT64 = 2,
  FLOAT32 = 3,
  FLOAT64 = 4,
  STRING = 5,    // UTF-8 text
  BINARY = 6,    // Opaque bytes
  DATE = 7,      // Days since 1970-01-01
  TIMESTAMP = 8, // Offset from the Unix epoch in TimeUnit
  DECIMAL = 9    // Exact base-10 number with precision and scale
};

enum class TimeUnit : uint8_t { MILLIS = 0, MICROS = 1, NANOS = 2 };

inline const char* type_name(TypeId id) {
  switch (id) {
  case TypeId::BOOL:
    return "BOOL";
  case TypeId::INT32:
    return "INT32";
  case TypeId::INT64:
    return "INT64";
  case TypeId::FLOAT32:
    return "FLOAT32";
  case TypeId::FLOAT64:
    return "FLOAT64";
  case TypeId::STRING:
    return "STRING";
  case TypeId::BINARY:
    return "BINARY";
  case TypeId::DATE:
    return "DATE";
  case TypeId::TIMESTAMP:
    return "TIMESTAMP";
  case TypeId::DECIMAL:
    return "DECIMAL";
  default:
    return "INVALID";
  }
}

inline const char* time_unit_name(TimeUnit unit) {
  switch (unit) {
  case TimeUnit::MILLIS:
    return "MILLIS";
  case TimeUnit::MICROS:
    return "MICROS";
  case TimeUnit::NANOS:
    return "NANOS";
  default:
    return "?";
  }
}

// Number of fractional-second digits a unit can carry
inline int time_unit_digits(TimeUnit unit) {
  switch (unit) {
  case TimeUnit::MILLIS:
    return 3;
  case TimeUnit::MICROS:
    return 6;
  default:
    return 9;
  }
}

// Ticks per second for a unit
inline int64_t time_unit_per_second(TimeUnit unit) {
  switch (unit) {
  case TimeUnit::MILLIS:
    return 1000;
  case TimeUnit::MICROS:
    return 1000000;
  default:
    return 1000000000;
  }
}

/**
 * @brief A column's value type together with its parameters.
 *
 * TIMESTAMP carries a unit and a UTC-adjusted flag, DECIMAL carries precision
 * and scale. Parameters of other types are ignored by comparison.
 */
struct LogicalType {
  TypeId id = TypeId::STRING;
  TimeUnit unit = TimeUnit::MICROS;
  bool adjusted_to_utc = false;
  uint8_t precision = 0;
  uint8_t scale = 0;

  static LogicalType boolean() { return {TypeId::BOOL}; }
  static LogicalType int32() { return {TypeId::INT32}; }
  static LogicalType int64() { return {TypeId::INT64}; }
  static LogicalType float32() { return {TypeId::FLOAT32}; }
  static LogicalType float64() { return {TypeId::FLOAT64}; }
  static LogicalType string() { return {TypeId::STRING}; }
  static LogicalType binary() { return {TypeId::BINARY}; }
  static LogicalType date() { return {TypeId::DATE}; }

  static LogicalType timestamp(TimeUnit unit, bool adjusted_to_utc = false) {
    LogicalType t{TypeId::TIMESTAMP};
    t.unit = unit;
    t.adjusted_to_utc = adjusted_to_utc;
    return t;
  }

  static LogicalType decimal(uint8_t precision, uint8_t scale) {
    LogicalType t{TypeId::DECIMAL};
    t.precision = precision;
    t.scale = scale;
    return t;
  }

  // Human-readable form, e.g. "TIMESTAMP(MICROS, UTC)" or "DECIMAL(10, 2)"
  std::string to_string() const;

  bool operator==(const LogicalType& other) const {
    if (id != other.id)
      return false;
    if (id == TypeId::TIMESTAMP)
      return unit == other.unit && adjusted_to_utc == other.adjusted_to_utc;
    if (id == TypeId::DECIMAL)
      return precision == other.precision && scale == other.scale;
    return true;
  }
  bool operator!=(const LogicalType& other) const { return !(*this == other); }
};

// One column of a table schema
struct Column {
  std::string name;
  LogicalType type;
  bool nullable = true;

  bool operator==(const Column& other) const {
    return name == other.name && type == other.type && nullable == other.nullable;
  }
  bool operator!=(const Column& other) const { return !(*this == other); }
};

// Compression codec for Parquet
enum class Compression : uint8_t { NONE = 0, ZSTD = 1, SNAPPY = 2, LZ4 = 3, GZIP = 4 };

inline const char* compression_name(Compression c) {
  switch (c) {
  case Compression::NONE:
    return "none";
  case Compression::ZSTD:
    return "zstd";
  case Compression::SNAPPY:
    return "snappy";
  case Compression::LZ4:
    return "lz4";
  case Compression::GZIP:
    return "gzip";
  default:
    return "unknown";
  }
}

// Result type for operations that can fail
template <typename T> struct Result {
  T value;
  StudioError error;
  bool ok = true;

  static Result success(T&& val) { return {std::move(val), StudioError(), true}; }
  static Result success(const T& val) { return {val, StudioError(), true}; }
  static Result failure(StudioError err) { return {T{}, std::move(err), false}; }

  explicit operator bool() const { return ok; }
};

// Specialization for void result (operations that succeed or fail with no value)
template <> struct Result<void> {
  StudioError error;
  bool ok = true;

  static Result success() { return {StudioError(), true}; }
  static Result failure(StudioError err) { return {std::move(err), false}; }

  explicit operator bool() const { return ok; }
};

} // namespace pqstudio
