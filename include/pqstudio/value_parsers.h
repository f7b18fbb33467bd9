#pragma once

#include "types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace pqstudio {

// Outcome of converting text to a typed value
enum class ParseStatus : uint8_t {
  OK = 0,
  EMPTY,          // Input is empty or whitespace only
  INVALID,        // Input is not in the accepted syntax
  NOT_INTEGER,    // Numeric but has a fractional part or exponent
  OUT_OF_RANGE,   // Syntax is valid but the value does not fit the type
  PRECISION_LOSS, // Value has more fractional digits than the type can hold
  ZONE_NOT_ALLOWED // Time-zone suffix on a timestamp column that is not UTC-adjusted
};

// Short human-readable explanation of a non-OK status
const char* parse_status_reason(ParseStatus status);

// Strip leading and trailing ASCII whitespace
std::string_view trim_ascii(std::string_view value);

// Parsers accept surrounding whitespace. A leading '+' is allowed on numbers.

// true/false/t/f/yes/no/y/n/1/0, ASCII case-insensitive
ParseStatus parse_bool(std::string_view value, bool& out);

ParseStatus parse_int32(std::string_view value, int32_t& out);
ParseStatus parse_int64(std::string_view value, int64_t& out);

// Accepts decimal and scientific notation, "nan", "inf" and "infinity"
ParseStatus parse_float32(std::string_view value, float& out);
ParseStatus parse_float64(std::string_view value, double& out);

// YYYY-MM-DD with year 0001..9999, to days since 1970-01-01
ParseStatus parse_date(std::string_view value, int32_t& days_since_epoch);

// YYYY-MM-DD[(T| )HH:MM:SS[.f{1,9}]][Z|(+|-)HH[:MM]] to ticks of `unit` since the
// epoch. Fractional digits beyond the unit's resolution must be zero. A zone
// suffix is only accepted when adjusted_to_utc is set and is then applied.
ParseStatus parse_timestamp(std::string_view value, TimeUnit unit, bool adjusted_to_utc,
                            int64_t& out);

// [+|-]digits[.digits] converted exactly to an unscaled integer with the given
// scale. Fractional digits beyond the scale must be zero.
ParseStatus parse_decimal(std::string_view value, uint8_t precision, uint8_t scale,
                          Int128& unscaled);

// Canonical text forms, accepted back by the parsers above
std::string format_date(int32_t days_since_epoch);
std::string format_timestamp(int64_t value, TimeUnit unit, bool adjusted_to_utc);
std::string format_decimal(Int128 unscaled, uint8_t scale);
std::string format_int128(Int128 value);
std::string format_float64(double value); // shortest round-trip form
std::string format_float32(float value);

// Number of decimal digits in |value| (0 has one digit)
int decimal_digits(Int128 value);

// True when `unscaled` has no more digits than `precision` allows
inline bool decimal_fits(Int128 unscaled, uint8_t precision) {
  return decimal_digits(unscaled) <= precision;
}

} // namespace pqstudio
