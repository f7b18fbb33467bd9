#include "pqstudio/value_parsers.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <fast_float/fast_float.h>

namespace pqstudio {

namespace {

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

inline char ascii_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (ascii_lower(a[i]) != b[i])
      return false;
  }
  return true;
}

// Neither std::from_chars nor fast_float accept a leading '+'
std::string_view strip_plus(std::string_view value) {
  if (value.size() > 1 && value[0] == '+' && value[1] != '+' && value[1] != '-')
    return value.substr(1);
  return value;
}

bool names_infinity(std::string_view value) {
  if (!value.empty() && value[0] == '-')
    value.remove_prefix(1);
  return iequals(value, "inf") || iequals(value, "infinity");
}

bool parse_two_digits(std::string_view value, size_t pos, int& out) {
  if (pos + 2 > value.size() || !is_digit(value[pos]) || !is_digit(value[pos + 1]))
    return false;
  out = (value[pos] - '0') * 10 + (value[pos + 1] - '0');
  return true;
}

inline bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

const int days_in_month[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

inline int get_days_in_month(int year, int month) {
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return days_in_month[month];
}

// Count leap years from year 1 through year Y-1
inline int leap_years_before(int year) {
  if (year <= 1)
    return 0;
  int y = year - 1;
  return y / 4 - y / 100 + y / 400;
}

// Days from 1970-01-01 to Y-01-01, closed form
inline int32_t days_from_epoch_to_year(int year) {
  // leap_years_before(1970) = 1969/4 - 1969/100 + 1969/400 = 492 - 19 + 4 = 477
  constexpr int LEAP_YEARS_BEFORE_1970 = 477;
  int leap_years_diff = leap_years_before(year) - LEAP_YEARS_BEFORE_1970;
  return static_cast<int32_t>(year - 1970) * 365 + leap_years_diff;
}

// Inverse of the above for any day count (proleptic Gregorian calendar)
void civil_from_days(int64_t z, int64_t& year, unsigned& month, unsigned& day) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  year = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year += (month <= 2);
}

std::string format_days(int64_t days) {
  int64_t year;
  unsigned month, day;
  civil_from_days(days, year, month, day);
  char buf[32];
  if (year >= 0) {
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(year), month, day);
  } else {
    std::snprintf(buf, sizeof(buf), "-%04lld-%02u-%02u", static_cast<long long>(-year), month,
                  day);
  }
  return buf;
}

// Zone suffix: Z, +HH, +HH:MM or +HHMM (and the '-' forms). Must consume the
// rest of the input.
bool parse_timezone(std::string_view value, size_t start_pos, int& offset_minutes) {
  char first = value[start_pos];
  if (first == 'Z') {
    offset_minutes = 0;
    return start_pos + 1 == value.size();
  }
  if (first != '+' && first != '-') {
    return false;
  }

  bool negative = (first == '-');
  size_t pos = start_pos + 1;

  int tz_hour = 0;
  if (!parse_two_digits(value, pos, tz_hour))
    return false;
  pos += 2;

  int tz_minute = 0;
  if (pos < value.size()) {
    if (value[pos] == ':') {
      pos++;
    }
    if (!parse_two_digits(value, pos, tz_minute))
      return false;
    pos += 2;
  }

  if (pos != value.size() || tz_hour > 14 || tz_minute > 59) {
    return false;
  }

  offset_minutes = tz_hour * 60 + tz_minute;
  if (negative) {
    offset_minutes = -offset_minutes;
  }
  return true;
}

template <typename T> ParseStatus parse_integer(std::string_view value, T& out) {
  value = trim_ascii(value);
  if (value.empty())
    return ParseStatus::EMPTY;

  std::string_view digits = strip_plus(value);
  const char* end = digits.data() + digits.size();
  T result{};
  auto [ptr, ec] = std::from_chars(digits.data(), end, result);
  if (ec == std::errc() && ptr == end) {
    out = result;
    return ParseStatus::OK;
  }
  if (ec == std::errc::result_out_of_range && ptr == end)
    return ParseStatus::OUT_OF_RANGE;

  // "12.5" and "1e3" are numbers, just not integers
  double as_float = 0;
  auto fr = fast_float::from_chars(digits.data(), end, as_float);
  if (fr.ec == std::errc() && fr.ptr == end && std::isfinite(as_float))
    return ParseStatus::NOT_INTEGER;
  return ParseStatus::INVALID;
}

template <typename T> ParseStatus parse_floating(std::string_view value, T& out) {
  value = trim_ascii(value);
  if (value.empty())
    return ParseStatus::EMPTY;

  std::string_view digits = strip_plus(value);
  const char* end = digits.data() + digits.size();
  T result{};
  auto answer = fast_float::from_chars(digits.data(), end, result);
  if (answer.ec != std::errc() && answer.ec != std::errc::result_out_of_range)
    return ParseStatus::INVALID;
  if (answer.ptr != end)
    return ParseStatus::INVALID;
  if (std::isinf(result) && !names_infinity(digits))
    return ParseStatus::OUT_OF_RANGE;
  out = result;
  return ParseStatus::OK;
}

template <typename T> std::string format_floating(T value) {
  if (std::isnan(value))
    return "NaN";
  if (std::isinf(value))
    return value < 0 ? "-inf" : "inf";
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  if (ec != std::errc())
    return std::string();
  return std::string(buf, ptr);
}

} // namespace

const char* parse_status_reason(ParseStatus status) {
  switch (status) {
  case ParseStatus::OK:
    return "ok";
  case ParseStatus::EMPTY:
    return "value is empty";
  case ParseStatus::INVALID:
    return "value is not in a recognized format";
  case ParseStatus::NOT_INTEGER:
    return "value is not an integer";
  case ParseStatus::OUT_OF_RANGE:
    return "value is out of range";
  case ParseStatus::PRECISION_LOSS:
    return "value has more fractional digits than the column allows";
  case ParseStatus::ZONE_NOT_ALLOWED:
    return "time zone offset given for a timestamp column that is not UTC-adjusted";
  default:
    return "unknown";
  }
}

std::string_view trim_ascii(std::string_view value) {
  auto is_space = [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
  };
  while (!value.empty() && is_space(value.front()))
    value.remove_prefix(1);
  while (!value.empty() && is_space(value.back()))
    value.remove_suffix(1);
  return value;
}

ParseStatus parse_bool(std::string_view value, bool& out) {
  value = trim_ascii(value);
  if (value.empty())
    return ParseStatus::EMPTY;

  static constexpr std::string_view true_values[] = {"true", "t", "yes", "y", "1"};
  static constexpr std::string_view false_values[] = {"false", "f", "no", "n", "0"};
  for (auto v : true_values) {
    if (iequals(value, v)) {
      out = true;
      return ParseStatus::OK;
    }
  }
  for (auto v : false_values) {
    if (iequals(value, v)) {
      out = false;
      return ParseStatus::OK;
    }
  }
  return ParseStatus::INVALID;
}

ParseStatus parse_int32(std::string_view value, int32_t& out) {
  return parse_integer(value, out);
}

ParseStatus parse_int64(std::string_view value, int64_t& out) {
  return parse_integer(value, out);
}

ParseStatus parse_float32(std::string_view value, float& out) {
  return parse_floating(value, out);
}

ParseStatus parse_float64(std::string_view value, double& out) {
  return parse_floating(value, out);
}

ParseStatus parse_date(std::string_view value, int32_t& days_since_epoch) {
  value = trim_ascii(value);
  if (value.empty())
    return ParseStatus::EMPTY;
  if (value.size() != 10 || value[4] != '-' || value[7] != '-')
    return ParseStatus::INVALID;

  int year = 0, month = 0, day = 0;
  for (int i = 0; i < 4; ++i) {
    if (!is_digit(value[i]))
      return ParseStatus::INVALID;
    year = year * 10 + (value[i] - '0');
  }
  if (!parse_two_digits(value, 5, month) || !parse_two_digits(value, 8, day))
    return ParseStatus::INVALID;

  if (month < 1 || month > 12)
    return ParseStatus::INVALID;
  if (day < 1 || day > get_days_in_month(year, month))
    return ParseStatus::INVALID;
  if (year < 1)
    return ParseStatus::OUT_OF_RANGE;

  int32_t days = days_from_epoch_to_year(year);
  for (int m = 1; m < month; ++m) {
    days += get_days_in_month(year, m);
  }
  days += day - 1;

  days_since_epoch = days;
  return ParseStatus::OK;
}

ParseStatus parse_timestamp(std::string_view value, TimeUnit unit, bool adjusted_to_utc,
                            int64_t& out) {
  value = trim_ascii(value);
  if (value.empty())
    return ParseStatus::EMPTY;
  if (value.size() < 10)
    return ParseStatus::INVALID;

  int32_t days = 0;
  ParseStatus date_status = parse_date(value.substr(0, 10), days);
  if (date_status != ParseStatus::OK)
    return date_status;

  int hour = 0, minute = 0, second = 0;
  int64_t frac_ticks = 0;
  size_t pos = 10;

  if (pos < value.size() && (value[pos] == 'T' || value[pos] == ' ')) {
    if (value.size() < 19 || value[13] != ':' || value[16] != ':')
      return ParseStatus::INVALID;
    if (!parse_two_digits(value, 11, hour) || !parse_two_digits(value, 14, minute) ||
        !parse_two_digits(value, 17, second))
      return ParseStatus::INVALID;
    if (hour > 23 || minute > 59 || second > 59)
      return ParseStatus::INVALID;
    pos = 19;

    if (pos < value.size() && value[pos] == '.') {
      size_t frac_start = ++pos;
      while (pos < value.size() && is_digit(value[pos]))
        ++pos;
      size_t n_digits = pos - frac_start;
      if (n_digits == 0 || n_digits > 9)
        return ParseStatus::INVALID;

      const size_t unit_digits = static_cast<size_t>(time_unit_digits(unit));
      for (size_t i = 0; i < n_digits; ++i) {
        int d = value[frac_start + i] - '0';
        if (i < unit_digits) {
          frac_ticks = frac_ticks * 10 + d;
        } else if (d != 0) {
          return ParseStatus::PRECISION_LOSS;
        }
      }
      for (size_t i = n_digits; i < unit_digits; ++i)
        frac_ticks *= 10;
    }
  }

  int offset_minutes = 0;
  if (pos < value.size()) {
    if (!parse_timezone(value, pos, offset_minutes))
      return ParseStatus::INVALID;
    if (!adjusted_to_utc)
      return ParseStatus::ZONE_NOT_ALLOWED;
  }

  int64_t seconds = static_cast<int64_t>(days) * 86400 + hour * 3600 + minute * 60 + second -
                    static_cast<int64_t>(offset_minutes) * 60;
  int64_t ticks = 0;
  if (__builtin_mul_overflow(seconds, time_unit_per_second(unit), &ticks) ||
      __builtin_add_overflow(ticks, frac_ticks, &ticks))
    return ParseStatus::OUT_OF_RANGE;

  out = ticks;
  return ParseStatus::OK;
}

ParseStatus parse_decimal(std::string_view value, uint8_t precision, uint8_t scale,
                          Int128& unscaled) {
  value = trim_ascii(value);
  if (value.empty())
    return ParseStatus::EMPTY;

  bool negative = false;
  size_t pos = 0;
  if (value[0] == '+' || value[0] == '-') {
    negative = value[0] == '-';
    pos = 1;
  }

  // Digit counts are bounded by precision before anything is accumulated, so
  // the magnitude never exceeds 38 digits.
  unsigned __int128 acc = 0;
  int int_digits = 0;
  int frac_digits = 0;
  bool any_digit = false;

  for (; pos < value.size() && is_digit(value[pos]); ++pos) {
    any_digit = true;
    int d = value[pos] - '0';
    if (acc == 0 && d == 0)
      continue;
    if (++int_digits + scale > precision)
      return ParseStatus::OUT_OF_RANGE;
    acc = acc * 10 + static_cast<unsigned>(d);
  }

  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    for (; pos < value.size() && is_digit(value[pos]); ++pos) {
      any_digit = true;
      int d = value[pos] - '0';
      if (frac_digits < scale) {
        acc = acc * 10 + static_cast<unsigned>(d);
        ++frac_digits;
      } else if (d != 0) {
        return ParseStatus::PRECISION_LOSS;
      }
    }
  }

  if (!any_digit || pos != value.size())
    return ParseStatus::INVALID;

  for (; frac_digits < scale; ++frac_digits)
    acc *= 10;

  unscaled = negative ? -static_cast<Int128>(acc) : static_cast<Int128>(acc);
  return ParseStatus::OK;
}

std::string format_date(int32_t days_since_epoch) { return format_days(days_since_epoch); }

std::string format_timestamp(int64_t value, TimeUnit unit, bool adjusted_to_utc) {
  const int64_t per_second = time_unit_per_second(unit);
  int64_t seconds = value / per_second;
  int64_t frac = value % per_second;
  if (frac < 0) {
    frac += per_second;
    seconds -= 1;
  }
  int64_t days = seconds / 86400;
  int64_t second_of_day = seconds % 86400;
  if (second_of_day < 0) {
    second_of_day += 86400;
    days -= 1;
  }

  std::string out = format_days(days);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "T%02d:%02d:%02d", static_cast<int>(second_of_day / 3600),
                static_cast<int>(second_of_day / 60 % 60), static_cast<int>(second_of_day % 60));
  out += buf;
  if (frac != 0) {
    std::snprintf(buf, sizeof(buf), ".%0*lld", time_unit_digits(unit),
                  static_cast<long long>(frac));
    out += buf;
  }
  if (adjusted_to_utc)
    out += 'Z';
  return out;
}

std::string format_int128(Int128 value) {
  bool negative = value < 0;
  unsigned __int128 magnitude =
      negative ? static_cast<unsigned __int128>(-(value + 1)) + 1 : static_cast<unsigned __int128>(value);
  char buf[48];
  char* p = buf + sizeof(buf);
  do {
    *--p = static_cast<char>('0' + static_cast<int>(magnitude % 10));
    magnitude /= 10;
  } while (magnitude != 0);
  if (negative)
    *--p = '-';
  return std::string(p, buf + sizeof(buf));
}

std::string format_decimal(Int128 unscaled, uint8_t scale) {
  std::string digits = format_int128(unscaled);
  bool negative = !digits.empty() && digits[0] == '-';
  if (negative)
    digits.erase(0, 1);
  if (scale > 0) {
    if (digits.size() <= scale)
      digits.insert(0, scale + 1 - digits.size(), '0');
    digits.insert(digits.size() - scale, 1, '.');
  }
  return negative ? "-" + digits : digits;
}

std::string format_float64(double value) { return format_floating(value); }

std::string format_float32(float value) { return format_floating(value); }

int decimal_digits(Int128 value) {
  unsigned __int128 magnitude = value < 0 ? static_cast<unsigned __int128>(-(value + 1)) + 1
                                          : static_cast<unsigned __int128>(value);
  int digits = 1;
  while (magnitude >= 10) {
    magnitude /= 10;
    ++digits;
  }
  return digits;
}

} // namespace pqstudio
