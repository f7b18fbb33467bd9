#include "pqstudio/cell.h"

#include "pqstudio/value_parsers.h"

#include <cmath>
#include <cstring>

namespace pqstudio {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Floats compare bitwise so that NaN payloads and signed zeros survive
// equality checks across a save/reload.
template <typename T> bool same_bits(T a, T b) {
  return std::memcmp(&a, &b, sizeof(T)) == 0;
}

} // namespace

bool Cell::matches(const LogicalType& type) const {
  return std::visit(
      overloaded{
          [](const std::monostate&) { return true; },
          [&](bool) { return type.id == TypeId::BOOL; },
          [&](int32_t) { return type.id == TypeId::INT32; },
          [&](int64_t) { return type.id == TypeId::INT64; },
          [&](float) { return type.id == TypeId::FLOAT32; },
          [&](double) { return type.id == TypeId::FLOAT64; },
          [&](const std::string&) { return type.id == TypeId::STRING; },
          [&](const Binary&) { return type.id == TypeId::BINARY; },
          [&](const Date&) { return type.id == TypeId::DATE; },
          [&](const Timestamp& ts) { return type.id == TypeId::TIMESTAMP && ts.unit == type.unit; },
          [&](const Decimal& d) {
            return type.id == TypeId::DECIMAL && d.precision == type.precision &&
                   d.scale == type.scale && decimal_fits(d.unscaled, type.precision);
          },
          [](const RawEdit&) { return false; },
      },
      value_);
}

std::string Cell::to_string() const {
  return std::visit(overloaded{
                        [](const std::monostate&) { return std::string(); },
                        [](bool v) { return std::string(v ? "true" : "false"); },
                        [](int32_t v) { return std::to_string(v); },
                        [](int64_t v) { return std::to_string(v); },
                        [](float v) { return format_float32(v); },
                        [](double v) { return format_float64(v); },
                        [](const std::string& v) { return v; },
                        [](const Binary& v) { return base64_encode(v.bytes); },
                        [](const Date& v) { return format_date(v.days); },
                        // The UTC marker is a column property, not a cell one
                        [](const Timestamp& v) { return format_timestamp(v.value, v.unit, false); },
                        [](const Decimal& v) { return format_decimal(v.unscaled, v.scale); },
                        [](const RawEdit& v) { return v.text; },
                    },
                    value_);
}

bool Cell::operator==(const Cell& other) const {
  if (value_.index() != other.value_.index())
    return false;
  if (const float* f = std::get_if<float>(&value_))
    return same_bits(*f, std::get<float>(other.value_));
  if (const double* d = std::get_if<double>(&value_))
    return same_bits(*d, std::get<double>(other.value_));
  return value_ == other.value_;
}

std::string base64_encode(std::string_view bytes) {
  static constexpr char alphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string out;
  out.reserve((bytes.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 3 <= bytes.size(); i += 3) {
    uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                 (static_cast<uint8_t>(bytes[i + 1]) << 8) | static_cast<uint8_t>(bytes[i + 2]);
    out += alphabet[(n >> 18) & 0x3F];
    out += alphabet[(n >> 12) & 0x3F];
    out += alphabet[(n >> 6) & 0x3F];
    out += alphabet[n & 0x3F];
  }
  size_t rest = bytes.size() - i;
  if (rest == 1) {
    uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
    out += alphabet[(n >> 18) & 0x3F];
    out += alphabet[(n >> 12) & 0x3F];
    out += "==";
  } else if (rest == 2) {
    uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) | (static_cast<uint8_t>(bytes[i + 1]) << 8);
    out += alphabet[(n >> 18) & 0x3F];
    out += alphabet[(n >> 12) & 0x3F];
    out += alphabet[(n >> 6) & 0x3F];
    out += '=';
  }
  return out;
}

} // namespace pqstudio
