#include "exporters.h"

#include "pqstudio/value_parsers.h"

#include <cstdio>

namespace pqstudio {
namespace exporters {

namespace {

constexpr const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the valid UTF-8 sequence starting at pos, or 0 when the bytes
// there are not one (bad lead byte, truncation, bad continuation, overlong
// form, surrogate or value above U+10FFFF).
size_t utf8_sequence_length(std::string_view str, size_t pos) {
  uint8_t byte = static_cast<uint8_t>(str[pos]);

  // ASCII (0xxxxxxx)
  if ((byte & 0x80) == 0)
    return 1;

  size_t len;
  uint32_t cp;
  if ((byte & 0xE0) == 0xC0) {
    len = 2;
    cp = byte & 0x1F;
  } else if ((byte & 0xF0) == 0xE0) {
    len = 3;
    cp = byte & 0x0F;
  } else if ((byte & 0xF8) == 0xF0) {
    len = 4;
    cp = byte & 0x07;
  } else {
    return 0;
  }

  if (pos + len > str.size())
    return 0;

  for (size_t i = 1; i < len; ++i) {
    uint8_t cont = static_cast<uint8_t>(str[pos + i]);
    if ((cont & 0xC0) != 0x80)
      return 0;
    cp = (cp << 6) | (cont & 0x3F);
  }

  if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
    return 0;
  if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
    return 0;
  return len;
}

} // namespace

std::string cell_text(const Cell& cell, const Column& column) {
  if (cell.holds<Timestamp>()) {
    const Timestamp& ts = cell.get<Timestamp>();
    return format_timestamp(ts.value, ts.unit, column.type.adjusted_to_utc);
  }
  return cell.to_string();
}

bool append_utf8(std::string_view text, std::string& out) {
  bool clean = true;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t len = utf8_sequence_length(text, pos);
    if (len == 0) {
      out += REPLACEMENT_CHARACTER;
      clean = false;
      ++pos;
      continue;
    }
    out.append(text.data() + pos, len);
    pos += len;
  }
  return clean;
}

void append_csv_field(std::string_view text, char separator, std::string& out) {
  bool should_quote = false;
  for (char c : text) {
    if (c == '\n' || c == '\r' || c == '"' || c == separator) {
      should_quote = true;
      break;
    }
  }

  if (!should_quote) {
    out.append(text);
    return;
  }

  out.reserve(out.size() + text.size() + 2);
  out += '"';
  for (char c : text) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
}

bool append_json_string(std::string_view text, std::string& out) {
  std::string clean;
  bool valid = append_utf8(text, clean);

  out += '"';
  for (char c : clean) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      // Remaining control characters (0x00-0x1F) as \uXXXX
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[7];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
        out += buf;
      } else {
        out += c;
      }
    }
  }
  out += '"';
  return valid;
}

bool append_xml_text(std::string_view text, std::string& out) {
  std::string clean;
  bool valid = append_utf8(text, clean);

  for (char c : clean) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\t':
    case '\n':
    case '\r':
      out += c;
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += REPLACEMENT_CHARACTER;
        valid = false;
      } else {
        out += c;
      }
    }
  }
  return valid;
}

} // namespace exporters
} // namespace pqstudio
