#include "thrift_compact.h"

#include "pqstudio/error.h"

#include <cstring>

namespace pqstudio {
namespace parquet {

namespace {

// Nested structs deeper than this are rejected as malformed
constexpr int MAX_NESTING_DEPTH = 64;

[[noreturn]] void malformed(const std::string& what) {
  throw StudioException(ErrorCode::DECODE_ERROR, "malformed thrift metadata: " + what);
}

} // namespace

ThriftCompactWriter::ThriftCompactWriter(std::vector<uint8_t>& buffer)
    : buffer_(buffer), last_field_id_(0) {}

void ThriftCompactWriter::write_struct_begin() {
  field_id_stack_.push_back(last_field_id_);
  last_field_id_ = 0;
}

void ThriftCompactWriter::write_struct_end() {
  write_field_stop();
  if (!field_id_stack_.empty()) {
    last_field_id_ = field_id_stack_.back();
    field_id_stack_.pop_back();
  }
}

void ThriftCompactWriter::write_field_begin(int16_t field_id, uint8_t type_id) {
  int16_t delta = field_id - last_field_id_;

  if (delta > 0 && delta <= 15) {
    buffer_.push_back(static_cast<uint8_t>((delta << 4) | type_id));
  } else {
    buffer_.push_back(type_id);
    write_signed_varint(field_id);
  }

  last_field_id_ = field_id;
}

void ThriftCompactWriter::write_field_stop() { buffer_.push_back(ThriftType::STOP); }

void ThriftCompactWriter::write_bool_field(int16_t field_id, bool value) {
  write_field_begin(field_id, value ? ThriftType::BOOL_TRUE : ThriftType::BOOL_FALSE);
}

void ThriftCompactWriter::write_byte(int8_t value) {
  buffer_.push_back(static_cast<uint8_t>(value));
}

void ThriftCompactWriter::write_i16(int16_t value) { write_signed_varint(value); }

void ThriftCompactWriter::write_i32(int32_t value) { write_signed_varint(value); }

void ThriftCompactWriter::write_i64(int64_t value) { write_signed_varint(value); }

void ThriftCompactWriter::write_double(double value) {
  // 8 bytes, little-endian
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>(bits >> (i * 8)));
  }
}

void ThriftCompactWriter::write_string(const std::string& value) {
  write_varint(value.size());
  buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ThriftCompactWriter::write_binary(const std::vector<uint8_t>& value) {
  write_binary(value.data(), value.size());
}

void ThriftCompactWriter::write_binary(const uint8_t* data, size_t size) {
  write_varint(size);
  buffer_.insert(buffer_.end(), data, data + size);
}

void ThriftCompactWriter::write_list_begin(uint8_t element_type, int32_t size) {
  if (size < 15) {
    buffer_.push_back(static_cast<uint8_t>((size << 4) | element_type));
  } else {
    buffer_.push_back(static_cast<uint8_t>(0xF0 | element_type));
    write_varint(static_cast<uint64_t>(size));
  }
}

void ThriftCompactWriter::write_varint(uint64_t value) {
  // ULEB128
  while (value >= 0x80) {
    buffer_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
    value >>= 7;
  }
  buffer_.push_back(static_cast<uint8_t>(value));
}

void ThriftCompactWriter::write_signed_varint(int64_t value) {
  write_varint(zigzag_encode(value));
}

uint64_t ThriftCompactWriter::zigzag_encode(int64_t value) {
  // n -> (n << 1) ^ (n >> 63)
  return (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
}

//-----------------------------------------------------------------------------
// ThriftCompactReader
//-----------------------------------------------------------------------------

ThriftCompactReader::ThriftCompactReader(const uint8_t* data, size_t size)
    : data_(data), size_(size) {}

void ThriftCompactReader::read_struct_begin() {
  if (field_id_stack_.size() >= MAX_NESTING_DEPTH)
    malformed("structs nested too deeply");
  field_id_stack_.push_back(last_field_id_);
  last_field_id_ = 0;
}

void ThriftCompactReader::read_struct_end() {
  if (!field_id_stack_.empty()) {
    last_field_id_ = field_id_stack_.back();
    field_id_stack_.pop_back();
  }
}

bool ThriftCompactReader::read_field_begin(int16_t& field_id, uint8_t& type_id) {
  uint8_t header = read_raw_byte();
  if (header == ThriftType::STOP) {
    return false;
  }

  type_id = header & 0x0F;
  if (type_id > ThriftType::STRUCT) {
    malformed("unknown field type " + std::to_string(type_id));
  }

  uint8_t delta = header >> 4;
  if (delta != 0) {
    field_id = static_cast<int16_t>(last_field_id_ + delta);
  } else {
    field_id = read_i16();
  }
  last_field_id_ = field_id;
  return true;
}

bool ThriftCompactReader::read_bool() {
  return read_raw_byte() == ThriftType::BOOL_TRUE;
}

int8_t ThriftCompactReader::read_byte() { return static_cast<int8_t>(read_raw_byte()); }

int16_t ThriftCompactReader::read_i16() {
  int64_t v = read_signed_varint();
  if (v < INT16_MIN || v > INT16_MAX)
    malformed("i16 out of range");
  return static_cast<int16_t>(v);
}

int32_t ThriftCompactReader::read_i32() {
  int64_t v = read_signed_varint();
  if (v < INT32_MIN || v > INT32_MAX)
    malformed("i32 out of range");
  return static_cast<int32_t>(v);
}

int64_t ThriftCompactReader::read_i64() { return read_signed_varint(); }

double ThriftCompactReader::read_double() {
  if (remaining() < 8)
    malformed("truncated double");
  uint64_t bits = 0;
  for (int i = 0; i < 8; ++i) {
    bits |= static_cast<uint64_t>(data_[pos_ + i]) << (i * 8);
  }
  pos_ += 8;
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

std::string ThriftCompactReader::read_string() {
  uint64_t len = read_varint();
  if (len > remaining())
    malformed("string length exceeds buffer");
  std::string value(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(len));
  pos_ += static_cast<size_t>(len);
  return value;
}

std::vector<uint8_t> ThriftCompactReader::read_binary() {
  uint64_t len = read_varint();
  if (len > remaining())
    malformed("binary length exceeds buffer");
  std::vector<uint8_t> value(data_ + pos_, data_ + pos_ + len);
  pos_ += static_cast<size_t>(len);
  return value;
}

int32_t ThriftCompactReader::read_list_begin(uint8_t& element_type) {
  uint8_t header = read_raw_byte();
  element_type = header & 0x0F;
  uint64_t size = header >> 4;
  if (size == 15) {
    size = read_varint();
  }
  // Every element takes at least one byte, except bools which still take one
  if (size > remaining() || size > static_cast<uint64_t>(INT32_MAX))
    malformed("list size exceeds buffer");
  return static_cast<int32_t>(size);
}

void ThriftCompactReader::skip(uint8_t type_id) { skip_value(type_id, 0); }

void ThriftCompactReader::expect_type(uint8_t actual, uint8_t expected, const char* what) {
  bool both_bool = (actual == ThriftType::BOOL_TRUE || actual == ThriftType::BOOL_FALSE) &&
                   (expected == ThriftType::BOOL_TRUE || expected == ThriftType::BOOL_FALSE);
  if (actual != expected && !both_bool) {
    malformed(std::string("unexpected type for ") + what);
  }
}

void ThriftCompactReader::skip_value(uint8_t type_id, int depth) {
  if (depth > MAX_NESTING_DEPTH)
    malformed("values nested too deeply");

  switch (type_id) {
  case ThriftType::BOOL_TRUE:
  case ThriftType::BOOL_FALSE:
    // Field form carries the value in the header; nothing to consume
    break;
  case ThriftType::BYTE:
    read_raw_byte();
    break;
  case ThriftType::I16:
  case ThriftType::I32:
  case ThriftType::I64:
    read_varint();
    break;
  case ThriftType::DOUBLE:
    read_double();
    break;
  case ThriftType::BINARY: {
    uint64_t len = read_varint();
    if (len > remaining())
      malformed("binary length exceeds buffer");
    pos_ += static_cast<size_t>(len);
    break;
  }
  case ThriftType::LIST:
  case ThriftType::SET: {
    uint8_t elem_type = 0;
    int32_t n = read_list_begin(elem_type);
    for (int32_t i = 0; i < n; ++i) {
      if (elem_type == ThriftType::BOOL_TRUE || elem_type == ThriftType::BOOL_FALSE) {
        read_raw_byte();
      } else {
        skip_value(elem_type, depth + 1);
      }
    }
    break;
  }
  case ThriftType::MAP: {
    uint64_t n = read_varint();
    if (n == 0)
      break;
    if (n > remaining())
      malformed("map size exceeds buffer");
    uint8_t kv = read_raw_byte();
    uint8_t key_type = kv >> 4;
    uint8_t value_type = kv & 0x0F;
    for (uint64_t i = 0; i < n; ++i) {
      skip_value(key_type, depth + 1);
      skip_value(value_type, depth + 1);
    }
    break;
  }
  case ThriftType::STRUCT: {
    read_struct_begin();
    int16_t fid = 0;
    uint8_t ftype = 0;
    while (read_field_begin(fid, ftype)) {
      skip_value(ftype, depth + 1);
    }
    read_struct_end();
    break;
  }
  default:
    malformed("cannot skip type " + std::to_string(type_id));
  }
}

uint8_t ThriftCompactReader::read_raw_byte() {
  if (pos_ >= size_)
    malformed("unexpected end of buffer");
  return data_[pos_++];
}

uint64_t ThriftCompactReader::read_varint() {
  uint64_t result = 0;
  for (int shift = 0; shift < 64; shift += 7) {
    uint8_t byte = read_raw_byte();
    result |= static_cast<uint64_t>(byte & 0x7F) << shift;
    if ((byte & 0x80) == 0)
      return result;
  }
  malformed("varint too long");
}

int64_t ThriftCompactReader::read_signed_varint() { return zigzag_decode(read_varint()); }

int64_t ThriftCompactReader::zigzag_decode(uint64_t value) {
  return static_cast<int64_t>(value >> 1) ^ -static_cast<int64_t>(value & 1);
}

} // namespace parquet
} // namespace pqstudio
