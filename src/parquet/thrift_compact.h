#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pqstudio {
namespace parquet {

// Thrift compact type IDs
struct ThriftType {
  static constexpr uint8_t STOP = 0;
  static constexpr uint8_t BOOL_TRUE = 1;
  static constexpr uint8_t BOOL_FALSE = 2;
  static constexpr uint8_t BYTE = 3;
  static constexpr uint8_t I16 = 4;
  static constexpr uint8_t I32 = 5;
  static constexpr uint8_t I64 = 6;
  static constexpr uint8_t DOUBLE = 7;
  static constexpr uint8_t BINARY = 8; // Also used for strings
  static constexpr uint8_t LIST = 9;
  static constexpr uint8_t SET = 10;
  static constexpr uint8_t MAP = 11;
  static constexpr uint8_t STRUCT = 12;
};

/**
 * Thrift Compact Protocol Writer
 *
 * Implements the Thrift Compact Protocol (THRIFT-110) for serializing
 * Parquet metadata structures. Only the types Parquet uses are supported:
 * bool, byte, i16, i32, i64, double, string/binary, struct and list.
 *
 * Reference: https://github.com/apache/thrift/blob/master/doc/specs/thrift-compact-protocol.md
 */
class ThriftCompactWriter {
public:
  explicit ThriftCompactWriter(std::vector<uint8_t>& buffer);

  void write_struct_begin();
  void write_struct_end();

  // Field header; uses the 1-byte delta form when the id delta is 1..15
  void write_field_begin(int16_t field_id, uint8_t type_id);
  void write_field_stop();

  // A bool field carries its value in the field header's type nibble
  void write_bool_field(int16_t field_id, bool value);

  void write_byte(int8_t value);
  void write_i16(int16_t value);
  void write_i32(int32_t value);
  void write_i64(int64_t value);
  void write_double(double value);
  void write_string(const std::string& value);
  void write_binary(const std::vector<uint8_t>& value);
  void write_binary(const uint8_t* data, size_t size);

  void write_list_begin(uint8_t element_type, int32_t size);

  size_t size() const { return buffer_.size(); }

private:
  void write_varint(uint64_t value);
  void write_signed_varint(int64_t value);
  static uint64_t zigzag_encode(int64_t value);

  std::vector<uint8_t>& buffer_;
  int16_t last_field_id_;
  std::vector<int16_t> field_id_stack_; // For nested structs
};

/**
 * Thrift Compact Protocol Reader
 *
 * Bounds-checked counterpart of ThriftCompactWriter. Any malformed input
 * (truncation, oversized lengths, bad type ids, excessive nesting) throws
 * StudioException(DECODE_ERROR). Unknown fields are skipped with skip().
 */
class ThriftCompactReader {
public:
  ThriftCompactReader(const uint8_t* data, size_t size);

  void read_struct_begin();
  void read_struct_end();

  // Returns false at the struct's field stop. For bool fields the value is
  // carried in type_id (BOOL_TRUE or BOOL_FALSE).
  bool read_field_begin(int16_t& field_id, uint8_t& type_id);

  static bool bool_field_value(uint8_t type_id) { return type_id == ThriftType::BOOL_TRUE; }

  bool read_bool(); // list element form
  int8_t read_byte();
  int16_t read_i16();
  int32_t read_i32();
  int64_t read_i64();
  double read_double();
  std::string read_string();
  std::vector<uint8_t> read_binary();

  // Returns the element count; element_type receives the element type id
  int32_t read_list_begin(uint8_t& element_type);

  // Skip one value of the given type (recursing into containers)
  void skip(uint8_t type_id);

  // Throw unless the value about to be read has the expected type
  static void expect_type(uint8_t actual, uint8_t expected, const char* what);

  size_t position() const { return pos_; }
  size_t remaining() const { return size_ - pos_; }

private:
  uint8_t read_raw_byte();
  uint64_t read_varint();
  int64_t read_signed_varint();
  static int64_t zigzag_decode(uint64_t value);
  void skip_value(uint8_t type_id, int depth);

  const uint8_t* data_;
  size_t size_;
  size_t pos_ = 0;
  int16_t last_field_id_ = 0;
  std::vector<int16_t> field_id_stack_;
};

} // namespace parquet
} // namespace pqstudio
