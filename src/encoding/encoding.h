#pragma once

#include "pqstudio/column_buffers.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pqstudio {
namespace parquet {
namespace encoding {

// Bounds-checked cursor over an encoded page. Every read that would run past
// the end throws StudioException(DECODE_ERROR) naming `what`.
class ByteCursor {
public:
  ByteCursor(const uint8_t* data, size_t size) : data_(data), size_(size) {}

  const uint8_t* take(size_t n, const char* what);
  uint8_t read_u8(const char* what) { return *take(1, what); }
  uint32_t read_u32_le(const char* what);
  uint64_t read_uvarint(const char* what);
  int64_t read_zigzag(const char* what);

  const uint8_t* current() const { return data_ + pos_; }
  size_t position() const { return pos_; }
  size_t remaining() const { return size_ - pos_; }

private:
  const uint8_t* data_;
  size_t size_;
  size_t pos_ = 0;
};

// Shared helpers (hybrid_rle.cpp)
size_t write_varint(uint32_t value, std::vector<uint8_t>& output);
uint8_t bits_required(uint32_t max_value);

//-----------------------------------------------------------------------------
// RLE / bit-packed hybrid
//
// Header LSB 0: RLE run, (header >> 1) repeats of one value stored in
//               ceil(bit_width / 8) bytes.
// Header LSB 1: bit-packed run of (header >> 1) groups of 8 values, LSB first.
//-----------------------------------------------------------------------------

void encode_hybrid_rle(const uint32_t* values, size_t count, uint8_t bit_width,
                       std::vector<uint8_t>& output);

// Definition levels of rows [begin, end) of an OPTIONAL column (max level 1):
// 4-byte LE length prefix, then the hybrid-encoded levels, 1 = present, 0 = null.
void encode_def_levels(const NullBitmap& validity, size_t begin, size_t end,
                       std::vector<uint8_t>& output);

class HybridRleDecoder {
public:
  HybridRleDecoder(const uint8_t* data, size_t size, uint8_t bit_width);

  // Decode exactly `count` values. Throws DECODE_ERROR if the runs end early.
  void decode(uint32_t* out, size_t count);

private:
  bool next_run();

  ByteCursor cursor_;
  uint8_t bit_width_;
  uint32_t rle_value_ = 0;
  size_t rle_remaining_ = 0;
  const uint8_t* packed_ = nullptr;
  size_t packed_remaining_ = 0; // values left in the current bit-packed run
  size_t packed_index_ = 0;
};

//-----------------------------------------------------------------------------
// PLAIN
//-----------------------------------------------------------------------------

// Encoders take whole column buffers and write rows [begin, end), skipping nulls.

// Fixed-width values, little-endian
template <typename T>
void encode_plain(const T* values, const NullBitmap& validity, size_t begin, size_t end,
                  std::vector<uint8_t>& output);

// Booleans, bit-packed LSB first
void encode_plain_bool(const uint8_t* values, const NullBitmap& validity, size_t begin,
                       size_t end, std::vector<uint8_t>& output);

// BYTE_ARRAY: 4-byte LE length then bytes
void encode_plain_byte_array(const StringBuffer& values, const NullBitmap& validity,
                             size_t begin, size_t end, std::vector<uint8_t>& output);

template <typename T> void decode_plain(ByteCursor& in, size_t count, std::vector<T>& out);
void decode_plain_bool(ByteCursor& in, size_t count, std::vector<uint8_t>& out);
void decode_plain_byte_array(ByteCursor& in, size_t count, std::vector<std::string>& out);
void decode_plain_fixed_len(ByteCursor& in, size_t count, size_t width,
                            std::vector<std::string>& out);

// RLE-encoded booleans in a data page (4-byte length prefix, bit width 1)
void decode_rle_bool(ByteCursor& in, size_t count, std::vector<uint8_t>& out);

//-----------------------------------------------------------------------------
// DELTA_BINARY_PACKED and the byte-array encodings built on it
//-----------------------------------------------------------------------------

void encode_delta_binary_packed(const int64_t* values, size_t count, std::vector<uint8_t>& output);
void encode_delta_length_byte_array(const std::vector<std::string>& values,
                                    std::vector<uint8_t>& output);

// T is int32_t or int64_t. Reads at most `count` values; the header's
// total count must cover them.
template <typename T>
void decode_delta_binary_packed(ByteCursor& in, size_t count, std::vector<T>& out);
void decode_delta_length_byte_array(ByteCursor& in, size_t count, std::vector<std::string>& out);
void decode_delta_byte_array(ByteCursor& in, size_t count, std::vector<std::string>& out);

//-----------------------------------------------------------------------------
// BYTE_STREAM_SPLIT: byte k of every value stored in stream k
//-----------------------------------------------------------------------------

template <typename T>
void encode_byte_stream_split(const T* values, size_t count, std::vector<uint8_t>& output);
template <typename T>
void decode_byte_stream_split(ByteCursor& in, size_t count, std::vector<T>& out);

} // namespace encoding
} // namespace parquet
} // namespace pqstudio
