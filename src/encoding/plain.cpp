#include "encoding.h"

#include "pqstudio/error.h"

#include <cstring>

namespace pqstudio {
namespace parquet {
namespace encoding {

// Plain encoding for Parquet: raw little-endian values, nulls omitted.
// Byte order is the host's; pqstudio only targets little-endian platforms.

template <typename T>
void encode_plain(const T* values, const NullBitmap& validity, size_t begin, size_t end,
                  std::vector<uint8_t>& output) {
  // Fast path: no nulls, bulk copy
  if (!validity.has_nulls()) {
    size_t count = end - begin;
    size_t start = output.size();
    output.resize(start + count * sizeof(T));
    if (count > 0)
      std::memcpy(output.data() + start, values + begin, count * sizeof(T));
    return;
  }

  output.reserve(output.size() + (end - begin) * sizeof(T));
  uint8_t bytes[sizeof(T)];
  for (size_t i = begin; i < end; ++i) {
    if (validity.is_valid(i)) {
      std::memcpy(bytes, &values[i], sizeof(T));
      output.insert(output.end(), bytes, bytes + sizeof(T));
    }
  }
}

template void encode_plain<int32_t>(const int32_t*, const NullBitmap&, size_t, size_t,
                                    std::vector<uint8_t>&);
template void encode_plain<int64_t>(const int64_t*, const NullBitmap&, size_t, size_t,
                                    std::vector<uint8_t>&);
template void encode_plain<float>(const float*, const NullBitmap&, size_t, size_t,
                                  std::vector<uint8_t>&);
template void encode_plain<double>(const double*, const NullBitmap&, size_t, size_t,
                                   std::vector<uint8_t>&);

void encode_plain_bool(const uint8_t* values, const NullBitmap& validity, size_t begin,
                       size_t end, std::vector<uint8_t>& output) {
  size_t written = 0;
  size_t start = output.size();
  output.resize(start + (end - begin + 7) / 8, 0);

  for (size_t i = begin; i < end; ++i) {
    if (!validity.is_valid(i))
      continue;
    if (values[i]) {
      output[start + written / 8] |= static_cast<uint8_t>(1u << (written % 8));
    }
    ++written;
  }
  output.resize(start + (written + 7) / 8);
}

void encode_plain_byte_array(const StringBuffer& values, const NullBitmap& validity,
                             size_t begin, size_t end, std::vector<uint8_t>& output) {
  for (size_t i = begin; i < end; ++i) {
    if (!validity.is_valid(i))
      continue;
    std::string_view v = values.get(i);
    uint32_t len = static_cast<uint32_t>(v.size());
    output.push_back(len & 0xFF);
    output.push_back((len >> 8) & 0xFF);
    output.push_back((len >> 16) & 0xFF);
    output.push_back((len >> 24) & 0xFF);
    output.insert(output.end(), v.begin(), v.end());
  }
}

//-----------------------------------------------------------------------------
// Decoding
//-----------------------------------------------------------------------------

template <typename T> void decode_plain(ByteCursor& in, size_t count, std::vector<T>& out) {
  if (count > in.remaining() / sizeof(T)) {
    throw StudioException(ErrorCode::DECODE_ERROR,
                          "PLAIN page holds fewer than " + std::to_string(count) + " values");
  }
  const uint8_t* src = in.take(count * sizeof(T), "PLAIN values");
  size_t start = out.size();
  out.resize(start + count);
  if (count > 0)
    std::memcpy(out.data() + start, src, count * sizeof(T));
}

template void decode_plain<int32_t>(ByteCursor&, size_t, std::vector<int32_t>&);
template void decode_plain<int64_t>(ByteCursor&, size_t, std::vector<int64_t>&);
template void decode_plain<float>(ByteCursor&, size_t, std::vector<float>&);
template void decode_plain<double>(ByteCursor&, size_t, std::vector<double>&);

void decode_plain_bool(ByteCursor& in, size_t count, std::vector<uint8_t>& out) {
  const uint8_t* bits = in.take((count + 7) / 8, "PLAIN booleans");
  out.reserve(out.size() + count);
  for (size_t i = 0; i < count; ++i) {
    out.push_back((bits[i / 8] >> (i % 8)) & 1);
  }
}

void decode_plain_byte_array(ByteCursor& in, size_t count, std::vector<std::string>& out) {
  // Every value carries at least its 4-byte length
  if (count > in.remaining() / 4) {
    throw StudioException(ErrorCode::DECODE_ERROR,
                          "BYTE_ARRAY page holds fewer than " + std::to_string(count) + " values");
  }
  out.reserve(out.size() + count);
  for (size_t i = 0; i < count; ++i) {
    uint32_t len = in.read_u32_le("BYTE_ARRAY length");
    const uint8_t* p = in.take(len, "BYTE_ARRAY value");
    out.emplace_back(reinterpret_cast<const char*>(p), len);
  }
}

void decode_plain_fixed_len(ByteCursor& in, size_t count, size_t width,
                            std::vector<std::string>& out) {
  if (width == 0 || count > in.remaining() / width) {
    throw StudioException(ErrorCode::DECODE_ERROR,
                          "FIXED_LEN_BYTE_ARRAY page holds fewer than " + std::to_string(count) +
                              " values");
  }
  out.reserve(out.size() + count);
  for (size_t i = 0; i < count; ++i) {
    const uint8_t* p = in.take(width, "FIXED_LEN_BYTE_ARRAY value");
    out.emplace_back(reinterpret_cast<const char*>(p), width);
  }
}

void decode_rle_bool(ByteCursor& in, size_t count, std::vector<uint8_t>& out) {
  uint32_t len = in.read_u32_le("RLE boolean length");
  const uint8_t* p = in.take(len, "RLE booleans");
  std::vector<uint32_t> values(count);
  HybridRleDecoder decoder(p, len, 1);
  decoder.decode(values.data(), count);
  out.reserve(out.size() + count);
  for (uint32_t v : values) {
    out.push_back(static_cast<uint8_t>(v != 0));
  }
}

} // namespace encoding
} // namespace parquet
} // namespace pqstudio
