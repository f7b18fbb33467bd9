#include "encoding.h"

#include "pqstudio/error.h"

#include <cstring>

namespace pqstudio {
namespace parquet {
namespace encoding {

// BYTE_STREAM_SPLIT scatters the K bytes of each value into K streams of N
// bytes each, so stream k holds byte k of every value.

template <typename T>
void encode_byte_stream_split(const T* values, size_t count, std::vector<uint8_t>& output) {
  constexpr size_t K = sizeof(T);
  size_t start = output.size();
  output.resize(start + count * K);

  const uint8_t* src = reinterpret_cast<const uint8_t*>(values);
  uint8_t* dest = output.data() + start;
  for (size_t i = 0; i < count; ++i) {
    for (size_t k = 0; k < K; ++k) {
      dest[k * count + i] = src[i * K + k];
    }
  }
}

template <typename T>
void decode_byte_stream_split(ByteCursor& in, size_t count, std::vector<T>& out) {
  constexpr size_t K = sizeof(T);
  // The stream stride is the number of values in the page, which is the
  // whole remaining buffer divided by the value width.
  size_t n = in.remaining() / K;
  if (in.remaining() % K != 0 || n < count) {
    throw StudioException(ErrorCode::DECODE_ERROR,
                          "BYTE_STREAM_SPLIT page holds fewer than " + std::to_string(count) +
                              " values");
  }
  const uint8_t* src = in.take(n * K, "BYTE_STREAM_SPLIT values");

  out.reserve(out.size() + count);
  uint8_t bytes[K];
  for (size_t i = 0; i < count; ++i) {
    for (size_t k = 0; k < K; ++k) {
      bytes[k] = src[k * n + i];
    }
    T value;
    std::memcpy(&value, bytes, K);
    out.push_back(value);
  }
}

template void encode_byte_stream_split<float>(const float*, size_t, std::vector<uint8_t>&);
template void encode_byte_stream_split<double>(const double*, size_t, std::vector<uint8_t>&);
template void decode_byte_stream_split<int32_t>(ByteCursor&, size_t, std::vector<int32_t>&);
template void decode_byte_stream_split<int64_t>(ByteCursor&, size_t, std::vector<int64_t>&);
template void decode_byte_stream_split<float>(ByteCursor&, size_t, std::vector<float>&);
template void decode_byte_stream_split<double>(ByteCursor&, size_t, std::vector<double>&);

} // namespace encoding
} // namespace parquet
} // namespace pqstudio
