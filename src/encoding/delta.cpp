#include "encoding.h"

#include "pqstudio/error.h"

#include <algorithm>
#include <cstring>

namespace pqstudio {
namespace parquet {
namespace encoding {

// Delta Binary Packed encoding
// Header: <block size> <miniblocks per block> <total count> <first value>
// Each block: <min delta (zigzag)> <one bit width byte per miniblock>
//             <miniblocks of (delta - min delta), bit-packed LSB first>

namespace {

constexpr size_t BLOCK_SIZE = 128;
constexpr size_t MINIBLOCK_COUNT = 4;
constexpr size_t MINIBLOCK_SIZE = BLOCK_SIZE / MINIBLOCK_COUNT;

[[noreturn]] void bad_delta(const std::string& detail) {
  throw StudioException(ErrorCode::DECODE_ERROR, "invalid DELTA_BINARY_PACKED data: " + detail);
}

inline uint64_t zigzag_encode(int64_t value) {
  return (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
}

void write_uvarint(uint64_t value, std::vector<uint8_t>& output) {
  while (value >= 0x80) {
    output.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
    value >>= 7;
  }
  output.push_back(static_cast<uint8_t>(value & 0x7F));
}

uint8_t bit_width_for_value(uint64_t value) {
  if (value == 0)
    return 0;
  return static_cast<uint8_t>(64 - __builtin_clzll(value));
}

void bit_pack(const uint64_t* values, size_t count, uint8_t bit_width,
              std::vector<uint8_t>& output) {
  if (bit_width == 0)
    return;

  // Widths above 56 would overflow a 64-bit accumulator
  unsigned __int128 buffer = 0;
  int bits_in_buffer = 0;

  for (size_t i = 0; i < count; ++i) {
    uint64_t v = bit_width == 64 ? values[i] : (values[i] & ((uint64_t(1) << bit_width) - 1));
    buffer |= static_cast<unsigned __int128>(v) << bits_in_buffer;
    bits_in_buffer += bit_width;

    while (bits_in_buffer >= 8) {
      output.push_back(static_cast<uint8_t>(buffer & 0xFF));
      buffer >>= 8;
      bits_in_buffer -= 8;
    }
  }

  if (bits_in_buffer > 0) {
    output.push_back(static_cast<uint8_t>(buffer & 0xFF));
  }
}

uint64_t read_bits(const uint8_t* p, size_t bit_pos, uint8_t width) {
  uint64_t v = 0;
  unsigned got = 0;
  while (got < width) {
    size_t byte = (bit_pos + got) / 8;
    unsigned off = static_cast<unsigned>((bit_pos + got) % 8);
    unsigned take = std::min<unsigned>(8 - off, width - got);
    uint64_t chunk = (static_cast<uint64_t>(p[byte]) >> off) & ((1u << take) - 1);
    v |= chunk << got;
    got += take;
  }
  return v;
}

} // namespace

void encode_delta_binary_packed(const int64_t* values, size_t count,
                                std::vector<uint8_t>& output) {
  write_uvarint(BLOCK_SIZE, output);
  write_uvarint(MINIBLOCK_COUNT, output);
  write_uvarint(count, output);
  write_uvarint(count > 0 ? zigzag_encode(values[0]) : 0, output);

  if (count <= 1)
    return;

  // Deltas wrap like the reader's arithmetic
  std::vector<int64_t> deltas(count - 1);
  for (size_t i = 1; i < count; ++i) {
    deltas[i - 1] = static_cast<int64_t>(static_cast<uint64_t>(values[i]) -
                                         static_cast<uint64_t>(values[i - 1]));
  }

  size_t delta_idx = 0;
  while (delta_idx < deltas.size()) {
    size_t block_count = std::min(BLOCK_SIZE, deltas.size() - delta_idx);

    int64_t min_delta = *std::min_element(deltas.begin() + delta_idx,
                                          deltas.begin() + delta_idx + block_count);
    write_uvarint(zigzag_encode(min_delta), output);

    uint8_t bit_widths[MINIBLOCK_COUNT] = {0, 0, 0, 0};
    for (size_t mb = 0; mb < MINIBLOCK_COUNT; ++mb) {
      size_t mb_start = delta_idx + mb * MINIBLOCK_SIZE;
      size_t mb_end = std::min(mb_start + MINIBLOCK_SIZE, delta_idx + block_count);

      uint64_t max_adjusted = 0;
      for (size_t i = mb_start; i < mb_end; ++i) {
        max_adjusted = std::max(max_adjusted, static_cast<uint64_t>(deltas[i]) -
                                                  static_cast<uint64_t>(min_delta));
      }
      bit_widths[mb] = bit_width_for_value(max_adjusted);
    }
    output.insert(output.end(), bit_widths, bit_widths + MINIBLOCK_COUNT);

    // Miniblocks are padded to a full miniblock; empty trailing ones are omitted
    for (size_t mb = 0; mb < MINIBLOCK_COUNT; ++mb) {
      size_t mb_start = delta_idx + mb * MINIBLOCK_SIZE;
      if (mb_start >= delta_idx + block_count)
        break;
      size_t mb_end = std::min(mb_start + MINIBLOCK_SIZE, delta_idx + block_count);

      std::vector<uint64_t> adjusted(MINIBLOCK_SIZE, 0);
      for (size_t i = mb_start; i < mb_end; ++i) {
        adjusted[i - mb_start] =
            static_cast<uint64_t>(deltas[i]) - static_cast<uint64_t>(min_delta);
      }
      bit_pack(adjusted.data(), MINIBLOCK_SIZE, bit_widths[mb], output);
    }

    delta_idx += block_count;
  }
}

template <typename T>
void decode_delta_binary_packed(ByteCursor& in, size_t count, std::vector<T>& out) {
  uint64_t block_size = in.read_uvarint("delta block size");
  uint64_t miniblocks = in.read_uvarint("delta miniblock count");
  uint64_t total = in.read_uvarint("delta value count");
  int64_t first = in.read_zigzag("delta first value");

  if (block_size == 0 || miniblocks == 0 || block_size % miniblocks != 0)
    bad_delta("bad block layout");
  uint64_t per_miniblock = block_size / miniblocks;
  if (per_miniblock % 8 != 0 || block_size > (1u << 20))
    bad_delta("bad miniblock size");
  if (total != count)
    bad_delta("holds " + std::to_string(total) + " values, expected " + std::to_string(count));

  out.reserve(out.size() + count);
  if (count == 0)
    return;

  uint64_t current = static_cast<uint64_t>(first);
  out.push_back(static_cast<T>(current));
  size_t produced = 1;

  std::vector<uint8_t> widths(miniblocks);
  while (produced < count) {
    uint64_t min_delta = static_cast<uint64_t>(in.read_zigzag("delta block min"));
    const uint8_t* w = in.take(miniblocks, "delta bit widths");
    std::copy(w, w + miniblocks, widths.begin());

    for (uint64_t mb = 0; mb < miniblocks && produced < count; ++mb) {
      uint8_t width = widths[mb];
      if (width > 64)
        bad_delta("bit width " + std::to_string(width));
      const uint8_t* packed = in.take(per_miniblock * width / 8, "delta miniblock");
      for (uint64_t i = 0; i < per_miniblock && produced < count; ++i) {
        uint64_t delta = width == 0 ? 0 : read_bits(packed, i * width, width);
        current += min_delta + delta;
        out.push_back(static_cast<T>(current));
        ++produced;
      }
    }
  }
}

template void decode_delta_binary_packed<int32_t>(ByteCursor&, size_t, std::vector<int32_t>&);
template void decode_delta_binary_packed<int64_t>(ByteCursor&, size_t, std::vector<int64_t>&);

//-----------------------------------------------------------------------------
// Delta Length Byte Array: delta-encoded lengths, then all bytes concatenated
//-----------------------------------------------------------------------------

void encode_delta_length_byte_array(const std::vector<std::string>& values,
                                    std::vector<uint8_t>& output) {
  std::vector<int64_t> lengths;
  lengths.reserve(values.size());
  for (const auto& v : values) {
    lengths.push_back(static_cast<int64_t>(v.size()));
  }

  encode_delta_binary_packed(lengths.data(), lengths.size(), output);

  for (const auto& v : values) {
    output.insert(output.end(), v.begin(), v.end());
  }
}

void decode_delta_length_byte_array(ByteCursor& in, size_t count, std::vector<std::string>& out) {
  std::vector<int32_t> lengths;
  decode_delta_binary_packed(in, count, lengths);

  out.reserve(out.size() + count);
  for (int32_t len : lengths) {
    if (len < 0)
      bad_delta("negative byte array length");
    const uint8_t* p = in.take(static_cast<size_t>(len), "DELTA_LENGTH_BYTE_ARRAY value");
    out.emplace_back(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
  }
}

//-----------------------------------------------------------------------------
// Delta Byte Array (incremental encoding): prefix lengths, then suffixes
//-----------------------------------------------------------------------------

void decode_delta_byte_array(ByteCursor& in, size_t count, std::vector<std::string>& out) {
  std::vector<int32_t> prefixes;
  decode_delta_binary_packed(in, count, prefixes);

  std::vector<std::string> suffixes;
  decode_delta_length_byte_array(in, count, suffixes);

  out.reserve(out.size() + count);
  std::string previous;
  for (size_t i = 0; i < count; ++i) {
    if (prefixes[i] < 0 || static_cast<size_t>(prefixes[i]) > previous.size())
      bad_delta("prefix length exceeds previous value");
    std::string value = previous.substr(0, static_cast<size_t>(prefixes[i]));
    value += suffixes[i];
    out.push_back(value);
    previous = std::move(value);
  }
}

} // namespace encoding
} // namespace parquet
} // namespace pqstudio
