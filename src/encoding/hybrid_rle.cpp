#include "encoding.h"

#include "pqstudio/error.h"

#include <algorithm>
#include <cstring>

namespace pqstudio {
namespace parquet {
namespace encoding {

namespace {

[[noreturn]] void truncated(const char* what) {
  throw StudioException(ErrorCode::DECODE_ERROR, std::string("truncated page data: ") + what);
}

// Runs of at least this many equal values are emitted as RLE
constexpr size_t MIN_RLE_RUN = 8;

size_t run_length_at(const uint32_t* values, size_t count, size_t i) {
  size_t n = 1;
  while (i + n < count && values[i + n] == values[i]) {
    ++n;
  }
  return n;
}

void write_rle_run(uint32_t value, size_t count, uint8_t bit_width, std::vector<uint8_t>& output) {
  // Header: (count << 1) | 0
  write_varint(static_cast<uint32_t>(count) << 1, output);

  size_t value_bytes = (bit_width + 7) / 8;
  for (size_t b = 0; b < value_bytes; ++b) {
    output.push_back(static_cast<uint8_t>((value >> (b * 8)) & 0xFF));
  }
}

void write_bit_packed_run(const uint32_t* values, size_t count, uint8_t bit_width,
                          std::vector<uint8_t>& output) {
  size_t groups = (count + 7) / 8;

  // Header: (groups << 1) | 1
  write_varint((static_cast<uint32_t>(groups) << 1) | 1, output);

  uint64_t buffer = 0;
  int bits_in_buffer = 0;

  for (size_t i = 0; i < groups * 8; ++i) {
    uint32_t value = (i < count) ? values[i] : 0;
    buffer |= (static_cast<uint64_t>(value) << bits_in_buffer);
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

} // namespace

//-----------------------------------------------------------------------------
// ByteCursor
//-----------------------------------------------------------------------------

const uint8_t* ByteCursor::take(size_t n, const char* what) {
  if (n > remaining())
    truncated(what);
  const uint8_t* p = data_ + pos_;
  pos_ += n;
  return p;
}

uint32_t ByteCursor::read_u32_le(const char* what) {
  const uint8_t* p = take(4, what);
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t ByteCursor::read_uvarint(const char* what) {
  uint64_t result = 0;
  for (int shift = 0; shift < 64; shift += 7) {
    uint8_t byte = read_u8(what);
    result |= static_cast<uint64_t>(byte & 0x7F) << shift;
    if ((byte & 0x80) == 0)
      return result;
  }
  throw StudioException(ErrorCode::DECODE_ERROR, std::string("varint too long: ") + what);
}

int64_t ByteCursor::read_zigzag(const char* what) {
  uint64_t v = read_uvarint(what);
  return static_cast<int64_t>(v >> 1) ^ -static_cast<int64_t>(v & 1);
}

//-----------------------------------------------------------------------------
// Shared helpers
//-----------------------------------------------------------------------------

size_t write_varint(uint32_t value, std::vector<uint8_t>& output) {
  size_t bytes_written = 0;
  while (value >= 0x80) {
    output.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
    value >>= 7;
    ++bytes_written;
  }
  output.push_back(static_cast<uint8_t>(value & 0x7F));
  return bytes_written + 1;
}

uint8_t bits_required(uint32_t max_value) {
  uint8_t bits = 0;
  while (max_value > 0) {
    max_value >>= 1;
    ++bits;
  }
  return bits;
}

//-----------------------------------------------------------------------------
// Encoder
//-----------------------------------------------------------------------------

// Bit-packed runs always cover whole groups of 8 except at the very end of
// the stream, so a reader that stops at `count` never sees padding mid-run.
void encode_hybrid_rle(const uint32_t* values, size_t count, uint8_t bit_width,
                       std::vector<uint8_t>& output) {
  size_t i = 0;
  while (i < count) {
    size_t run = run_length_at(values, count, i);
    if (run >= MIN_RLE_RUN) {
      write_rle_run(values[i], run, bit_width, output);
      i += run;
      continue;
    }

    size_t start = i;
    do {
      i += std::min<size_t>(8, count - i);
    } while (i < count && run_length_at(values, count, i) < MIN_RLE_RUN);
    write_bit_packed_run(values + start, i - start, bit_width, output);
  }
}

void encode_def_levels(const NullBitmap& validity, size_t begin, size_t end,
                       std::vector<uint8_t>& output) {
  size_t count = end - begin;
  size_t length_pos = output.size();
  output.resize(output.size() + 4);
  size_t data_start = output.size();

  if (count > 0) {
    if (!validity.has_nulls()) {
      // Fast path: one RLE run of level 1
      write_rle_run(1, count, 1, output);
    } else {
      std::vector<uint32_t> levels(count);
      for (size_t i = 0; i < count; ++i) {
        levels[i] = validity.is_valid(begin + i) ? 1 : 0;
      }
      encode_hybrid_rle(levels.data(), count, 1, output);
    }
  }

  uint32_t encoded_length = static_cast<uint32_t>(output.size() - data_start);
  output[length_pos] = encoded_length & 0xFF;
  output[length_pos + 1] = (encoded_length >> 8) & 0xFF;
  output[length_pos + 2] = (encoded_length >> 16) & 0xFF;
  output[length_pos + 3] = (encoded_length >> 24) & 0xFF;
}

//-----------------------------------------------------------------------------
// Decoder
//-----------------------------------------------------------------------------

HybridRleDecoder::HybridRleDecoder(const uint8_t* data, size_t size, uint8_t bit_width)
    : cursor_(data, size), bit_width_(bit_width) {
  if (bit_width_ > 32) {
    throw StudioException(ErrorCode::DECODE_ERROR,
                          "invalid RLE bit width " + std::to_string(bit_width_));
  }
}

bool HybridRleDecoder::next_run() {
  while (cursor_.remaining() > 0) {
    uint64_t header = cursor_.read_uvarint("RLE run header");
    if ((header & 1) == 0) {
      rle_remaining_ = static_cast<size_t>(header >> 1);
      size_t value_bytes = (bit_width_ + 7) / 8;
      const uint8_t* p = cursor_.take(value_bytes, "RLE run value");
      uint32_t value = 0;
      for (size_t b = 0; b < value_bytes; ++b) {
        value |= static_cast<uint32_t>(p[b]) << (b * 8);
      }
      rle_value_ = value;
    } else {
      size_t groups = static_cast<size_t>(std::min<uint64_t>(header >> 1, uint64_t(1) << 32));
      if (bit_width_ > 0 && groups > cursor_.remaining() + 1)
        truncated("bit-packed run");
      size_t bytes = groups * bit_width_; // 8 values * bit_width bits per group
      // The last run of a page may be shorter than its header claims
      bytes = std::min(bytes, cursor_.remaining());
      packed_ = cursor_.take(bytes, "bit-packed run");
      packed_remaining_ =
          bit_width_ == 0 ? groups * 8 : std::min(groups * 8, bytes * 8 / bit_width_);
      packed_index_ = 0;
    }
    if (rle_remaining_ > 0 || packed_remaining_ > 0)
      return true;
  }
  return false;
}

void HybridRleDecoder::decode(uint32_t* out, size_t count) {
  size_t produced = 0;
  const uint32_t mask = bit_width_ >= 32 ? 0xFFFFFFFFu : ((1u << bit_width_) - 1);

  while (produced < count) {
    if (rle_remaining_ == 0 && packed_remaining_ == 0 && !next_run()) {
      throw StudioException(ErrorCode::DECODE_ERROR,
                            "RLE data ended after " + std::to_string(produced) + " of " +
                                std::to_string(count) + " values");
    }

    if (rle_remaining_ > 0) {
      size_t n = std::min(rle_remaining_, count - produced);
      std::fill(out + produced, out + produced + n, rle_value_);
      produced += n;
      rle_remaining_ -= n;
      continue;
    }

    while (packed_remaining_ > 0 && produced < count) {
      uint32_t value = 0;
      if (bit_width_ > 0) {
        size_t bit_pos = packed_index_ * bit_width_;
        uint64_t window = 0;
        size_t first = bit_pos / 8;
        size_t last = (bit_pos + bit_width_ + 7) / 8;
        for (size_t b = first; b < last; ++b) {
          window |= static_cast<uint64_t>(packed_[b]) << ((b - first) * 8);
        }
        value = static_cast<uint32_t>(window >> (bit_pos % 8)) & mask;
      }
      out[produced++] = value;
      ++packed_index_;
      --packed_remaining_;
    }
  }
}

} // namespace encoding
} // namespace parquet
} // namespace pqstudio
