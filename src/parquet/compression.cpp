#include "compression.h"

#include "pqstudio/error.h"

#include <climits>
#include <cstring>
#include <zlib.h>

#ifdef PQSTUDIO_HAVE_ZSTD
#include <zstd.h>
#endif

#ifdef PQSTUDIO_HAVE_SNAPPY
#include <snappy.h>
#endif

#ifdef PQSTUDIO_HAVE_LZ4
#include <lz4.h>
#endif

namespace pqstudio {
namespace parquet {

// Note: zlib uses uInt for buffer sizes, limiting single calls to ~4GB. Pages
// are far smaller; LZ4 has an INT_MAX limit which is checked explicitly.

namespace {

[[noreturn]] void corrupt_page(CompressionCodec codec, const std::string& detail) {
  throw StudioException(ErrorCode::DECODE_ERROR, std::string("cannot decompress ") +
                                                     codec_name(codec) + " page: " + detail);
}

std::vector<uint8_t> gzip_compress(const uint8_t* data, size_t size, int level) {
  std::vector<uint8_t> output;
  z_stream stream{};
  stream.zalloc = Z_NULL;
  stream.zfree = Z_NULL;
  stream.opaque = Z_NULL;

  if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION)
    level = Z_DEFAULT_COMPRESSION;

  // windowBits = 15 + 16 for gzip format
  if (deflateInit2(&stream, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    output.assign(data, data + size);
    return output;
  }

  stream.next_in = const_cast<Bytef*>(data);
  stream.avail_in = static_cast<uInt>(size);

  output.resize(deflateBound(&stream, size));
  stream.next_out = output.data();
  stream.avail_out = static_cast<uInt>(output.size());

  int result = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);

  if (result == Z_STREAM_END) {
    output.resize(stream.total_out);
  } else {
    output.assign(data, data + size);
  }
  return output;
}

std::vector<uint8_t> gzip_decompress(const uint8_t* data, size_t size, size_t expected) {
  std::vector<uint8_t> output(expected);
  z_stream stream{};
  stream.zalloc = Z_NULL;
  stream.zfree = Z_NULL;
  stream.opaque = Z_NULL;

  // 15 + 32: accept both gzip and zlib headers
  if (inflateInit2(&stream, 15 + 32) != Z_OK)
    corrupt_page(CompressionCodec::GZIP, "inflateInit2 failed");

  stream.next_in = const_cast<Bytef*>(data);
  stream.avail_in = static_cast<uInt>(size);
  stream.next_out = output.data();
  stream.avail_out = static_cast<uInt>(output.size());

  int result = inflate(&stream, Z_FINISH);
  size_t produced = stream.total_out;
  inflateEnd(&stream);

  if (result != Z_STREAM_END || produced != expected)
    corrupt_page(CompressionCodec::GZIP, "size or stream mismatch");
  return output;
}

#ifdef PQSTUDIO_HAVE_LZ4
std::vector<uint8_t> lz4_block_decompress(const uint8_t* data, size_t size, size_t expected,
                                          CompressionCodec codec) {
  if (size > static_cast<size_t>(INT_MAX) || expected > static_cast<size_t>(INT_MAX))
    corrupt_page(codec, "page too large");
  std::vector<uint8_t> output(expected);
  int n = LZ4_decompress_safe(reinterpret_cast<const char*>(data),
                              reinterpret_cast<char*>(output.data()), static_cast<int>(size),
                              static_cast<int>(expected));
  if (n < 0 || static_cast<size_t>(n) != expected)
    corrupt_page(codec, "corrupt block");
  return output;
}

uint32_t load_be32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

// Legacy LZ4 pages use Hadoop framing: [BE u32 raw size][BE u32 block size][block]...
// Some writers emitted raw blocks under the same codec id; fall back to that.
std::vector<uint8_t> lz4_hadoop_decompress(const uint8_t* data, size_t size, size_t expected) {
  std::vector<uint8_t> output;
  output.reserve(expected);
  size_t pos = 0;
  bool framed = true;
  while (pos < size) {
    if (size - pos < 8) {
      framed = false;
      break;
    }
    uint32_t raw = load_be32(data + pos);
    uint32_t block = load_be32(data + pos + 4);
    pos += 8;
    if (block > size - pos || raw > expected - output.size()) {
      framed = false;
      break;
    }
    size_t at = output.size();
    output.resize(at + raw);
    int n = LZ4_decompress_safe(reinterpret_cast<const char*>(data + pos),
                                reinterpret_cast<char*>(output.data() + at),
                                static_cast<int>(block), static_cast<int>(raw));
    if (n < 0 || static_cast<uint32_t>(n) != raw) {
      framed = false;
      break;
    }
    pos += block;
  }
  if (framed && output.size() == expected)
    return output;
  return lz4_block_decompress(data, size, expected, CompressionCodec::LZ4);
}
#endif

} // namespace

CompressionCodec to_parquet_codec(Compression c) {
  switch (c) {
  case Compression::NONE:
    return CompressionCodec::UNCOMPRESSED;
  case Compression::GZIP:
    return CompressionCodec::GZIP;
  case Compression::SNAPPY:
    return CompressionCodec::SNAPPY;
  case Compression::ZSTD:
    return CompressionCodec::ZSTD;
  case Compression::LZ4:
    return CompressionCodec::LZ4_RAW;
  default:
    return CompressionCodec::UNCOMPRESSED;
  }
}

const char* codec_name(CompressionCodec codec) {
  switch (codec) {
  case CompressionCodec::UNCOMPRESSED:
    return "UNCOMPRESSED";
  case CompressionCodec::SNAPPY:
    return "SNAPPY";
  case CompressionCodec::GZIP:
    return "GZIP";
  case CompressionCodec::LZO:
    return "LZO";
  case CompressionCodec::BROTLI:
    return "BROTLI";
  case CompressionCodec::LZ4:
    return "LZ4";
  case CompressionCodec::ZSTD:
    return "ZSTD";
  case CompressionCodec::LZ4_RAW:
    return "LZ4_RAW";
  }
  return "UNKNOWN";
}

bool codec_available(Compression c) { return codec_available(to_parquet_codec(c)); }

bool codec_available(CompressionCodec codec) {
  switch (codec) {
  case CompressionCodec::UNCOMPRESSED:
  case CompressionCodec::GZIP:
    return true;
#ifdef PQSTUDIO_HAVE_ZSTD
  case CompressionCodec::ZSTD:
    return true;
#endif
#ifdef PQSTUDIO_HAVE_SNAPPY
  case CompressionCodec::SNAPPY:
    return true;
#endif
#ifdef PQSTUDIO_HAVE_LZ4
  case CompressionCodec::LZ4:
  case CompressionCodec::LZ4_RAW:
    return true;
#endif
  default:
    return false;
  }
}

std::vector<uint8_t> compress(const uint8_t* data, size_t size, Compression codec, int level) {
  std::vector<uint8_t> output;

  if (size == 0) {
    return output;
  }

  switch (codec) {
  case Compression::NONE:
    output.assign(data, data + size);
    break;

#ifdef PQSTUDIO_HAVE_ZSTD
  case Compression::ZSTD: {
    size_t max_size = ZSTD_compressBound(size);
    output.resize(max_size);

    size_t compressed_size = ZSTD_compress(output.data(), max_size, data, size, level);

    if (ZSTD_isError(compressed_size)) {
      output.assign(data, data + size);
    } else {
      output.resize(compressed_size);
    }
    break;
  }
#endif

  case Compression::GZIP:
    output = gzip_compress(data, size, level);
    break;

#ifdef PQSTUDIO_HAVE_SNAPPY
  case Compression::SNAPPY: {
    size_t max_size = snappy::MaxCompressedLength(size);
    output.resize(max_size);

    size_t compressed_size;
    snappy::RawCompress(reinterpret_cast<const char*>(data), size,
                        reinterpret_cast<char*>(output.data()), &compressed_size);

    output.resize(compressed_size);
    break;
  }
#endif

#ifdef PQSTUDIO_HAVE_LZ4
  case Compression::LZ4: {
    if (size > static_cast<size_t>(INT32_MAX)) {
      output.assign(data, data + size);
      break;
    }
    int max_size = LZ4_compressBound(static_cast<int>(size));
    output.resize(max_size);

    int compressed_size = LZ4_compress_default(reinterpret_cast<const char*>(data),
                                               reinterpret_cast<char*>(output.data()),
                                               static_cast<int>(size), max_size);

    if (compressed_size > 0) {
      output.resize(compressed_size);
    } else {
      output.assign(data, data + size);
    }
    break;
  }
#endif

  default:
    // Codec not built in - return uncompressed
    output.assign(data, data + size);
    break;
  }

  return output;
}

std::vector<uint8_t> decompress(const uint8_t* data, size_t size, CompressionCodec codec,
                                size_t uncompressed_size) {
  switch (codec) {
  case CompressionCodec::UNCOMPRESSED:
    if (size != uncompressed_size)
      corrupt_page(codec, "page size mismatch");
    return std::vector<uint8_t>(data, data + size);

  case CompressionCodec::GZIP:
    if (uncompressed_size == 0)
      return {};
    return gzip_decompress(data, size, uncompressed_size);

#ifdef PQSTUDIO_HAVE_ZSTD
  case CompressionCodec::ZSTD: {
    std::vector<uint8_t> output(uncompressed_size);
    size_t n = ZSTD_decompress(output.data(), output.size(), data, size);
    if (ZSTD_isError(n))
      corrupt_page(codec, ZSTD_getErrorName(n));
    if (n != uncompressed_size)
      corrupt_page(codec, "size mismatch");
    return output;
  }
#endif

#ifdef PQSTUDIO_HAVE_SNAPPY
  case CompressionCodec::SNAPPY: {
    size_t length = 0;
    const char* src = reinterpret_cast<const char*>(data);
    if (!snappy::GetUncompressedLength(src, size, &length) || length != uncompressed_size)
      corrupt_page(codec, "size mismatch");
    std::vector<uint8_t> output(length);
    if (length > 0 && !snappy::RawUncompress(src, size, reinterpret_cast<char*>(output.data())))
      corrupt_page(codec, "corrupt stream");
    return output;
  }
#endif

#ifdef PQSTUDIO_HAVE_LZ4
  case CompressionCodec::LZ4_RAW:
    if (uncompressed_size == 0)
      return {};
    return lz4_block_decompress(data, size, uncompressed_size, codec);
  case CompressionCodec::LZ4:
    if (uncompressed_size == 0)
      return {};
    return lz4_hadoop_decompress(data, size, uncompressed_size);
#endif

  default:
    throw StudioException(ErrorCode::DECODE_ERROR, std::string("unsupported compression codec ") +
                                                       codec_name(codec));
  }
}

} // namespace parquet
} // namespace pqstudio
