#pragma once

#include "parquet_types.h"
#include "pqstudio/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pqstudio {
namespace parquet {

// Map a user-facing compression choice to the Parquet codec recorded in
// ColumnMetaData. LZ4 is written as LZ4_RAW (plain block format).
CompressionCodec to_parquet_codec(Compression c);

const char* codec_name(CompressionCodec codec);

// True when this build links the library needed for codec
bool codec_available(Compression c);
bool codec_available(CompressionCodec codec);

// Compress one page. Codecs missing from this build, and failed compressions,
// return the input unchanged; callers detect that by comparing sizes.
std::vector<uint8_t> compress(const uint8_t* data, size_t size, Compression codec, int level);

// Decompress one page into exactly uncompressed_size bytes.
// @throws StudioException DECODE_ERROR on corrupt input or an unavailable codec
std::vector<uint8_t> decompress(const uint8_t* data, size_t size, CompressionCodec codec,
                                size_t uncompressed_size);

} // namespace parquet
} // namespace pqstudio
