#include "pqstudio/codec.h"

#include "parquet/compression.h"
#include "parquet/parquet_reader.h"
#include "parquet/parquet_writer.h"

#include <new>
#include <stdexcept>

namespace pqstudio {

std::shared_ptr<ColumnarTable> ParquetCodec::decode(std::span<const uint8_t> bytes) {
  try {
    parquet::ParquetReader reader(bytes.data(), bytes.size());
    return reader.read();
  } catch (const std::bad_alloc&) {
    // Sizes in a corrupt footer or page header can demand absurd buffers
    throw StudioException(ErrorCode::DECODE_ERROR,
                          "file declares sizes too large to decode (corrupt metadata?)");
  } catch (const std::length_error&) {
    throw StudioException(ErrorCode::DECODE_ERROR,
                          "file declares sizes too large to decode (corrupt metadata?)");
  }
}

std::vector<uint8_t> ParquetCodec::encode(const ColumnarTable& table) {
  parquet::ParquetWriter writer(options_);
  return writer.write(table);
}

bool compression_available(Compression c) { return parquet::codec_available(c); }

} // namespace pqstudio
