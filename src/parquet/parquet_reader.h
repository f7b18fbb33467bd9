#pragma once

#include "parquet_types.h"
#include "pqstudio/columnar_table.h"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace pqstudio {
namespace parquet {

/**
 * @brief Decodes an in-memory Parquet file into a ColumnarTable.
 *
 * Only flat schemas of top-level primitive columns are materialized. Nested
 * groups, repeated fields and primitive types without a LogicalType are
 * reported as fields with no type and no vector, so the load pipeline can
 * name them.
 *
 * Supported pages: data page V1 and V2, dictionary pages. Supported value
 * encodings: PLAIN, PLAIN_DICTIONARY/RLE_DICTIONARY, RLE (booleans),
 * DELTA_BINARY_PACKED, DELTA_LENGTH_BYTE_ARRAY, DELTA_BYTE_ARRAY and
 * BYTE_STREAM_SPLIT.
 *
 * Every structural problem throws StudioException(DECODE_ERROR). The input
 * buffer must outlive the reader.
 */
class ParquetReader {
public:
  // Validates the magic bytes and parses the footer
  ParquetReader(const uint8_t* data, size_t size);

  const FileMetaData& metadata() const { return metadata_; }

  std::shared_ptr<ColumnarTable> read() const;

private:
  const uint8_t* data_;
  size_t size_;
  size_t data_end_ = 0; // First byte of the footer
  FileMetaData metadata_;
};

} // namespace parquet
} // namespace pqstudio
