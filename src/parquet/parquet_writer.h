#pragma once

#include "parquet_types.h"
#include "pqstudio/columnar_table.h"
#include "pqstudio/options.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pqstudio {
namespace parquet {

// Pre-encoded column chunk, ready for writing. Columns of a row group are
// encoded in parallel, then written sequentially.
struct EncodedColumn {
  std::vector<uint8_t> header_bytes;  // Serialized page header
  std::vector<uint8_t> content_bytes; // Page content (possibly compressed)
  int64_t num_values = 0;
  int64_t uncompressed_size = 0;
  int64_t compressed_size = 0;
  std::optional<Statistics> statistics;
  CompressionCodec actual_codec = CompressionCodec::UNCOMPRESSED;
  ParquetType physical_type = ParquetType::INT32;
  std::string column_name;
};

struct EncodedRowGroup {
  std::vector<EncodedColumn> columns;
  int64_t num_rows = 0;
};

// Encode rows [begin, end) of one column as a single V1 data page
EncodedColumn encode_column(const ColumnVector& column, const Column& schema, size_t begin,
                            size_t end, const ParquetOptions& options);

/**
 * @brief Serializes a ColumnarTable to an in-memory Parquet file.
 *
 * Layout: "PAR1", one row group per ParquetOptions::row_group_size rows with
 * one PLAIN data page per column chunk, the Thrift compact FileMetaData, its
 * 4-byte little-endian length, and "PAR1".
 *
 * @throws StudioException ENCODE_ERROR when the table breaks a structural
 *         rule: a field without a supported type, a missing vector, a vector
 *         whose type or length disagrees with its field, or a null in a
 *         non-nullable column
 */
class ParquetWriter {
public:
  explicit ParquetWriter(const ParquetOptions& options = {});
  ~ParquetWriter();

  ParquetWriter(const ParquetWriter&) = delete;
  ParquetWriter& operator=(const ParquetWriter&) = delete;

  std::vector<uint8_t> write(const ColumnarTable& table);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace parquet
} // namespace pqstudio
