#pragma once

#include "thrift_compact.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pqstudio {
namespace parquet {

// Parquet physical types (from parquet.thrift)
enum class ParquetType : int32_t {
  BOOLEAN = 0,
  INT32 = 1,
  INT64 = 2,
  INT96 = 3, // deprecated
  FLOAT = 4,
  DOUBLE = 5,
  BYTE_ARRAY = 6,
  FIXED_LEN_BYTE_ARRAY = 7
};

enum class FieldRepetitionType : int32_t { REQUIRED = 0, OPTIONAL = 1, REPEATED = 2 };

enum class ParquetEncoding : int32_t {
  PLAIN = 0,
  PLAIN_DICTIONARY = 2,
  RLE = 3,
  BIT_PACKED = 4,
  DELTA_BINARY_PACKED = 5,
  DELTA_LENGTH_BYTE_ARRAY = 6,
  DELTA_BYTE_ARRAY = 7,
  RLE_DICTIONARY = 8,
  BYTE_STREAM_SPLIT = 9
};

enum class CompressionCodec : int32_t {
  UNCOMPRESSED = 0,
  SNAPPY = 1,
  GZIP = 2,
  LZO = 3,
  BROTLI = 4,
  LZ4 = 5,
  ZSTD = 6,
  LZ4_RAW = 7
};

enum class PageType : int32_t {
  DATA_PAGE = 0,
  INDEX_PAGE = 1,
  DICTIONARY_PAGE = 2,
  DATA_PAGE_V2 = 3
};

// Converted types (legacy annotations, still written for older readers)
enum class ConvertedType : int32_t {
  UTF8 = 0,
  MAP = 1,
  MAP_KEY_VALUE = 2,
  LIST = 3,
  ENUM = 4,
  DECIMAL = 5,
  DATE = 6,
  TIME_MILLIS = 7,
  TIME_MICROS = 8,
  TIMESTAMP_MILLIS = 9,
  TIMESTAMP_MICROS = 10,
  UINT_8 = 11,
  UINT_16 = 12,
  UINT_32 = 13,
  UINT_64 = 14,
  INT_8 = 15,
  INT_16 = 16,
  INT_32 = 17,
  INT_64 = 18,
  JSON = 19,
  BSON = 20,
  INTERVAL = 21
};

const char* physical_type_name(ParquetType type);
const char* converted_type_name(ConvertedType type);
const char* encoding_name(ParquetEncoding encoding);

// TimeUnit union member ids
enum class TimeUnitKind : int16_t { MILLIS = 1, MICROS = 2, NANOS = 3 };

/**
 * LogicalType union. Member ids follow parquet.thrift; only the parameters
 * of members this engine can map are kept. Members it cannot map are read
 * so the schema can report them by name.
 */
struct LogicalTypeAnnotation {
  enum class Kind : int16_t {
    NONE = 0,
    STRING = 1,
    MAP = 2,
    LIST = 3,
    ENUM = 4,
    DECIMAL = 5,
    DATE = 6,
    TIME = 7,
    TIMESTAMP = 8,
    INTEGER = 10,
    UNKNOWN = 11,
    JSON = 12,
    BSON = 13,
    UUID = 14,
    FLOAT16 = 15
  };

  Kind kind = Kind::NONE;
  int32_t scale = 0;                          // DECIMAL field 1
  int32_t precision = 0;                      // DECIMAL field 2
  bool is_adjusted_to_utc = false;            // TIME/TIMESTAMP field 1
  TimeUnitKind unit = TimeUnitKind::MILLIS;   // TIME/TIMESTAMP field 2
  int8_t bit_width = 0;                       // INTEGER field 1
  bool is_signed = true;                      // INTEGER field 2

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);

  static const char* kind_name(Kind kind);
};

// Statistics for columns and pages
struct Statistics {
  std::optional<std::vector<uint8_t>> max;       // field 1
  std::optional<std::vector<uint8_t>> min;       // field 2
  std::optional<int64_t> null_count;             // field 3
  std::optional<int64_t> distinct_count;         // field 4
  std::optional<std::vector<uint8_t>> max_value; // field 5
  std::optional<std::vector<uint8_t>> min_value; // field 6

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

// Schema element (column or group definition)
struct SchemaElement {
  std::optional<ParquetType> type;                    // field 1
  std::optional<int32_t> type_length;                 // field 2
  std::optional<FieldRepetitionType> repetition_type; // field 3
  std::string name;                                   // field 4 (required)
  std::optional<int32_t> num_children;                // field 5
  std::optional<ConvertedType> converted_type;        // field 6
  std::optional<int32_t> scale;                       // field 7
  std::optional<int32_t> precision;                   // field 8
  std::optional<int32_t> field_id;                    // field 9
  std::optional<LogicalTypeAnnotation> logical_type;  // field 10

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

// Data page header (V1)
struct DataPageHeader {
  int32_t num_values = 0;                                               // field 1 (required)
  ParquetEncoding encoding = ParquetEncoding::PLAIN;                    // field 2 (required)
  ParquetEncoding definition_level_encoding = ParquetEncoding::RLE;     // field 3 (required)
  ParquetEncoding repetition_level_encoding = ParquetEncoding::RLE;     // field 4 (required)
  std::optional<Statistics> statistics;                                 // field 5

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

struct DictionaryPageHeader {
  int32_t num_values = 0;                            // field 1 (required)
  ParquetEncoding encoding = ParquetEncoding::PLAIN; // field 2 (required)
  std::optional<bool> is_sorted;                     // field 3

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

// Data page header V2: levels are stored uncompressed ahead of the values
struct DataPageHeaderV2 {
  int32_t num_values = 0;                            // field 1 (required)
  int32_t num_nulls = 0;                             // field 2 (required)
  int32_t num_rows = 0;                              // field 3 (required)
  ParquetEncoding encoding = ParquetEncoding::PLAIN; // field 4 (required)
  int32_t definition_levels_byte_length = 0;         // field 5 (required)
  int32_t repetition_levels_byte_length = 0;         // field 6 (required)
  std::optional<bool> is_compressed;                 // field 7 (default true)
  std::optional<Statistics> statistics;              // field 8

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

struct PageHeader {
  PageType type = PageType::DATA_PAGE;                        // field 1 (required)
  int32_t uncompressed_page_size = 0;                         // field 2 (required)
  int32_t compressed_page_size = 0;                           // field 3 (required)
  std::optional<int32_t> crc;                                 // field 4
  std::optional<DataPageHeader> data_page_header;             // field 5
  std::optional<DictionaryPageHeader> dictionary_page_header; // field 7
  std::optional<DataPageHeaderV2> data_page_header_v2;        // field 8

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

struct KeyValue {
  std::string key;                  // field 1 (required)
  std::optional<std::string> value; // field 2

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

struct ColumnMetaData {
  ParquetType type = ParquetType::INT32;               // field 1 (required)
  std::vector<ParquetEncoding> encodings;              // field 2 (required)
  std::vector<std::string> path_in_schema;             // field 3 (required)
  CompressionCodec codec = CompressionCodec::UNCOMPRESSED; // field 4 (required)
  int64_t num_values = 0;                              // field 5 (required)
  int64_t total_uncompressed_size = 0;                 // field 6 (required)
  int64_t total_compressed_size = 0;                   // field 7 (required)
  int64_t data_page_offset = 0;                        // field 9 (required)
  std::optional<int64_t> dictionary_page_offset;       // field 11
  std::optional<Statistics> statistics;                // field 12

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

struct ColumnChunk {
  std::optional<std::string> file_path;    // field 1
  int64_t file_offset = 0;                 // field 2 (required, default 0)
  std::optional<ColumnMetaData> meta_data; // field 3

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

struct RowGroup {
  std::vector<ColumnChunk> columns;             // field 1 (required)
  int64_t total_byte_size = 0;                  // field 2 (required)
  int64_t num_rows = 0;                         // field 3 (required)
  std::optional<int64_t> file_offset;           // field 5
  std::optional<int64_t> total_compressed_size; // field 6

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

// Column order union; TYPE_ORDER (field 1, an empty struct) is the only member
struct ColumnOrder {
  void write(ThriftCompactWriter& writer) const;
};

// File metadata (root structure of the footer)
struct FileMetaData {
  int32_t version = 1;                                     // field 1 (required)
  std::vector<SchemaElement> schema;                       // field 2 (required)
  int64_t num_rows = 0;                                    // field 3 (required)
  std::vector<RowGroup> row_groups;                        // field 4 (required)
  std::optional<std::vector<KeyValue>> key_value_metadata; // field 5
  std::optional<std::string> created_by;                   // field 6
  std::optional<std::vector<ColumnOrder>> column_orders;   // field 7

  void write(ThriftCompactWriter& writer) const;
  void read(ThriftCompactReader& reader);
};

} // namespace parquet
} // namespace pqstudio
