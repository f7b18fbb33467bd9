#include "parquet_writer.h"

#include "compression.h"
#include "encoding/encoding.h"
#include "schema_mapping.h"
#include "thrift_compact.h"

#include "pqstudio/value_parsers.h"

#include "BS_thread_pool.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <future>
#include <limits>
#include <thread>
#include <type_traits>
#include <variant>

namespace pqstudio {
namespace parquet {

namespace {

// Parquet magic bytes
constexpr char PARQUET_MAGIC[] = "PAR1";

using StatValue = std::variant<std::monostate, int32_t, int64_t, float, double, std::string>;

// Plain-encoded form of a min/max value
std::vector<uint8_t> serialize_stat_value(const StatValue& val) {
  std::vector<uint8_t> result;
  std::visit(
      [&result](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          // Empty - do nothing
        } else if constexpr (std::is_same_v<T, std::string>) {
          result.insert(result.end(), v.begin(), v.end());
        } else {
          result.resize(sizeof(T));
          std::memcpy(result.data(), &v, sizeof(T));
        }
      },
      val);
  return result;
}

Statistics build_statistics(const ColumnVector& column, size_t begin, size_t end) {
  ColumnStatistics stats = column.statistics(begin, end);
  Statistics out;
  out.null_count = stats.null_count;
  if (stats.has_min_max()) {
    out.min_value = serialize_stat_value(stats.min_value);
    out.max_value = serialize_stat_value(stats.max_value);
  }
  return out;
}

// Decimal values stored as INT32 or INT64. validate_table has checked every
// unscaled value against the precision, which bounds it to T.
template <typename T>
void encode_decimal_narrow(const DecimalColumnVector& column, size_t begin, size_t end,
                           std::vector<uint8_t>& output) {
  const NullBitmap& nulls = column.null_bitmap();
  uint8_t bytes[sizeof(T)];
  for (size_t i = begin; i < end; ++i) {
    if (!nulls.is_valid(i))
      continue;
    T v = static_cast<T>(column.value(i));
    std::memcpy(bytes, &v, sizeof(T));
    output.insert(output.end(), bytes, bytes + sizeof(T));
  }
}

// Wide decimals: big-endian two's complement, `width` bytes each
void encode_decimal_fixed(const DecimalColumnVector& column, size_t begin, size_t end,
                          int32_t width, std::vector<uint8_t>& output) {
  const NullBitmap& nulls = column.null_bitmap();
  for (size_t i = begin; i < end; ++i) {
    if (!nulls.is_valid(i))
      continue;
    Int128 v = column.value(i); // arithmetic shift keeps the sign bytes
    for (int32_t b = width - 1; b >= 0; --b) {
      output.push_back(static_cast<uint8_t>((v >> (8 * b)) & 0xFF));
    }
  }
}

void encode_values(const ColumnVector& column, size_t begin, size_t end,
                   std::vector<uint8_t>& output) {
  using namespace encoding;
  const NullBitmap& nulls = column.null_bitmap();
  const LogicalType& type = column.type();

  switch (type.id) {
  case TypeId::BOOL: {
    const auto& vec = static_cast<const BoolColumnVector&>(column);
    encode_plain_bool(vec.values().data(), nulls, begin, end, output);
    break;
  }
  case TypeId::INT32:
  case TypeId::DATE: {
    const auto& vec = static_cast<const Int32ColumnVector&>(column);
    encode_plain(vec.values().data(), nulls, begin, end, output);
    break;
  }
  case TypeId::INT64:
  case TypeId::TIMESTAMP: {
    const auto& vec = static_cast<const Int64ColumnVector&>(column);
    encode_plain(vec.values().data(), nulls, begin, end, output);
    break;
  }
  case TypeId::FLOAT32: {
    const auto& vec = static_cast<const Float32ColumnVector&>(column);
    encode_plain(vec.values().data(), nulls, begin, end, output);
    break;
  }
  case TypeId::FLOAT64: {
    const auto& vec = static_cast<const Float64ColumnVector&>(column);
    encode_plain(vec.values().data(), nulls, begin, end, output);
    break;
  }
  case TypeId::STRING:
  case TypeId::BINARY: {
    const auto& vec = static_cast<const ByteArrayColumnVector&>(column);
    encode_plain_byte_array(vec.values(), nulls, begin, end, output);
    break;
  }
  case TypeId::DECIMAL: {
    const auto& vec = static_cast<const DecimalColumnVector&>(column);
    switch (physical_type(type)) {
    case ParquetType::INT32:
      encode_decimal_narrow<int32_t>(vec, begin, end, output);
      break;
    case ParquetType::INT64:
      encode_decimal_narrow<int64_t>(vec, begin, end, output);
      break;
    default:
      encode_decimal_fixed(vec, begin, end, decimal_byte_width(type.precision), output);
      break;
    }
    break;
  }
  }
}

[[noreturn]] void encode_error(const std::string& column, const std::string& message) {
  StudioError err(ErrorCode::ENCODE_ERROR, message);
  err.column = column;
  throw StudioException(std::move(err));
}

// Reject tables the file format cannot represent faithfully
void validate_table(const ColumnarTable& table) {
  for (size_t i = 0; i < table.num_columns(); ++i) {
    const FieldDescriptor& field = table.field(i);
    const ColumnVector* vec = table.column(i);

    if (!field.type) {
      encode_error(field.name, "field '" + field.name + "' has unsupported type " +
                                   field.source_type);
    }
    if (vec == nullptr) {
      encode_error(field.name, "field '" + field.name + "' has no column vector");
    }
    if (vec->type() != *field.type) {
      encode_error(field.name, "column '" + field.name + "' holds " + vec->type().to_string() +
                                   " values but is declared " + field.type->to_string());
    }
    if (vec->size() != table.num_rows()) {
      encode_error(field.name, "column '" + field.name + "' has " + std::to_string(vec->size()) +
                                   " values, expected " + std::to_string(table.num_rows()));
    }
    if (!field.nullable && vec->null_count() > 0) {
      size_t row = 0;
      while (row < vec->size() && !vec->is_null(row))
        ++row;
      StudioError err(ErrorCode::ENCODE_ERROR,
                      "null value in non-nullable column '" + field.name + "'");
      err.column = field.name;
      err.row = row;
      throw StudioException(std::move(err));
    }
    if (field.type->id == TypeId::DECIMAL) {
      const auto& decimals = static_cast<const DecimalColumnVector&>(*vec);
      for (size_t row = 0; row < decimals.size(); ++row) {
        if (decimals.is_null(row) || decimal_fits(decimals.value(row), field.type->precision))
          continue;
        StudioError err(ErrorCode::ENCODE_ERROR,
                        "decimal value " + format_decimal(decimals.value(row), field.type->scale) +
                            " in column '" + field.name + "' exceeds precision " +
                            std::to_string(field.type->precision));
        err.column = field.name;
        err.row = row;
        throw StudioException(std::move(err));
      }
    }
  }
}

Column to_column(const FieldDescriptor& field) { return {field.name, *field.type, field.nullable}; }

} // namespace

EncodedColumn encode_column(const ColumnVector& column, const Column& schema, size_t begin,
                            size_t end, const ParquetOptions& options) {
  EncodedColumn result;
  result.num_values = static_cast<int64_t>(end - begin);
  result.column_name = schema.name;
  result.physical_type = physical_type(schema.type);

  std::vector<uint8_t> page_content;

  // For OPTIONAL (nullable) columns, definition levels precede the values
  if (schema.nullable) {
    encoding::encode_def_levels(column.null_bitmap(), begin, end, page_content);
  }
  encode_values(column, begin, end, page_content);

  if (page_content.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
    encode_error(schema.name, "column chunk of '" + schema.name +
                                  "' exceeds the 2 GiB page limit; lower row_group_size");
  }

  int32_t uncompressed_size = static_cast<int32_t>(page_content.size());
  int32_t compressed_size = uncompressed_size;

  // Keep the compressed page only when it is actually smaller
  std::vector<uint8_t> compressed_content;
  result.actual_codec = CompressionCodec::UNCOMPRESSED;
  if (options.compression != Compression::NONE && codec_available(options.compression)) {
    compressed_content = compress(page_content.data(), page_content.size(), options.compression,
                                  options.compression_level);
    if (compressed_content.size() < page_content.size()) {
      compressed_size = static_cast<int32_t>(compressed_content.size());
      result.actual_codec = to_parquet_codec(options.compression);
    } else {
      compressed_content.clear();
    }
  }

  PageHeader page_header;
  page_header.type = PageType::DATA_PAGE;
  page_header.uncompressed_page_size = uncompressed_size;
  page_header.compressed_page_size = compressed_size;

  DataPageHeader data_header;
  data_header.num_values = static_cast<int32_t>(end - begin);
  data_header.encoding = ParquetEncoding::PLAIN;
  data_header.definition_level_encoding = ParquetEncoding::RLE;
  data_header.repetition_level_encoding = ParquetEncoding::RLE;
  page_header.data_page_header = data_header;

  ThriftCompactWriter header_writer(result.header_bytes);
  page_header.write(header_writer);

  result.content_bytes =
      compressed_content.empty() ? std::move(page_content) : std::move(compressed_content);
  result.uncompressed_size = uncompressed_size;
  result.compressed_size = compressed_size;

  if (options.write_statistics) {
    result.statistics = build_statistics(column, begin, end);
  }
  return result;
}

struct ParquetWriter::Impl {
  ParquetOptions options;
  std::vector<uint8_t> out;
  std::vector<RowGroup> row_groups;
  int64_t total_rows = 0;

  // Reusable thread pool for parallel encoding (created on first use)
  std::unique_ptr<BS::thread_pool> encoding_pool;

  BS::thread_pool& get_encoding_pool() {
    if (!encoding_pool) {
      size_t num_threads = options.num_threads;
      if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0)
          num_threads = 4;
      }
      encoding_pool = std::make_unique<BS::thread_pool>(num_threads);
    }
    return *encoding_pool;
  }

  int64_t current_offset() const { return static_cast<int64_t>(out.size()); }

  void write_bytes(const void* data, size_t size) {
    const auto* p = static_cast<const uint8_t*>(data);
    out.insert(out.end(), p, p + size);
  }

  void write_magic() { write_bytes(PARQUET_MAGIC, 4); }

  // Encode every column of rows [begin, end); columns run in parallel
  EncodedRowGroup encode_row_group(const ColumnarTable& table, const std::vector<Column>& schema,
                                   size_t begin, size_t end) {
    EncodedRowGroup result;
    result.num_rows = static_cast<int64_t>(end - begin);

    const size_t num_columns = schema.size();
    result.columns.resize(num_columns);

    if (num_columns > 1 && options.num_threads != 1) {
      BS::thread_pool& pool = get_encoding_pool();
      std::vector<std::future<void>> futures;
      futures.reserve(num_columns);

      for (size_t i = 0; i < num_columns; ++i) {
        futures.push_back(pool.submit_task([this, &table, &schema, &result, begin, end, i]() {
          result.columns[i] = encode_column(*table.column(i), schema[i], begin, end, options);
        }));
      }
      // Wait for every task before rethrowing, since they reference `result`
      std::exception_ptr first_error;
      for (auto& f : futures) {
        try {
          f.get();
        } catch (...) {
          if (!first_error)
            first_error = std::current_exception();
        }
      }
      if (first_error)
        std::rethrow_exception(first_error);
    } else {
      for (size_t i = 0; i < num_columns; ++i) {
        result.columns[i] = encode_column(*table.column(i), schema[i], begin, end, options);
      }
    }
    return result;
  }

  // Append a pre-encoded row group; must be called in row order
  void write_encoded_row_group(const EncodedRowGroup& encoded) {
    RowGroup row_group;
    row_group.num_rows = encoded.num_rows;
    row_group.file_offset = current_offset();
    row_group.total_byte_size = 0;
    row_group.total_compressed_size = 0;

    for (const auto& col : encoded.columns) {
      int64_t data_page_offset = current_offset();

      write_bytes(col.header_bytes.data(), col.header_bytes.size());
      write_bytes(col.content_bytes.data(), col.content_bytes.size());

      int64_t total_written =
          static_cast<int64_t>(col.header_bytes.size() + col.content_bytes.size());
      int64_t total_uncompressed =
          static_cast<int64_t>(col.header_bytes.size()) + col.uncompressed_size;

      ColumnMetaData meta;
      meta.type = col.physical_type;
      meta.encodings = {ParquetEncoding::PLAIN, ParquetEncoding::RLE};
      meta.path_in_schema = {col.column_name};
      meta.codec = col.actual_codec;
      meta.num_values = col.num_values;
      meta.total_uncompressed_size = total_uncompressed;
      meta.total_compressed_size = total_written;
      meta.data_page_offset = data_page_offset;
      meta.statistics = col.statistics;

      ColumnChunk chunk;
      chunk.file_offset = data_page_offset;
      chunk.meta_data = std::move(meta);

      row_group.columns.push_back(std::move(chunk));
      row_group.total_byte_size += total_uncompressed;
      row_group.total_compressed_size = *row_group.total_compressed_size + total_written;
    }

    total_rows += encoded.num_rows;
    row_groups.push_back(std::move(row_group));
  }

  void write_footer(const std::vector<Column>& schema) {
    FileMetaData file_meta;
    file_meta.version = 1;
    file_meta.num_rows = total_rows;
    file_meta.row_groups = std::move(row_groups);
    file_meta.created_by = options.created_by;

    // First element is the root
    SchemaElement root;
    root.name = "schema";
    root.num_children = static_cast<int32_t>(schema.size());
    file_meta.schema.push_back(root);
    for (const auto& col : schema) {
      file_meta.schema.push_back(to_schema_element(col));
    }

    file_meta.column_orders = std::vector<ColumnOrder>(schema.size());

    std::vector<uint8_t> metadata_buffer;
    ThriftCompactWriter thrift_writer(metadata_buffer);
    file_meta.write(thrift_writer);
    write_bytes(metadata_buffer.data(), metadata_buffer.size());

    // Metadata length, 4 bytes little-endian
    uint32_t metadata_len = static_cast<uint32_t>(metadata_buffer.size());
    uint8_t len_bytes[4] = {static_cast<uint8_t>(metadata_len & 0xFF),
                            static_cast<uint8_t>((metadata_len >> 8) & 0xFF),
                            static_cast<uint8_t>((metadata_len >> 16) & 0xFF),
                            static_cast<uint8_t>((metadata_len >> 24) & 0xFF)};
    write_bytes(len_bytes, 4);
    write_magic();
  }
};

ParquetWriter::ParquetWriter(const ParquetOptions& options) : impl_(std::make_unique<Impl>()) {
  impl_->options = options;
}

ParquetWriter::~ParquetWriter() = default;

std::vector<uint8_t> ParquetWriter::write(const ColumnarTable& table) {
  validate_table(table);

  std::vector<Column> schema;
  schema.reserve(table.num_columns());
  for (const auto& field : table.fields()) {
    schema.push_back(to_column(field));
  }

  impl_->out.clear();
  impl_->row_groups.clear();
  impl_->total_rows = 0;
  impl_->write_magic();

  const size_t num_rows = table.num_rows();
  size_t group_size = impl_->options.row_group_size == 0 ? num_rows : impl_->options.row_group_size;
  for (size_t begin = 0; begin < num_rows; begin += group_size) {
    size_t end = std::min(num_rows, begin + group_size);
    impl_->write_encoded_row_group(impl_->encode_row_group(table, schema, begin, end));
  }

  impl_->write_footer(schema);
  return std::move(impl_->out);
}

} // namespace parquet
} // namespace pqstudio
