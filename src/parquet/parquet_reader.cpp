#include "parquet_reader.h"

#include "compression.h"
#include "encoding/encoding.h"
#include "schema_mapping.h"
#include "thrift_compact.h"

#include "pqstudio/value_parsers.h"

#include <algorithm>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace pqstudio {
namespace parquet {

namespace {

constexpr char PARQUET_MAGIC[] = "PAR1";
constexpr int MAX_SCHEMA_DEPTH = 64;

[[noreturn]] void decode_error(const std::string& message) {
  throw StudioException(ErrorCode::DECODE_ERROR, message);
}

[[noreturn]] void column_error(const std::string& column, const std::string& message) {
  StudioError err(ErrorCode::DECODE_ERROR, "column '" + column + "': " + message);
  err.column = column;
  throw StudioException(std::move(err));
}

// A top-level primitive column the reader materializes
struct LeafColumn {
  size_t field_index;   // position among top-level fields
  size_t chunk_index;   // position among all leaves, i.e. in RowGroup::columns
  const SchemaElement* element;
  LogicalType type;
  bool optional;        // max definition level 1
};

// Skip the subtree rooted at `pos`, counting its leaves. Returns the index
// after the subtree.
size_t skip_subtree(const std::vector<SchemaElement>& schema, size_t pos, size_t& leaves,
                    int depth) {
  if (depth > MAX_SCHEMA_DEPTH)
    decode_error("schema nesting is too deep");
  if (pos >= schema.size())
    decode_error("schema tree is truncated");

  const SchemaElement& elem = schema[pos];
  if (elem.type) {
    ++leaves;
    return pos + 1;
  }
  int32_t children = elem.num_children.value_or(0);
  if (children < 0 || static_cast<size_t>(children) > schema.size() - pos - 1)
    decode_error("schema group '" + elem.name + "' has an invalid child count");
  ++pos;
  for (int32_t c = 0; c < children; ++c) {
    pos = skip_subtree(schema, pos, leaves, depth + 1);
  }
  return pos;
}

//-----------------------------------------------------------------------------
// Physical value decoding
//-----------------------------------------------------------------------------

// Values of one column chunk in their physical representation:
//   BOOLEAN -> uint8_t, INT32 -> int32_t, INT64 -> int64_t, FLOAT -> float,
//   DOUBLE -> double, BYTE_ARRAY / FIXED_LEN_BYTE_ARRAY -> std::string
template <typename V> class ChunkDecoder {
public:
  ChunkDecoder(const LeafColumn& leaf, const uint8_t* file, size_t data_end)
      : leaf_(leaf), name_(leaf.element->name), file_(file), data_end_(data_end) {
    if constexpr (std::is_same_v<V, std::string>) {
      if (*leaf.element->type == ParquetType::FIXED_LEN_BYTE_ARRAY) {
        int32_t len = leaf.element->type_length.value_or(0);
        if (len <= 0)
          column_error(name_, "FIXED_LEN_BYTE_ARRAY without a positive type_length");
        fixed_width_ = static_cast<size_t>(len);
      }
    }
  }

  // Decode one column chunk holding exactly `rows` values into `out`
  void read_chunk(const ColumnMetaData& meta, size_t rows, ColumnVector& out) {
    if (meta.type != *leaf_.element->type) {
      column_error(name_, std::string("chunk stores ") + physical_type_name(meta.type) +
                              " but the schema declares " +
                              physical_type_name(*leaf_.element->type));
    }
    if (meta.num_values < 0 || static_cast<uint64_t>(meta.num_values) != rows) {
      column_error(name_, "chunk holds " + std::to_string(meta.num_values) +
                              " values, row group has " + std::to_string(rows));
    }

    int64_t start = meta.data_page_offset;
    if (meta.dictionary_page_offset && *meta.dictionary_page_offset > 0 &&
        *meta.dictionary_page_offset < start) {
      start = *meta.dictionary_page_offset;
    }
    if (start < 4 || meta.total_compressed_size < 0 ||
        static_cast<uint64_t>(start) > data_end_ ||
        static_cast<uint64_t>(meta.total_compressed_size) > data_end_ - start) {
      column_error(name_, "chunk byte range lies outside the file");
    }

    dictionary_.clear();
    has_dictionary_ = false;

    size_t pos = static_cast<size_t>(start);
    size_t end = pos + static_cast<size_t>(meta.total_compressed_size);
    size_t values_read = 0;
    while (values_read < rows) {
      if (pos >= end)
        column_error(name_, "chunk ended after " + std::to_string(values_read) + " of " +
                                std::to_string(rows) + " values");

      ThriftCompactReader header_reader(file_ + pos, end - pos);
      PageHeader header;
      header.read(header_reader);
      pos += header_reader.position();

      if (header.compressed_page_size < 0 || header.uncompressed_page_size < 0 ||
          static_cast<size_t>(header.compressed_page_size) > end - pos) {
        column_error(name_, "page size is out of range");
      }
      const uint8_t* page = file_ + pos;
      size_t page_size = static_cast<size_t>(header.compressed_page_size);
      pos += page_size;

      switch (header.type) {
      case PageType::DICTIONARY_PAGE:
        read_dictionary_page(header, meta.codec, page, page_size);
        break;
      case PageType::DATA_PAGE:
        values_read += read_data_page_v1(header, meta.codec, page, page_size, rows - values_read,
                                         out);
        break;
      case PageType::DATA_PAGE_V2:
        values_read += read_data_page_v2(header, meta.codec, page, page_size, rows - values_read,
                                         out);
        break;
      default:
        // Index pages carry nothing needed to rebuild values
        break;
      }
    }
  }

private:
  void read_dictionary_page(const PageHeader& header, CompressionCodec codec, const uint8_t* page,
                            size_t page_size) {
    if (!header.dictionary_page_header)
      column_error(name_, "dictionary page without a dictionary header");
    const DictionaryPageHeader& dict = *header.dictionary_page_header;
    if (dict.num_values < 0)
      column_error(name_, "negative dictionary size");
    if (dict.encoding != ParquetEncoding::PLAIN &&
        dict.encoding != ParquetEncoding::PLAIN_DICTIONARY) {
      column_error(name_, std::string("unsupported dictionary encoding ") +
                              encoding_name(dict.encoding));
    }

    std::vector<uint8_t> bytes =
        decompress(page, page_size, codec, static_cast<size_t>(header.uncompressed_page_size));
    encoding::ByteCursor in(bytes.data(), bytes.size());
    dictionary_.clear();
    decode_plain_values(in, static_cast<size_t>(dict.num_values), dictionary_);
    has_dictionary_ = true;
  }

  size_t read_data_page_v1(const PageHeader& header, CompressionCodec codec, const uint8_t* page,
                           size_t page_size, size_t rows_left, ColumnVector& out) {
    if (!header.data_page_header)
      column_error(name_, "data page without a data page header");
    const DataPageHeader& dp = *header.data_page_header;
    size_t num_values = checked_page_values(dp.num_values, rows_left);

    std::vector<uint8_t> bytes =
        decompress(page, page_size, codec, static_cast<size_t>(header.uncompressed_page_size));
    encoding::ByteCursor in(bytes.data(), bytes.size());

    std::vector<uint32_t> def_levels;
    size_t non_null = num_values;
    if (leaf_.optional) {
      if (dp.definition_level_encoding != ParquetEncoding::RLE) {
        column_error(name_, std::string("unsupported definition level encoding ") +
                                encoding_name(dp.definition_level_encoding));
      }
      uint32_t len = in.read_u32_le("definition levels length");
      const uint8_t* levels = in.take(len, "definition levels");
      non_null = decode_levels(levels, len, num_values, def_levels);
    }

    std::vector<V> values;
    decode_values(dp.encoding, in, non_null, values);
    append(values, def_levels, num_values, out);
    return num_values;
  }

  size_t read_data_page_v2(const PageHeader& header, CompressionCodec codec, const uint8_t* page,
                           size_t page_size, size_t rows_left, ColumnVector& out) {
    if (!header.data_page_header_v2)
      column_error(name_, "data page V2 without a data page header");
    const DataPageHeaderV2& dp = *header.data_page_header_v2;
    size_t num_values = checked_page_values(dp.num_values, rows_left);

    if (dp.definition_levels_byte_length < 0 || dp.repetition_levels_byte_length < 0)
      column_error(name_, "negative level length");
    size_t def_len = static_cast<size_t>(dp.definition_levels_byte_length);
    size_t rep_len = static_cast<size_t>(dp.repetition_levels_byte_length);
    if (def_len > page_size || rep_len > page_size - def_len ||
        def_len + rep_len > static_cast<size_t>(header.uncompressed_page_size)) {
      column_error(name_, "level lengths exceed the page");
    }

    // Levels are never compressed; repetition levels come first
    const uint8_t* levels = page + rep_len;
    std::vector<uint32_t> def_levels;
    size_t non_null = num_values;
    if (leaf_.optional) {
      non_null = decode_levels(levels, def_len, num_values, def_levels);
    }

    const uint8_t* body = page + rep_len + def_len;
    size_t body_size = page_size - rep_len - def_len;
    size_t body_uncompressed =
        static_cast<size_t>(header.uncompressed_page_size) - rep_len - def_len;

    std::vector<uint8_t> bytes;
    if (dp.is_compressed.value_or(true)) {
      bytes = decompress(body, body_size, codec, body_uncompressed);
    } else {
      bytes.assign(body, body + body_size);
    }
    encoding::ByteCursor in(bytes.data(), bytes.size());

    std::vector<V> values;
    decode_values(dp.encoding, in, non_null, values);
    append(values, def_levels, num_values, out);
    return num_values;
  }

  size_t checked_page_values(int32_t declared, size_t rows_left) const {
    if (declared < 0 || static_cast<size_t>(declared) > rows_left) {
      column_error(name_, "page declares " + std::to_string(declared) + " values, " +
                              std::to_string(rows_left) + " rows remain in the row group");
    }
    return static_cast<size_t>(declared);
  }

  // Decode definition levels (max level 1); returns the number of present values
  size_t decode_levels(const uint8_t* data, size_t size, size_t count,
                       std::vector<uint32_t>& levels) const {
    levels.resize(count);
    encoding::HybridRleDecoder decoder(data, size, 1);
    decoder.decode(levels.data(), count);
    size_t present = 0;
    for (uint32_t level : levels) {
      if (level > 1)
        column_error(name_, "definition level " + std::to_string(level) + " exceeds 1");
      present += level;
    }
    return present;
  }

  void decode_plain_values(encoding::ByteCursor& in, size_t count, std::vector<V>& out) const {
    using namespace encoding;
    if constexpr (std::is_same_v<V, uint8_t>) {
      decode_plain_bool(in, count, out);
    } else if constexpr (std::is_same_v<V, std::string>) {
      if (fixed_width_ > 0)
        decode_plain_fixed_len(in, count, fixed_width_, out);
      else
        decode_plain_byte_array(in, count, out);
    } else {
      decode_plain<V>(in, count, out);
    }
  }

  void decode_dictionary_indices(encoding::ByteCursor& in, size_t count,
                                 std::vector<V>& out) const {
    if (!has_dictionary_)
      column_error(name_, "dictionary-encoded page without a dictionary page");
    uint8_t bit_width = in.read_u8("dictionary index bit width");
    std::vector<uint32_t> indices(count);
    encoding::HybridRleDecoder decoder(in.current(), in.remaining(), bit_width);
    decoder.decode(indices.data(), count);

    out.reserve(out.size() + count);
    for (uint32_t idx : indices) {
      if (idx >= dictionary_.size()) {
        column_error(name_, "dictionary index " + std::to_string(idx) + " out of range (" +
                                std::to_string(dictionary_.size()) + " entries)");
      }
      out.push_back(dictionary_[idx]);
    }
  }

  void decode_values(ParquetEncoding enc, encoding::ByteCursor& in, size_t count,
                     std::vector<V>& out) const {
    using namespace encoding;
    if (count == 0)
      return;

    switch (enc) {
    case ParquetEncoding::PLAIN:
      decode_plain_values(in, count, out);
      return;
    case ParquetEncoding::PLAIN_DICTIONARY:
    case ParquetEncoding::RLE_DICTIONARY:
      decode_dictionary_indices(in, count, out);
      return;
    case ParquetEncoding::RLE:
      if constexpr (std::is_same_v<V, uint8_t>) {
        decode_rle_bool(in, count, out);
        return;
      }
      break;
    case ParquetEncoding::DELTA_BINARY_PACKED:
      if constexpr (std::is_same_v<V, int32_t> || std::is_same_v<V, int64_t>) {
        decode_delta_binary_packed<V>(in, count, out);
        return;
      }
      break;
    case ParquetEncoding::DELTA_LENGTH_BYTE_ARRAY:
      if constexpr (std::is_same_v<V, std::string>) {
        if (fixed_width_ == 0) {
          decode_delta_length_byte_array(in, count, out);
          return;
        }
      }
      break;
    case ParquetEncoding::DELTA_BYTE_ARRAY:
      if constexpr (std::is_same_v<V, std::string>) {
        decode_delta_byte_array(in, count, out);
        if (fixed_width_ > 0) {
          for (size_t i = out.size() - count; i < out.size(); ++i) {
            if (out[i].size() != fixed_width_)
              column_error(name_, "DELTA_BYTE_ARRAY value has the wrong fixed length");
          }
        }
        return;
      }
      break;
    case ParquetEncoding::BYTE_STREAM_SPLIT:
      if constexpr (std::is_same_v<V, int32_t> || std::is_same_v<V, int64_t> ||
                    std::is_same_v<V, float> || std::is_same_v<V, double>) {
        decode_byte_stream_split<V>(in, count, out);
        return;
      }
      break;
    default:
      break;
    }
    column_error(name_, std::string("unsupported encoding ") + encoding_name(enc) + " for " +
                            physical_type_name(*leaf_.element->type));
  }

  // Append one page of values, interleaving nulls from the definition levels
  void append(const std::vector<V>& values, const std::vector<uint32_t>& def_levels,
              size_t num_values, ColumnVector& out) const {
    size_t present = num_values;
    if (!def_levels.empty())
      present = static_cast<size_t>(std::count(def_levels.begin(), def_levels.end(), 1u));
    if (values.size() != present) {
      column_error(name_, "page decoded " + std::to_string(values.size()) + " values, expected " +
                              std::to_string(present));
    }
    size_t vi = 0;
    for (size_t i = 0; i < num_values; ++i) {
      if (!def_levels.empty() && def_levels[i] == 0) {
        out.append_null();
        continue;
      }
      append_value(values[vi++], out);
    }
  }

  void append_value(const V& v, ColumnVector& out) const {
    const LogicalType& type = leaf_.type;
    if constexpr (std::is_same_v<V, std::string>) {
      if (type.id == TypeId::DECIMAL) {
        Int128 unscaled = checked_decimal(decimal_from_bytes(v));
        static_cast<DecimalColumnVector&>(out).append_value(unscaled);
      } else {
        static_cast<ByteArrayColumnVector&>(out).append_value(v);
      }
    } else if constexpr (std::is_same_v<V, int32_t> || std::is_same_v<V, int64_t>) {
      if (type.id == TypeId::DECIMAL) {
        Int128 unscaled = checked_decimal(static_cast<Int128>(v));
        static_cast<DecimalColumnVector&>(out).append_value(unscaled);
      } else {
        static_cast<FixedWidthColumnVector<V>&>(out).append_value(v);
      }
    } else {
      static_cast<FixedWidthColumnVector<V>&>(out).append_value(v);
    }
  }

  Int128 checked_decimal(Int128 unscaled) const {
    if (!decimal_fits(unscaled, leaf_.type.precision)) {
      column_error(name_, "decimal value " + format_decimal(unscaled, leaf_.type.scale) +
                              " exceeds precision " + std::to_string(leaf_.type.precision));
    }
    return unscaled;
  }

  // Big-endian two's complement, at most 16 bytes
  Int128 decimal_from_bytes(const std::string& bytes) const {
    if (bytes.size() > 16)
      column_error(name_, "decimal value wider than 16 bytes");
    if (bytes.empty())
      return 0;
    Int128 v = static_cast<int8_t>(bytes[0]); // sign-extends
    for (size_t i = 1; i < bytes.size(); ++i) {
      v = static_cast<Int128>(static_cast<unsigned __int128>(v) << 8) |
          static_cast<uint8_t>(bytes[i]);
    }
    return v;
  }

  const LeafColumn& leaf_;
  std::string name_;
  const uint8_t* file_;
  size_t data_end_;
  size_t fixed_width_ = 0;
  std::vector<V> dictionary_;
  bool has_dictionary_ = false;
};

template <typename V>
void read_leaf(const LeafColumn& leaf, const FileMetaData& meta, const uint8_t* file,
               size_t data_end, ColumnVector& out) {
  ChunkDecoder<V> decoder(leaf, file, data_end);
  for (const auto& rg : meta.row_groups) {
    const ColumnChunk& chunk = rg.columns[leaf.chunk_index];
    if (chunk.file_path)
      column_error(leaf.element->name, "column chunk stored in external file " + *chunk.file_path);
    if (!chunk.meta_data)
      column_error(leaf.element->name, "column chunk has no metadata");
    decoder.read_chunk(*chunk.meta_data, static_cast<size_t>(rg.num_rows), out);
  }
}

} // namespace

ParquetReader::ParquetReader(const uint8_t* data, size_t size) : data_(data), size_(size) {
  // Smallest file: magic + footer length + magic
  if (size < 12)
    decode_error("not a Parquet file: " + std::to_string(size) + " bytes is too small");
  if (std::memcmp(data, PARQUET_MAGIC, 4) != 0)
    decode_error("not a Parquet file: missing leading PAR1 magic");
  if (std::memcmp(data + size - 4, PARQUET_MAGIC, 4) != 0)
    decode_error("not a Parquet file: missing trailing PAR1 magic (file truncated?)");

  const uint8_t* len_bytes = data + size - 8;
  uint32_t footer_len = static_cast<uint32_t>(len_bytes[0]) |
                        (static_cast<uint32_t>(len_bytes[1]) << 8) |
                        (static_cast<uint32_t>(len_bytes[2]) << 16) |
                        (static_cast<uint32_t>(len_bytes[3]) << 24);
  if (footer_len == 0 || footer_len > size - 12)
    decode_error("invalid footer length " + std::to_string(footer_len));

  data_end_ = size - 8 - footer_len;
  ThriftCompactReader reader(data + data_end_, footer_len);
  metadata_.read(reader);
}

std::shared_ptr<ColumnarTable> ParquetReader::read() const {
  const auto& schema = metadata_.schema;
  if (schema.empty())
    decode_error("file metadata has an empty schema");
  if (metadata_.num_rows < 0)
    decode_error("negative row count");

  // Walk the root's children: primitive leaves become columns, groups are
  // reported by name and skipped
  const SchemaElement& root = schema[0];
  int32_t root_children = root.num_children.value_or(0);
  if (root_children < 0 || static_cast<size_t>(root_children) > schema.size() - 1)
    decode_error("schema root has an invalid child count");

  std::vector<FieldDescriptor> fields;
  std::vector<LeafColumn> leaves;
  size_t leaf_count = 0;
  size_t pos = 1;
  for (int32_t c = 0; c < root_children; ++c) {
    if (pos >= schema.size())
      decode_error("schema tree is truncated");
    const SchemaElement& elem = schema[pos];
    FieldDescriptor field = from_schema_element(elem);
    if (elem.type) {
      if (field.type) {
        leaves.push_back({fields.size(), leaf_count, &elem, *field.type, field.nullable});
      }
      ++leaf_count;
      ++pos;
    } else {
      pos = skip_subtree(schema, pos, leaf_count, 1);
    }
    fields.push_back(std::move(field));
  }
  if (pos != schema.size())
    decode_error("schema has " + std::to_string(schema.size() - pos) + " elements outside the tree");

  uint64_t total_rows = 0;
  for (const auto& rg : metadata_.row_groups) {
    if (rg.num_rows < 0)
      decode_error("row group has a negative row count");
    if (rg.columns.size() != leaf_count) {
      decode_error("row group has " + std::to_string(rg.columns.size()) + " column chunks, schema has " +
                   std::to_string(leaf_count) + " leaf columns");
    }
    total_rows += static_cast<uint64_t>(rg.num_rows);
  }
  if (total_rows != static_cast<uint64_t>(metadata_.num_rows)) {
    decode_error("row groups hold " + std::to_string(total_rows) + " rows, metadata declares " +
                 std::to_string(metadata_.num_rows));
  }
  size_t num_rows = static_cast<size_t>(total_rows);

  std::vector<std::unique_ptr<ColumnVector>> columns(fields.size());
  for (const auto& leaf : leaves) {
    auto vec = ColumnVector::create(leaf.type);
    // Every value costs at least a bit of file, so the file size bounds a sane reservation
    vec->reserve(std::min(num_rows, size_));

    switch (*leaf.element->type) {
    case ParquetType::BOOLEAN:
      read_leaf<uint8_t>(leaf, metadata_, data_, data_end_, *vec);
      break;
    case ParquetType::INT32:
      read_leaf<int32_t>(leaf, metadata_, data_, data_end_, *vec);
      break;
    case ParquetType::INT64:
      read_leaf<int64_t>(leaf, metadata_, data_, data_end_, *vec);
      break;
    case ParquetType::FLOAT:
      read_leaf<float>(leaf, metadata_, data_, data_end_, *vec);
      break;
    case ParquetType::DOUBLE:
      read_leaf<double>(leaf, metadata_, data_, data_end_, *vec);
      break;
    case ParquetType::BYTE_ARRAY:
    case ParquetType::FIXED_LEN_BYTE_ARRAY:
      read_leaf<std::string>(leaf, metadata_, data_, data_end_, *vec);
      break;
    default:
      column_error(leaf.element->name, std::string("cannot decode physical type ") +
                                           physical_type_name(*leaf.element->type));
    }
    columns[leaf.field_index] = std::move(vec);
  }

  return std::make_shared<ColumnarTable>(std::move(fields), std::move(columns), num_rows);
}

} // namespace parquet
} // namespace pqstudio
