#include "parquet_types.h"

#include "pqstudio/error.h"

namespace pqstudio {
namespace parquet {

using T = ThriftType;

namespace {

//-----------------------------------------------------------------------------
// Read helpers. Every helper checks the wire type before consuming a value.
//-----------------------------------------------------------------------------

template <typename Fn> void read_struct(ThriftCompactReader& r, Fn&& on_field) {
  r.read_struct_begin();
  int16_t id = 0;
  uint8_t type = 0;
  while (r.read_field_begin(id, type)) {
    if (!on_field(id, type)) {
      r.skip(type);
    }
  }
  r.read_struct_end();
}

void require(uint32_t seen, uint32_t mask, const char* what) {
  if ((seen & mask) != mask) {
    throw StudioException(ErrorCode::DECODE_ERROR,
                          std::string("malformed thrift metadata: ") + what +
                              " is missing a required field");
  }
}

int32_t field_i32(ThriftCompactReader& r, uint8_t type, const char* what) {
  ThriftCompactReader::expect_type(type, T::I32, what);
  return r.read_i32();
}

int64_t field_i64(ThriftCompactReader& r, uint8_t type, const char* what) {
  ThriftCompactReader::expect_type(type, T::I64, what);
  return r.read_i64();
}

std::string field_string(ThriftCompactReader& r, uint8_t type, const char* what) {
  ThriftCompactReader::expect_type(type, T::BINARY, what);
  return r.read_string();
}

std::vector<uint8_t> field_binary(ThriftCompactReader& r, uint8_t type, const char* what) {
  ThriftCompactReader::expect_type(type, T::BINARY, what);
  return r.read_binary();
}

bool field_bool(uint8_t type, const char* what) {
  ThriftCompactReader::expect_type(type, T::BOOL_TRUE, what);
  return ThriftCompactReader::bool_field_value(type);
}

template <typename E> E field_enum(ThriftCompactReader& r, uint8_t type, const char* what) {
  return static_cast<E>(field_i32(r, type, what));
}

template <typename Fn>
void field_list(ThriftCompactReader& r, uint8_t type, uint8_t element_type, const char* what,
                Fn&& each) {
  ThriftCompactReader::expect_type(type, T::LIST, what);
  uint8_t actual = 0;
  int32_t n = r.read_list_begin(actual);
  if (n > 0) {
    ThriftCompactReader::expect_type(actual, element_type, what);
  }
  for (int32_t i = 0; i < n; ++i) {
    each();
  }
}

void write_empty_struct(ThriftCompactWriter& w) {
  w.write_struct_begin();
  w.write_struct_end();
}

} // namespace

//-----------------------------------------------------------------------------
// Enum names
//-----------------------------------------------------------------------------

const char* physical_type_name(ParquetType type) {
  switch (type) {
  case ParquetType::BOOLEAN:
    return "BOOLEAN";
  case ParquetType::INT32:
    return "INT32";
  case ParquetType::INT64:
    return "INT64";
  case ParquetType::INT96:
    return "INT96";
  case ParquetType::FLOAT:
    return "FLOAT";
  case ParquetType::DOUBLE:
    return "DOUBLE";
  case ParquetType::BYTE_ARRAY:
    return "BYTE_ARRAY";
  case ParquetType::FIXED_LEN_BYTE_ARRAY:
    return "FIXED_LEN_BYTE_ARRAY";
  }
  return "UNKNOWN";
}

const char* converted_type_name(ConvertedType type) {
  static constexpr const char* names[] = {
      "UTF8",    "MAP",     "MAP_KEY_VALUE", "LIST",        "ENUM",
      "DECIMAL", "DATE",    "TIME_MILLIS",   "TIME_MICROS", "TIMESTAMP_MILLIS",
      "TIMESTAMP_MICROS",   "UINT_8",        "UINT_16",     "UINT_32",
      "UINT_64", "INT_8",   "INT_16",        "INT_32",      "INT_64",
      "JSON",    "BSON",    "INTERVAL"};
  auto idx = static_cast<int32_t>(type);
  if (idx < 0 || idx >= static_cast<int32_t>(sizeof(names) / sizeof(names[0])))
    return "UNKNOWN";
  return names[idx];
}

const char* encoding_name(ParquetEncoding encoding) {
  switch (encoding) {
  case ParquetEncoding::PLAIN:
    return "PLAIN";
  case ParquetEncoding::PLAIN_DICTIONARY:
    return "PLAIN_DICTIONARY";
  case ParquetEncoding::RLE:
    return "RLE";
  case ParquetEncoding::BIT_PACKED:
    return "BIT_PACKED";
  case ParquetEncoding::DELTA_BINARY_PACKED:
    return "DELTA_BINARY_PACKED";
  case ParquetEncoding::DELTA_LENGTH_BYTE_ARRAY:
    return "DELTA_LENGTH_BYTE_ARRAY";
  case ParquetEncoding::DELTA_BYTE_ARRAY:
    return "DELTA_BYTE_ARRAY";
  case ParquetEncoding::RLE_DICTIONARY:
    return "RLE_DICTIONARY";
  case ParquetEncoding::BYTE_STREAM_SPLIT:
    return "BYTE_STREAM_SPLIT";
  }
  return "UNKNOWN";
}

//-----------------------------------------------------------------------------
// LogicalTypeAnnotation
//-----------------------------------------------------------------------------

const char* LogicalTypeAnnotation::kind_name(Kind kind) {
  switch (kind) {
  case Kind::NONE:
    return "NONE";
  case Kind::STRING:
    return "STRING";
  case Kind::MAP:
    return "MAP";
  case Kind::LIST:
    return "LIST";
  case Kind::ENUM:
    return "ENUM";
  case Kind::DECIMAL:
    return "DECIMAL";
  case Kind::DATE:
    return "DATE";
  case Kind::TIME:
    return "TIME";
  case Kind::TIMESTAMP:
    return "TIMESTAMP";
  case Kind::INTEGER:
    return "INTEGER";
  case Kind::UNKNOWN:
    return "UNKNOWN";
  case Kind::JSON:
    return "JSON";
  case Kind::BSON:
    return "BSON";
  case Kind::UUID:
    return "UUID";
  case Kind::FLOAT16:
    return "FLOAT16";
  }
  return "NONE";
}

void LogicalTypeAnnotation::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();
  w.write_field_begin(static_cast<int16_t>(kind), T::STRUCT);
  w.write_struct_begin();

  switch (kind) {
  case Kind::DECIMAL:
    w.write_field_begin(1, T::I32);
    w.write_i32(scale);
    w.write_field_begin(2, T::I32);
    w.write_i32(precision);
    break;
  case Kind::TIME:
  case Kind::TIMESTAMP:
    w.write_bool_field(1, is_adjusted_to_utc);
    // TimeUnit is itself a union of empty structs
    w.write_field_begin(2, T::STRUCT);
    w.write_struct_begin();
    w.write_field_begin(static_cast<int16_t>(unit), T::STRUCT);
    write_empty_struct(w);
    w.write_struct_end();
    break;
  case Kind::INTEGER:
    w.write_field_begin(1, T::BYTE);
    w.write_byte(bit_width);
    w.write_bool_field(2, is_signed);
    break;
  default:
    break;
  }

  w.write_struct_end();
  w.write_struct_end();
}

void LogicalTypeAnnotation::read(ThriftCompactReader& r) {
  read_struct(r, [&](int16_t id, uint8_t type) {
    if (type != T::STRUCT || id < 1 || id > 15 || id == 9) {
      return false;
    }
    kind = static_cast<Kind>(id);
    read_struct(r, [&](int16_t fid, uint8_t ftype) {
      switch (kind) {
      case Kind::DECIMAL:
        if (fid == 1) {
          scale = field_i32(r, ftype, "DecimalType.scale");
          return true;
        }
        if (fid == 2) {
          precision = field_i32(r, ftype, "DecimalType.precision");
          return true;
        }
        return false;
      case Kind::TIME:
      case Kind::TIMESTAMP:
        if (fid == 1) {
          is_adjusted_to_utc = field_bool(ftype, "TimestampType.isAdjustedToUTC");
          return true;
        }
        if (fid == 2) {
          ThriftCompactReader::expect_type(ftype, T::STRUCT, "TimestampType.unit");
          read_struct(r, [&](int16_t uid, uint8_t utype) {
            if (uid >= 1 && uid <= 3 && utype == T::STRUCT) {
              unit = static_cast<TimeUnitKind>(uid);
            }
            return false; // skip the empty member struct
          });
          return true;
        }
        return false;
      case Kind::INTEGER:
        if (fid == 1) {
          ThriftCompactReader::expect_type(ftype, T::BYTE, "IntType.bitWidth");
          bit_width = r.read_byte();
          return true;
        }
        if (fid == 2) {
          is_signed = field_bool(ftype, "IntType.isSigned");
          return true;
        }
        return false;
      default:
        return false;
      }
    });
    return true;
  });
}

//-----------------------------------------------------------------------------
// Statistics
//-----------------------------------------------------------------------------

void Statistics::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  if (max.has_value()) {
    w.write_field_begin(1, T::BINARY);
    w.write_binary(max.value());
  }
  if (min.has_value()) {
    w.write_field_begin(2, T::BINARY);
    w.write_binary(min.value());
  }
  if (null_count.has_value()) {
    w.write_field_begin(3, T::I64);
    w.write_i64(null_count.value());
  }
  if (distinct_count.has_value()) {
    w.write_field_begin(4, T::I64);
    w.write_i64(distinct_count.value());
  }
  // Fields 5 and 6 use signed ordering and supersede 1 and 2
  if (max_value.has_value()) {
    w.write_field_begin(5, T::BINARY);
    w.write_binary(max_value.value());
  }
  if (min_value.has_value()) {
    w.write_field_begin(6, T::BINARY);
    w.write_binary(min_value.value());
  }

  w.write_struct_end();
}

void Statistics::read(ThriftCompactReader& r) {
  read_struct(r, [&](int16_t id, uint8_t type) {
    switch (id) {
    case 1:
      max = field_binary(r, type, "Statistics.max");
      return true;
    case 2:
      min = field_binary(r, type, "Statistics.min");
      return true;
    case 3:
      null_count = field_i64(r, type, "Statistics.null_count");
      return true;
    case 4:
      distinct_count = field_i64(r, type, "Statistics.distinct_count");
      return true;
    case 5:
      max_value = field_binary(r, type, "Statistics.max_value");
      return true;
    case 6:
      min_value = field_binary(r, type, "Statistics.min_value");
      return true;
    default:
      return false;
    }
  });
}

//-----------------------------------------------------------------------------
// SchemaElement
//-----------------------------------------------------------------------------

void SchemaElement::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  if (type.has_value()) {
    w.write_field_begin(1, T::I32);
    w.write_i32(static_cast<int32_t>(type.value()));
  }
  if (type_length.has_value()) {
    w.write_field_begin(2, T::I32);
    w.write_i32(type_length.value());
  }
  if (repetition_type.has_value()) {
    w.write_field_begin(3, T::I32);
    w.write_i32(static_cast<int32_t>(repetition_type.value()));
  }

  // Field 4: name (required)
  w.write_field_begin(4, T::BINARY);
  w.write_string(name);

  if (num_children.has_value()) {
    w.write_field_begin(5, T::I32);
    w.write_i32(num_children.value());
  }
  if (converted_type.has_value()) {
    w.write_field_begin(6, T::I32);
    w.write_i32(static_cast<int32_t>(converted_type.value()));
  }
  if (scale.has_value()) {
    w.write_field_begin(7, T::I32);
    w.write_i32(scale.value());
  }
  if (precision.has_value()) {
    w.write_field_begin(8, T::I32);
    w.write_i32(precision.value());
  }
  if (field_id.has_value()) {
    w.write_field_begin(9, T::I32);
    w.write_i32(field_id.value());
  }
  if (logical_type.has_value()) {
    w.write_field_begin(10, T::STRUCT);
    logical_type.value().write(w);
  }

  w.write_struct_end();
}

void SchemaElement::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t type_id) {
    switch (id) {
    case 1:
      type = field_enum<ParquetType>(r, type_id, "SchemaElement.type");
      return true;
    case 2:
      type_length = field_i32(r, type_id, "SchemaElement.type_length");
      return true;
    case 3:
      repetition_type = field_enum<FieldRepetitionType>(r, type_id, "SchemaElement.repetition_type");
      return true;
    case 4:
      name = field_string(r, type_id, "SchemaElement.name");
      seen |= 1;
      return true;
    case 5:
      num_children = field_i32(r, type_id, "SchemaElement.num_children");
      return true;
    case 6:
      converted_type = field_enum<ConvertedType>(r, type_id, "SchemaElement.converted_type");
      return true;
    case 7:
      scale = field_i32(r, type_id, "SchemaElement.scale");
      return true;
    case 8:
      precision = field_i32(r, type_id, "SchemaElement.precision");
      return true;
    case 9:
      field_id = field_i32(r, type_id, "SchemaElement.field_id");
      return true;
    case 10: {
      ThriftCompactReader::expect_type(type_id, T::STRUCT, "SchemaElement.logicalType");
      LogicalTypeAnnotation annotation;
      annotation.read(r);
      logical_type = annotation;
      return true;
    }
    default:
      return false;
    }
  });
  require(seen, 1, "SchemaElement");
}

//-----------------------------------------------------------------------------
// Page headers
//-----------------------------------------------------------------------------

void DataPageHeader::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  w.write_field_begin(1, T::I32);
  w.write_i32(num_values);
  w.write_field_begin(2, T::I32);
  w.write_i32(static_cast<int32_t>(encoding));
  w.write_field_begin(3, T::I32);
  w.write_i32(static_cast<int32_t>(definition_level_encoding));
  w.write_field_begin(4, T::I32);
  w.write_i32(static_cast<int32_t>(repetition_level_encoding));

  if (statistics.has_value()) {
    w.write_field_begin(5, T::STRUCT);
    statistics.value().write(w);
  }

  w.write_struct_end();
}

void DataPageHeader::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t type) {
    switch (id) {
    case 1:
      num_values = field_i32(r, type, "DataPageHeader.num_values");
      seen |= 1;
      return true;
    case 2:
      encoding = field_enum<ParquetEncoding>(r, type, "DataPageHeader.encoding");
      seen |= 2;
      return true;
    case 3:
      definition_level_encoding =
          field_enum<ParquetEncoding>(r, type, "DataPageHeader.definition_level_encoding");
      seen |= 4;
      return true;
    case 4:
      repetition_level_encoding =
          field_enum<ParquetEncoding>(r, type, "DataPageHeader.repetition_level_encoding");
      seen |= 8;
      return true;
    case 5: {
      ThriftCompactReader::expect_type(type, T::STRUCT, "DataPageHeader.statistics");
      Statistics stats;
      stats.read(r);
      statistics = std::move(stats);
      return true;
    }
    default:
      return false;
    }
  });
  require(seen, 0xF, "DataPageHeader");
}

void DictionaryPageHeader::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  w.write_field_begin(1, T::I32);
  w.write_i32(num_values);
  w.write_field_begin(2, T::I32);
  w.write_i32(static_cast<int32_t>(encoding));

  if (is_sorted.has_value()) {
    w.write_bool_field(3, is_sorted.value());
  }

  w.write_struct_end();
}

void DictionaryPageHeader::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t type) {
    switch (id) {
    case 1:
      num_values = field_i32(r, type, "DictionaryPageHeader.num_values");
      seen |= 1;
      return true;
    case 2:
      encoding = field_enum<ParquetEncoding>(r, type, "DictionaryPageHeader.encoding");
      seen |= 2;
      return true;
    case 3:
      is_sorted = field_bool(type, "DictionaryPageHeader.is_sorted");
      return true;
    default:
      return false;
    }
  });
  require(seen, 0x3, "DictionaryPageHeader");
}

void DataPageHeaderV2::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  w.write_field_begin(1, T::I32);
  w.write_i32(num_values);
  w.write_field_begin(2, T::I32);
  w.write_i32(num_nulls);
  w.write_field_begin(3, T::I32);
  w.write_i32(num_rows);
  w.write_field_begin(4, T::I32);
  w.write_i32(static_cast<int32_t>(encoding));
  w.write_field_begin(5, T::I32);
  w.write_i32(definition_levels_byte_length);
  w.write_field_begin(6, T::I32);
  w.write_i32(repetition_levels_byte_length);

  if (is_compressed.has_value()) {
    w.write_bool_field(7, is_compressed.value());
  }
  if (statistics.has_value()) {
    w.write_field_begin(8, T::STRUCT);
    statistics.value().write(w);
  }

  w.write_struct_end();
}

void DataPageHeaderV2::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t type) {
    switch (id) {
    case 1:
      num_values = field_i32(r, type, "DataPageHeaderV2.num_values");
      seen |= 1;
      return true;
    case 2:
      num_nulls = field_i32(r, type, "DataPageHeaderV2.num_nulls");
      seen |= 2;
      return true;
    case 3:
      num_rows = field_i32(r, type, "DataPageHeaderV2.num_rows");
      seen |= 4;
      return true;
    case 4:
      encoding = field_enum<ParquetEncoding>(r, type, "DataPageHeaderV2.encoding");
      seen |= 8;
      return true;
    case 5:
      definition_levels_byte_length =
          field_i32(r, type, "DataPageHeaderV2.definition_levels_byte_length");
      seen |= 16;
      return true;
    case 6:
      repetition_levels_byte_length =
          field_i32(r, type, "DataPageHeaderV2.repetition_levels_byte_length");
      seen |= 32;
      return true;
    case 7:
      is_compressed = field_bool(type, "DataPageHeaderV2.is_compressed");
      return true;
    case 8: {
      ThriftCompactReader::expect_type(type, T::STRUCT, "DataPageHeaderV2.statistics");
      Statistics stats;
      stats.read(r);
      statistics = std::move(stats);
      return true;
    }
    default:
      return false;
    }
  });
  require(seen, 0x3F, "DataPageHeaderV2");
}

void PageHeader::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  w.write_field_begin(1, T::I32);
  w.write_i32(static_cast<int32_t>(type));
  w.write_field_begin(2, T::I32);
  w.write_i32(uncompressed_page_size);
  w.write_field_begin(3, T::I32);
  w.write_i32(compressed_page_size);

  if (crc.has_value()) {
    w.write_field_begin(4, T::I32);
    w.write_i32(crc.value());
  }
  if (data_page_header.has_value()) {
    w.write_field_begin(5, T::STRUCT);
    data_page_header.value().write(w);
  }
  if (dictionary_page_header.has_value()) {
    w.write_field_begin(7, T::STRUCT);
    dictionary_page_header.value().write(w);
  }
  if (data_page_header_v2.has_value()) {
    w.write_field_begin(8, T::STRUCT);
    data_page_header_v2.value().write(w);
  }

  w.write_struct_end();
}

void PageHeader::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t field_type) {
    switch (id) {
    case 1:
      type = field_enum<PageType>(r, field_type, "PageHeader.type");
      seen |= 1;
      return true;
    case 2:
      uncompressed_page_size = field_i32(r, field_type, "PageHeader.uncompressed_page_size");
      seen |= 2;
      return true;
    case 3:
      compressed_page_size = field_i32(r, field_type, "PageHeader.compressed_page_size");
      seen |= 4;
      return true;
    case 4:
      crc = field_i32(r, field_type, "PageHeader.crc");
      return true;
    case 5: {
      ThriftCompactReader::expect_type(field_type, T::STRUCT, "PageHeader.data_page_header");
      DataPageHeader header;
      header.read(r);
      data_page_header = std::move(header);
      return true;
    }
    case 7: {
      ThriftCompactReader::expect_type(field_type, T::STRUCT, "PageHeader.dictionary_page_header");
      DictionaryPageHeader header;
      header.read(r);
      dictionary_page_header = header;
      return true;
    }
    case 8: {
      ThriftCompactReader::expect_type(field_type, T::STRUCT, "PageHeader.data_page_header_v2");
      DataPageHeaderV2 header;
      header.read(r);
      data_page_header_v2 = std::move(header);
      return true;
    }
    default:
      return false;
    }
  });
  require(seen, 0x7, "PageHeader");
}

//-----------------------------------------------------------------------------
// KeyValue
//-----------------------------------------------------------------------------

void KeyValue::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();
  w.write_field_begin(1, T::BINARY);
  w.write_string(key);
  if (value.has_value()) {
    w.write_field_begin(2, T::BINARY);
    w.write_string(value.value());
  }
  w.write_struct_end();
}

void KeyValue::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t type) {
    if (id == 1) {
      key = field_string(r, type, "KeyValue.key");
      seen |= 1;
      return true;
    }
    if (id == 2) {
      value = field_string(r, type, "KeyValue.value");
      return true;
    }
    return false;
  });
  require(seen, 1, "KeyValue");
}

//-----------------------------------------------------------------------------
// Column chunks and row groups
//-----------------------------------------------------------------------------

void ColumnMetaData::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  w.write_field_begin(1, T::I32);
  w.write_i32(static_cast<int32_t>(type));

  w.write_field_begin(2, T::LIST);
  w.write_list_begin(T::I32, static_cast<int32_t>(encodings.size()));
  for (const auto& enc : encodings) {
    w.write_i32(static_cast<int32_t>(enc));
  }

  w.write_field_begin(3, T::LIST);
  w.write_list_begin(T::BINARY, static_cast<int32_t>(path_in_schema.size()));
  for (const auto& part : path_in_schema) {
    w.write_string(part);
  }

  w.write_field_begin(4, T::I32);
  w.write_i32(static_cast<int32_t>(codec));
  w.write_field_begin(5, T::I64);
  w.write_i64(num_values);
  w.write_field_begin(6, T::I64);
  w.write_i64(total_uncompressed_size);
  w.write_field_begin(7, T::I64);
  w.write_i64(total_compressed_size);
  w.write_field_begin(9, T::I64);
  w.write_i64(data_page_offset);

  if (dictionary_page_offset.has_value()) {
    w.write_field_begin(11, T::I64);
    w.write_i64(dictionary_page_offset.value());
  }
  if (statistics.has_value()) {
    w.write_field_begin(12, T::STRUCT);
    statistics.value().write(w);
  }

  w.write_struct_end();
}

void ColumnMetaData::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t field_type) {
    switch (id) {
    case 1:
      type = field_enum<ParquetType>(r, field_type, "ColumnMetaData.type");
      seen |= 1;
      return true;
    case 2:
      encodings.clear();
      field_list(r, field_type, T::I32, "ColumnMetaData.encodings",
                 [&] { encodings.push_back(static_cast<ParquetEncoding>(r.read_i32())); });
      seen |= 2;
      return true;
    case 3:
      path_in_schema.clear();
      field_list(r, field_type, T::BINARY, "ColumnMetaData.path_in_schema",
                 [&] { path_in_schema.push_back(r.read_string()); });
      seen |= 4;
      return true;
    case 4:
      codec = field_enum<CompressionCodec>(r, field_type, "ColumnMetaData.codec");
      seen |= 8;
      return true;
    case 5:
      num_values = field_i64(r, field_type, "ColumnMetaData.num_values");
      seen |= 16;
      return true;
    case 6:
      total_uncompressed_size = field_i64(r, field_type, "ColumnMetaData.total_uncompressed_size");
      seen |= 32;
      return true;
    case 7:
      total_compressed_size = field_i64(r, field_type, "ColumnMetaData.total_compressed_size");
      seen |= 64;
      return true;
    case 9:
      data_page_offset = field_i64(r, field_type, "ColumnMetaData.data_page_offset");
      seen |= 128;
      return true;
    case 11:
      dictionary_page_offset = field_i64(r, field_type, "ColumnMetaData.dictionary_page_offset");
      return true;
    case 12: {
      ThriftCompactReader::expect_type(field_type, T::STRUCT, "ColumnMetaData.statistics");
      Statistics stats;
      stats.read(r);
      statistics = std::move(stats);
      return true;
    }
    default:
      return false;
    }
  });
  require(seen, 0xFF, "ColumnMetaData");
}

void ColumnChunk::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  if (file_path.has_value()) {
    w.write_field_begin(1, T::BINARY);
    w.write_string(file_path.value());
  }

  w.write_field_begin(2, T::I64);
  w.write_i64(file_offset);

  if (meta_data.has_value()) {
    w.write_field_begin(3, T::STRUCT);
    meta_data.value().write(w);
  }

  w.write_struct_end();
}

void ColumnChunk::read(ThriftCompactReader& r) {
  read_struct(r, [&](int16_t id, uint8_t type) {
    switch (id) {
    case 1:
      file_path = field_string(r, type, "ColumnChunk.file_path");
      return true;
    case 2:
      file_offset = field_i64(r, type, "ColumnChunk.file_offset");
      return true;
    case 3: {
      ThriftCompactReader::expect_type(type, T::STRUCT, "ColumnChunk.meta_data");
      ColumnMetaData meta;
      meta.read(r);
      meta_data = std::move(meta);
      return true;
    }
    default:
      return false;
    }
  });
}

void RowGroup::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  w.write_field_begin(1, T::LIST);
  w.write_list_begin(T::STRUCT, static_cast<int32_t>(columns.size()));
  for (const auto& col : columns) {
    col.write(w);
  }

  w.write_field_begin(2, T::I64);
  w.write_i64(total_byte_size);
  w.write_field_begin(3, T::I64);
  w.write_i64(num_rows);

  if (file_offset.has_value()) {
    w.write_field_begin(5, T::I64);
    w.write_i64(file_offset.value());
  }
  if (total_compressed_size.has_value()) {
    w.write_field_begin(6, T::I64);
    w.write_i64(total_compressed_size.value());
  }

  w.write_struct_end();
}

void RowGroup::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t type) {
    switch (id) {
    case 1:
      columns.clear();
      field_list(r, type, T::STRUCT, "RowGroup.columns", [&] {
        ColumnChunk chunk;
        chunk.read(r);
        columns.push_back(std::move(chunk));
      });
      seen |= 1;
      return true;
    case 2:
      total_byte_size = field_i64(r, type, "RowGroup.total_byte_size");
      seen |= 2;
      return true;
    case 3:
      num_rows = field_i64(r, type, "RowGroup.num_rows");
      seen |= 4;
      return true;
    case 5:
      file_offset = field_i64(r, type, "RowGroup.file_offset");
      return true;
    case 6:
      total_compressed_size = field_i64(r, type, "RowGroup.total_compressed_size");
      return true;
    default:
      return false;
    }
  });
  require(seen, 0x7, "RowGroup");
}

void ColumnOrder::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();
  w.write_field_begin(1, T::STRUCT);
  write_empty_struct(w);
  w.write_struct_end();
}

//-----------------------------------------------------------------------------
// FileMetaData
//-----------------------------------------------------------------------------

void FileMetaData::write(ThriftCompactWriter& w) const {
  w.write_struct_begin();

  w.write_field_begin(1, T::I32);
  w.write_i32(version);

  w.write_field_begin(2, T::LIST);
  w.write_list_begin(T::STRUCT, static_cast<int32_t>(schema.size()));
  for (const auto& elem : schema) {
    elem.write(w);
  }

  w.write_field_begin(3, T::I64);
  w.write_i64(num_rows);

  w.write_field_begin(4, T::LIST);
  w.write_list_begin(T::STRUCT, static_cast<int32_t>(row_groups.size()));
  for (const auto& rg : row_groups) {
    rg.write(w);
  }

  if (key_value_metadata.has_value()) {
    w.write_field_begin(5, T::LIST);
    w.write_list_begin(T::STRUCT, static_cast<int32_t>(key_value_metadata->size()));
    for (const auto& kv : *key_value_metadata) {
      kv.write(w);
    }
  }
  if (created_by.has_value()) {
    w.write_field_begin(6, T::BINARY);
    w.write_string(created_by.value());
  }
  if (column_orders.has_value()) {
    w.write_field_begin(7, T::LIST);
    w.write_list_begin(T::STRUCT, static_cast<int32_t>(column_orders->size()));
    for (const auto& order : *column_orders) {
      order.write(w);
    }
  }

  w.write_struct_end();
}

void FileMetaData::read(ThriftCompactReader& r) {
  uint32_t seen = 0;
  read_struct(r, [&](int16_t id, uint8_t type) {
    switch (id) {
    case 1:
      version = field_i32(r, type, "FileMetaData.version");
      seen |= 1;
      return true;
    case 2:
      schema.clear();
      field_list(r, type, T::STRUCT, "FileMetaData.schema", [&] {
        SchemaElement elem;
        elem.read(r);
        schema.push_back(std::move(elem));
      });
      seen |= 2;
      return true;
    case 3:
      num_rows = field_i64(r, type, "FileMetaData.num_rows");
      seen |= 4;
      return true;
    case 4:
      row_groups.clear();
      field_list(r, type, T::STRUCT, "FileMetaData.row_groups", [&] {
        RowGroup rg;
        rg.read(r);
        row_groups.push_back(std::move(rg));
      });
      seen |= 8;
      return true;
    case 5: {
      std::vector<KeyValue> kvs;
      field_list(r, type, T::STRUCT, "FileMetaData.key_value_metadata", [&] {
        KeyValue kv;
        kv.read(r);
        kvs.push_back(std::move(kv));
      });
      key_value_metadata = std::move(kvs);
      return true;
    }
    case 6:
      created_by = field_string(r, type, "FileMetaData.created_by");
      return true;
    default:
      // Column orders (7) and encryption fields are not needed to decode
      return false;
    }
  });
  require(seen, 0xF, "FileMetaData");
}

} // namespace parquet
} // namespace pqstudio
