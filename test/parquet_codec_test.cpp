/**
 * @file parquet_codec_test.cpp
 * @brief Tests for the Parquet reader, writer and schema mapping.
 *
 * Files written by ParquetWriter cover the common path. Files the writer
 * never produces (dictionary pages, V2 pages, delta encodings, legacy
 * annotations, unsupported columns) are assembled by hand from Thrift
 * metadata and encoded pages.
 */

#include "encoding/encoding.h"
#include "parquet/compression.h"
#include "parquet/parquet_reader.h"
#include "parquet/parquet_writer.h"
#include "parquet/schema_mapping.h"
#include "parquet/thrift_compact.h"

#include "pqstudio/schema_catalog.h"

#include "test_util.h"

#include <cstring>
#include <gtest/gtest.h>
#include <limits>

using namespace pqstudio;
using namespace pqstudio::parquet;

namespace {

struct TestPage {
  PageHeader header;
  std::vector<uint8_t> body;
};

struct TestChunk {
  ParquetType type;
  std::vector<TestPage> pages;
};

// Assemble a single-row-group file: "PAR1", the chunks in order, footer, "PAR1"
std::vector<uint8_t> assemble(const std::vector<SchemaElement>& schema,
                              std::vector<TestChunk> chunks, int64_t rows,
                              int64_t declared_rows = -1) {
  std::vector<uint8_t> out{'P', 'A', 'R', '1'};
  RowGroup rg;
  rg.num_rows = rows;
  for (auto& chunk : chunks) {
    int64_t offset = static_cast<int64_t>(out.size());
    for (auto& page : chunk.pages) {
      page.header.compressed_page_size = static_cast<int32_t>(page.body.size());
      page.header.uncompressed_page_size = static_cast<int32_t>(page.body.size());
      ThriftCompactWriter writer(out);
      page.header.write(writer);
      out.insert(out.end(), page.body.begin(), page.body.end());
    }
    ColumnMetaData meta;
    meta.type = chunk.type;
    meta.encodings = {ParquetEncoding::PLAIN};
    meta.path_in_schema = {"c"};
    meta.num_values = rows;
    meta.total_compressed_size = static_cast<int64_t>(out.size()) - offset;
    meta.total_uncompressed_size = meta.total_compressed_size;
    meta.data_page_offset = offset;
    ColumnChunk cc;
    cc.file_offset = offset;
    cc.meta_data = meta;
    rg.columns.push_back(cc);
  }

  FileMetaData file;
  file.schema = schema;
  file.num_rows = declared_rows >= 0 ? declared_rows : rows;
  file.row_groups = {rg};
  std::vector<uint8_t> footer;
  ThriftCompactWriter writer(footer);
  file.write(writer);
  out.insert(out.end(), footer.begin(), footer.end());
  uint32_t len = static_cast<uint32_t>(footer.size());
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<uint8_t>(len >> (8 * i)));
  }
  out.insert(out.end(), {'P', 'A', 'R', '1'});
  return out;
}

SchemaElement root_of(int32_t children) {
  SchemaElement root;
  root.name = "schema";
  root.num_children = children;
  return root;
}

SchemaElement leaf(const std::string& name, ParquetType type, bool optional) {
  SchemaElement e;
  e.name = name;
  e.type = type;
  e.repetition_type = optional ? FieldRepetitionType::OPTIONAL : FieldRepetitionType::REQUIRED;
  return e;
}

TestPage v1_page(ParquetEncoding encoding, int32_t num_values, std::vector<uint8_t> body) {
  TestPage page;
  page.header.type = PageType::DATA_PAGE;
  DataPageHeader dp;
  dp.num_values = num_values;
  dp.encoding = encoding;
  page.header.data_page_header = dp;
  page.body = std::move(body);
  return page;
}

// Optional string column "color" dictionary-encoded as red, null, green, red
std::vector<uint8_t> dictionary_file(uint32_t bad_index = 0) {
  TestPage dict;
  dict.header.type = PageType::DICTIONARY_PAGE;
  DictionaryPageHeader dh;
  dh.num_values = 2;
  dh.encoding = ParquetEncoding::PLAIN_DICTIONARY;
  dict.header.dictionary_page_header = dh;
  StringBuffer words;
  words.push_back("red");
  words.push_back("green");
  NullBitmap all_valid;
  all_valid.push_back(true);
  all_valid.push_back(true);
  encoding::encode_plain_byte_array(words, all_valid, 0, 2, dict.body);

  NullBitmap validity;
  for (bool v : {true, false, true, true}) {
    validity.push_back(v);
  }
  std::vector<uint8_t> body;
  encoding::encode_def_levels(validity, 0, 4, body);
  std::vector<uint32_t> indices{0, 1, bad_index};
  uint8_t width = bad_index > 1 ? encoding::bits_required(bad_index) : 1;
  body.push_back(width); // index bit width
  encoding::encode_hybrid_rle(indices.data(), indices.size(), width, body);

  SchemaElement color = leaf("color", ParquetType::BYTE_ARRAY, true);
  color.converted_type = ConvertedType::UTF8;
  return assemble({root_of(1), color},
                  {{ParquetType::BYTE_ARRAY,
                    {dict, v1_page(ParquetEncoding::RLE_DICTIONARY, 4, body)}}},
                  4);
}

void expect_decode_error(const std::vector<uint8_t>& bytes) {
  try {
    test_util::decode(bytes);
    FAIL() << "expected DECODE_ERROR";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::DECODE_ERROR) << e.what();
  }
}

ParquetOptions uncompressed() {
  ParquetOptions options;
  options.compression = Compression::NONE;
  return options;
}

} // namespace

// ============================================================================
// WRITE THEN READ
// ============================================================================

TEST(ParquetCodecTest, SampleTableRoundTrip) {
  auto table = test_util::sample_table();
  auto back = test_util::decode(test_util::encode(*table));

  ASSERT_EQ(back->num_rows(), 3u);
  EXPECT_EQ(test_util::table_columns(*back), test_util::sample_columns());
  EXPECT_EQ(test_util::table_rows(*back), test_util::sample_rows());
}

TEST(ParquetCodecTest, FileHasMagicAtBothEnds) {
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table());
  ASSERT_GT(bytes.size(), 12u);
  EXPECT_EQ(std::memcmp(bytes.data(), "PAR1", 4), 0);
  EXPECT_EQ(std::memcmp(bytes.data() + bytes.size() - 4, "PAR1", 4), 0);
}

TEST(ParquetCodecTest, EmptyTableKeepsSchema) {
  auto table = test_util::make_table(test_util::sample_columns(), {});
  std::vector<uint8_t> bytes = test_util::encode(*table);

  ParquetReader reader(bytes.data(), bytes.size());
  EXPECT_TRUE(reader.metadata().row_groups.empty());
  EXPECT_EQ(reader.metadata().num_rows, 0);

  auto back = reader.read();
  EXPECT_EQ(back->num_rows(), 0u);
  EXPECT_EQ(test_util::table_columns(*back), test_util::sample_columns());
}

TEST(ParquetCodecTest, RowGroupsSplitRows) {
  ParquetOptions options = uncompressed();
  options.row_group_size = 2;
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table(), options);

  ParquetReader reader(bytes.data(), bytes.size());
  const FileMetaData& meta = reader.metadata();
  ASSERT_EQ(meta.row_groups.size(), 2u);
  EXPECT_EQ(meta.row_groups[0].num_rows, 2);
  EXPECT_EQ(meta.row_groups[1].num_rows, 1);
  EXPECT_EQ(meta.num_rows, 3);
  EXPECT_EQ(test_util::table_rows(*reader.read()), test_util::sample_rows());
}

TEST(ParquetCodecTest, ManyRowsManyGroups) {
  std::vector<Column> columns{{"n", LogicalType::int64(), false}, {"s", LogicalType::string()}};
  std::vector<Row> rows;
  for (int64_t i = 0; i < 5000; ++i) {
    rows.push_back({Cell::int64(i * 3), i % 7 == 0 ? Cell::null()
                                                   : Cell::string("v" + std::to_string(i))});
  }
  ParquetOptions options;
  options.compression = Compression::GZIP;
  options.row_group_size = 1024;
  auto back = test_util::decode(test_util::encode(*test_util::make_table(columns, rows), options));
  EXPECT_EQ(test_util::table_rows(*back), rows);
}

TEST(ParquetCodecTest, SerialAndParallelEncodingMatch) {
  auto table = test_util::sample_table();
  ParquetOptions serial;
  serial.num_threads = 1;
  ParquetOptions parallel;
  parallel.num_threads = 4;
  EXPECT_EQ(test_util::encode(*table, serial), test_util::encode(*table, parallel));
}

TEST(ParquetCodecTest, CreatedByRecorded) {
  ParquetOptions options;
  options.created_by = "pqstudio test suite";
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table(), options);
  ParquetReader reader(bytes.data(), bytes.size());
  EXPECT_EQ(reader.metadata().created_by, "pqstudio test suite");
}

TEST(ParquetCodecTest, FloatSpecialValuesSurvive) {
  std::vector<Column> columns{{"x", LogicalType::float64()}};
  double nan = std::numeric_limits<double>::quiet_NaN();
  std::vector<Row> rows{{Cell::float64(nan)},
                        {Cell::float64(-std::numeric_limits<double>::infinity())},
                        {Cell::float64(-0.0)}};
  auto back = test_util::decode(test_util::encode(*test_util::make_table(columns, rows)));
  EXPECT_EQ(test_util::table_rows(*back), rows);
}

// ============================================================================
// COMPRESSION
// ============================================================================

class ParquetCompressionTest : public ::testing::TestWithParam<Compression> {};

TEST_P(ParquetCompressionTest, RoundTripAndCodecRecorded) {
  std::vector<Column> columns{{"text", LogicalType::string(), false}};
  std::vector<Row> rows(2000, Row{Cell::string("the same words over and over")});
  ParquetOptions options;
  options.compression = GetParam();
  std::vector<uint8_t> bytes = test_util::encode(*test_util::make_table(columns, rows), options);

  ParquetReader reader(bytes.data(), bytes.size());
  const ColumnMetaData& meta = *reader.metadata().row_groups[0].columns[0].meta_data;
  if (GetParam() == Compression::NONE || !compression_available(GetParam())) {
    EXPECT_EQ(meta.codec, CompressionCodec::UNCOMPRESSED);
  } else {
    EXPECT_EQ(meta.codec, to_parquet_codec(GetParam()));
    EXPECT_LT(meta.total_compressed_size, meta.total_uncompressed_size);
  }
  EXPECT_EQ(test_util::table_rows(*reader.read()), rows);
}

INSTANTIATE_TEST_SUITE_P(AllCodecs, ParquetCompressionTest,
                         ::testing::Values(Compression::NONE, Compression::GZIP, Compression::ZSTD,
                                           Compression::SNAPPY, Compression::LZ4),
                         [](const ::testing::TestParamInfo<Compression>& info) {
                           return std::string(compression_name(info.param));
                         });

TEST(ParquetCodecTest, IncompressiblePageStaysUncompressed) {
  std::vector<Column> columns{{"n", LogicalType::int32(), false}};
  ParquetOptions options;
  options.compression = Compression::GZIP;
  std::vector<uint8_t> bytes =
      test_util::encode(*test_util::make_table(columns, {{Cell::int32(7)}}), options);
  ParquetReader reader(bytes.data(), bytes.size());
  EXPECT_EQ(reader.metadata().row_groups[0].columns[0].meta_data->codec,
            CompressionCodec::UNCOMPRESSED);
}

// ============================================================================
// METADATA
// ============================================================================

TEST(ParquetCodecTest, StatisticsPerChunk) {
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table(), uncompressed());
  ParquetReader reader(bytes.data(), bytes.size());
  const auto& chunks = reader.metadata().row_groups[0].columns;

  const Statistics& id = *chunks[0].meta_data->statistics;
  EXPECT_EQ(id.null_count, 0);
  ASSERT_TRUE(id.min_value.has_value());
  int64_t min = 0, max = 0;
  std::memcpy(&min, id.min_value->data(), 8);
  std::memcpy(&max, id.max_value->data(), 8);
  EXPECT_EQ(min, 1);
  EXPECT_EQ(max, 3);

  const Statistics& name = *chunks[1].meta_data->statistics;
  EXPECT_EQ(name.null_count, 1);
  EXPECT_EQ(test_util::as_string(*name.min_value), "Alice");
  EXPECT_EQ(test_util::as_string(*name.max_value), "Carol, \"C\"");

  const Statistics& active = *chunks[5].meta_data->statistics;
  EXPECT_EQ(active.null_count, 0);
  EXPECT_FALSE(active.min_value.has_value());
}

TEST(ParquetCodecTest, StatisticsCanBeDisabled) {
  ParquetOptions options = uncompressed();
  options.write_statistics = false;
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table(), options);
  ParquetReader reader(bytes.data(), bytes.size());
  EXPECT_FALSE(reader.metadata().row_groups[0].columns[0].meta_data->statistics.has_value());
}

TEST(ParquetCodecTest, SchemaAnnotations) {
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table());
  ParquetReader reader(bytes.data(), bytes.size());
  const auto& schema = reader.metadata().schema;
  ASSERT_EQ(schema.size(), 12u);
  EXPECT_EQ(schema[0].num_children, 11);

  EXPECT_EQ(schema[1].repetition_type, FieldRepetitionType::REQUIRED);
  EXPECT_EQ(schema[2].converted_type, ConvertedType::UTF8);
  EXPECT_EQ(schema[2].logical_type->kind, LogicalTypeAnnotation::Kind::STRING);
  EXPECT_FALSE(schema[7].logical_type.has_value()); // binary
  EXPECT_EQ(schema[8].converted_type, ConvertedType::DATE);
  EXPECT_EQ(schema[9].converted_type, ConvertedType::TIMESTAMP_MICROS);
  EXPECT_TRUE(schema[9].logical_type->is_adjusted_to_utc);
  EXPECT_EQ(schema[10].type, ParquetType::INT64);
  EXPECT_EQ(schema[10].precision, 10);
  EXPECT_EQ(schema[11].type, ParquetType::FIXED_LEN_BYTE_ARRAY);
  EXPECT_EQ(schema[11].type_length, 13);
}

// ============================================================================
// SCHEMA MAPPING
// ============================================================================

TEST(SchemaMappingTest, DecimalStorage) {
  EXPECT_EQ(physical_type(LogicalType::decimal(9, 2)), ParquetType::INT32);
  EXPECT_EQ(physical_type(LogicalType::decimal(10, 2)), ParquetType::INT64);
  EXPECT_EQ(physical_type(LogicalType::decimal(18, 0)), ParquetType::INT64);
  EXPECT_EQ(physical_type(LogicalType::decimal(19, 0)), ParquetType::FIXED_LEN_BYTE_ARRAY);
  EXPECT_EQ(decimal_byte_width(1), 1);
  EXPECT_EQ(decimal_byte_width(9), 4);
  EXPECT_EQ(decimal_byte_width(18), 8);
  EXPECT_EQ(decimal_byte_width(38), 16);
}

TEST(SchemaMappingTest, EveryColumnRoundTrips) {
  for (const Column& column : test_util::sample_columns()) {
    FieldDescriptor field = from_schema_element(to_schema_element(column));
    EXPECT_EQ(field.name, column.name);
    ASSERT_TRUE(field.type.has_value()) << column.name;
    EXPECT_EQ(*field.type, column.type) << column.name;
    EXPECT_EQ(field.nullable, column.nullable) << column.name;
  }
}

TEST(SchemaMappingTest, NanosTimestampHasNoLegacyAnnotation) {
  SchemaElement e = to_schema_element({"t", LogicalType::timestamp(TimeUnit::NANOS, true)});
  EXPECT_FALSE(e.converted_type.has_value());
  EXPECT_EQ(from_schema_element(e).type, LogicalType::timestamp(TimeUnit::NANOS, true));
}

TEST(SchemaMappingTest, LegacyAnnotations) {
  SchemaElement ts = leaf("ts", ParquetType::INT64, true);
  ts.converted_type = ConvertedType::TIMESTAMP_MILLIS;
  EXPECT_EQ(from_schema_element(ts).type, LogicalType::timestamp(TimeUnit::MILLIS, true));

  SchemaElement dec = leaf("d", ParquetType::BYTE_ARRAY, true);
  dec.converted_type = ConvertedType::DECIMAL;
  dec.precision = 20;
  dec.scale = 3;
  EXPECT_EQ(from_schema_element(dec).type, LogicalType::decimal(20, 3));

  SchemaElement raw = leaf("b", ParquetType::BYTE_ARRAY, true);
  EXPECT_EQ(from_schema_element(raw).type, LogicalType::binary());
}

TEST(SchemaMappingTest, UnsupportedTypesAreDescribed) {
  FieldDescriptor int96 = from_schema_element(leaf("legacy", ParquetType::INT96, true));
  EXPECT_FALSE(int96.type.has_value());
  EXPECT_EQ(int96.source_type, "INT96");

  SchemaElement small = leaf("tiny", ParquetType::INT32, true);
  LogicalTypeAnnotation lt;
  lt.kind = LogicalTypeAnnotation::Kind::INTEGER;
  lt.bit_width = 8;
  small.logical_type = lt;
  FieldDescriptor tiny = from_schema_element(small);
  EXPECT_FALSE(tiny.type.has_value());
  EXPECT_EQ(tiny.source_type, "INT32 (INTEGER(8, signed))");

  SchemaElement fixed = leaf("uuid", ParquetType::FIXED_LEN_BYTE_ARRAY, false);
  fixed.type_length = 16;
  EXPECT_FALSE(from_schema_element(fixed).type.has_value());
  EXPECT_EQ(describe_schema_element(fixed), "FIXED_LEN_BYTE_ARRAY(16)");

  SchemaElement group;
  group.name = "nested";
  group.num_children = 2;
  EXPECT_EQ(describe_schema_element(group), "group of 2 fields");
}

// ============================================================================
// PAGES THE WRITER NEVER PRODUCES
// ============================================================================

TEST(ParquetReaderTest, DictionaryEncodedStrings) {
  std::vector<uint8_t> bytes = dictionary_file();
  auto table = test_util::decode(bytes);
  ASSERT_EQ(table->num_rows(), 4u);
  EXPECT_EQ(table->field(0).type, LogicalType::string());
  EXPECT_EQ(test_util::table_rows(*table),
            (std::vector<Row>{{Cell::string("red")},
                              {Cell::null()},
                              {Cell::string("green")},
                              {Cell::string("red")}}));
}

TEST(ParquetReaderTest, DictionaryIndexOutOfRange) {
  try {
    test_util::decode(dictionary_file(5));
    FAIL() << "expected DECODE_ERROR";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::DECODE_ERROR);
    EXPECT_EQ(e.error().column, "color");
  }
}

TEST(ParquetReaderTest, DataPageV2WithDeltaEncoding) {
  std::vector<int64_t> millis{1000, 2000, 3500};
  TestPage page;
  page.header.type = PageType::DATA_PAGE_V2;
  DataPageHeaderV2 v2;
  v2.num_values = 3;
  v2.num_rows = 3;
  v2.encoding = ParquetEncoding::DELTA_BINARY_PACKED;
  v2.is_compressed = false;
  page.header.data_page_header_v2 = v2;
  encoding::encode_delta_binary_packed(millis.data(), millis.size(), page.body);

  SchemaElement when = leaf("when", ParquetType::INT64, false);
  when.converted_type = ConvertedType::TIMESTAMP_MILLIS;
  auto table =
      test_util::decode(assemble({root_of(1), when}, {{ParquetType::INT64, {page}}}, 3));

  EXPECT_EQ(table->field(0).type, LogicalType::timestamp(TimeUnit::MILLIS, true));
  EXPECT_FALSE(table->field(0).nullable);
  EXPECT_EQ(table->column(0)->cell_at(2), Cell::timestamp(3500, TimeUnit::MILLIS));
}

TEST(ParquetReaderTest, ByteStreamSplitDoubles) {
  std::vector<double> values{0.5, -8.0};
  std::vector<uint8_t> body;
  encoding::encode_byte_stream_split(values.data(), values.size(), body);
  auto table = test_util::decode(
      assemble({root_of(1), leaf("x", ParquetType::DOUBLE, false)},
               {{ParquetType::DOUBLE, {v1_page(ParquetEncoding::BYTE_STREAM_SPLIT, 2, body)}}},
               2));
  EXPECT_EQ(table->column(0)->cell_at(1), Cell::float64(-8.0));
}

TEST(ParquetReaderTest, DecimalBeyondDeclaredPrecision) {
  std::vector<int32_t> unscaled{12345, 1234567};
  NullBitmap valid;
  valid.push_back(true);
  valid.push_back(true);
  std::vector<uint8_t> body;
  encoding::encode_plain(unscaled.data(), valid, 0, 2, body);

  SchemaElement price = leaf("price", ParquetType::INT32, false);
  price.converted_type = ConvertedType::DECIMAL;
  price.precision = 5;
  price.scale = 2;
  try {
    test_util::decode(assemble({root_of(1), price},
                               {{ParquetType::INT32, {v1_page(ParquetEncoding::PLAIN, 2, body)}}},
                               2));
    FAIL() << "expected DECODE_ERROR";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::DECODE_ERROR);
    EXPECT_EQ(e.error().column, "price");
    EXPECT_NE(e.error().message.find("12345.67"), std::string::npos);
  }
}

TEST(ParquetReaderTest, UnsupportedColumnsAreNamedNotDecoded) {
  SchemaElement group;
  group.name = "point";
  group.num_children = 1;
  group.repetition_type = FieldRepetitionType::OPTIONAL;

  std::vector<int32_t> ints{4, 5};
  NullBitmap valid;
  valid.push_back(true);
  valid.push_back(true);
  std::vector<uint8_t> body;
  encoding::encode_plain(ints.data(), valid, 0, 2, body);

  auto table = test_util::decode(assemble(
      {root_of(3), leaf("legacy", ParquetType::INT96, true), group,
       leaf("x", ParquetType::INT32, true), leaf("n", ParquetType::INT32, false)},
      {{ParquetType::INT96, {}},
       {ParquetType::INT32, {}},
       {ParquetType::INT32, {v1_page(ParquetEncoding::PLAIN, 2, body)}}},
      2));

  ASSERT_EQ(table->num_columns(), 3u);
  EXPECT_EQ(table->field(0).source_type, "INT96");
  EXPECT_EQ(table->column(0), nullptr);
  EXPECT_EQ(table->field(1).name, "point");
  EXPECT_FALSE(table->field(1).type.has_value());
  EXPECT_EQ(table->column(1), nullptr);
  EXPECT_EQ(table->column(2)->cell_at(1), Cell::int32(5));

  // The catalog names the first unsupported field
  try {
    SchemaCatalog::from_source_table(*table);
    FAIL() << "expected UNSUPPORTED_TYPE";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_TYPE);
    EXPECT_EQ(e.error().column, "legacy");
  }
}

// ============================================================================
// MALFORMED FILES
// ============================================================================

TEST(ParquetReaderTest, TooSmall) {
  expect_decode_error({'P', 'A', 'R', '1'});
  expect_decode_error({});
}

TEST(ParquetReaderTest, BadMagic) {
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table());
  bytes[0] = 'X';
  expect_decode_error(bytes);
}

TEST(ParquetReaderTest, Truncated) {
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table());
  bytes.pop_back();
  expect_decode_error(bytes);

  std::vector<uint8_t> half(bytes.begin(), bytes.begin() + bytes.size() / 2);
  expect_decode_error(half);
}

TEST(ParquetReaderTest, FooterLengthOutOfRange) {
  std::vector<uint8_t> bytes = test_util::encode(*test_util::sample_table());
  size_t at = bytes.size() - 8;
  bytes[at] = bytes[at + 1] = bytes[at + 2] = bytes[at + 3] = 0xFF;
  expect_decode_error(bytes);
}

TEST(ParquetReaderTest, TextFileIsNotParquet) {
  std::string text = "id,name\n1,Alice\n2,Bob\n";
  expect_decode_error(std::vector<uint8_t>(text.begin(), text.end()));
}

TEST(ParquetReaderTest, RowCountDisagreesWithRowGroups) {
  std::vector<int32_t> ints{1};
  NullBitmap valid;
  valid.push_back(true);
  std::vector<uint8_t> body;
  encoding::encode_plain(ints.data(), valid, 0, 1, body);
  expect_decode_error(assemble({root_of(1), leaf("n", ParquetType::INT32, false)},
                               {{ParquetType::INT32, {v1_page(ParquetEncoding::PLAIN, 1, body)}}},
                               1, 5));
}

TEST(ParquetReaderTest, PageShorterThanDeclared) {
  std::vector<uint8_t> body{1, 0, 0, 0}; // one INT32 for a two-value page
  expect_decode_error(assemble({root_of(1), leaf("n", ParquetType::INT32, false)},
                               {{ParquetType::INT32, {v1_page(ParquetEncoding::PLAIN, 2, body)}}},
                               2));
}

// ============================================================================
// ENCODE ERRORS
// ============================================================================

TEST(ParquetWriterTest, NullInRequiredColumn) {
  std::vector<Column> columns{{"id", LogicalType::int64(), false}};
  auto table =
      test_util::make_table(columns, {{Cell::int64(1)}, {Cell::int64(2)}, {Cell::null()}});
  try {
    test_util::encode(*table);
    FAIL() << "expected ENCODE_ERROR";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::ENCODE_ERROR);
    EXPECT_EQ(e.error().column, "id");
    EXPECT_EQ(e.error().row, 2u);
  }
}

TEST(ParquetWriterTest, DecimalBeyondPrecisionIsNotWrapped) {
  try {
    test_util::encode(*test_util::oversized_decimal_table());
    FAIL() << "expected ENCODE_ERROR";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::ENCODE_ERROR);
    EXPECT_EQ(e.error().column, "price");
    EXPECT_EQ(e.error().row, 1u);
  }
}

TEST(ParquetWriterTest, FieldWithoutType) {
  std::vector<FieldDescriptor> fields(1);
  fields[0].name = "legacy";
  fields[0].source_type = "INT96";
  std::vector<std::unique_ptr<ColumnVector>> vectors(1);
  ColumnarTable table(std::move(fields), std::move(vectors), 0);
  try {
    test_util::encode(table);
    FAIL() << "expected ENCODE_ERROR";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::ENCODE_ERROR);
    EXPECT_NE(e.error().message.find("INT96"), std::string::npos);
  }
}

TEST(ParquetWriterTest, VectorTypeDisagreesWithField) {
  std::vector<FieldDescriptor> fields{FieldDescriptor::from_column({"a", LogicalType::date()})};
  std::vector<std::unique_ptr<ColumnVector>> vectors;
  vectors.push_back(ColumnVector::create(LogicalType::int32()));
  ColumnarTable table(std::move(fields), std::move(vectors), 0);
  EXPECT_THROW(test_util::encode(table), StudioException);
}

TEST(ParquetWriterTest, EncodeColumnSubrange) {
  auto vec = ColumnVector::create(LogicalType::int32());
  for (int32_t i = 0; i < 10; ++i) {
    vec->append(i == 4 ? Cell::null() : Cell::int32(i));
  }
  EncodedColumn encoded = encode_column(*vec, {"n", LogicalType::int32()}, 3, 7, uncompressed());
  EXPECT_EQ(encoded.num_values, 4);
  EXPECT_EQ(encoded.physical_type, ParquetType::INT32);
  EXPECT_EQ(encoded.actual_codec, CompressionCodec::UNCOMPRESSED);
  ASSERT_TRUE(encoded.statistics.has_value());
  EXPECT_EQ(encoded.statistics->null_count, 1);
  // Levels prefix, levels, then three present INT32 values
  EXPECT_EQ(encoded.content_bytes.size(), static_cast<size_t>(encoded.uncompressed_size));
  EXPECT_GE(encoded.content_bytes.size(), 4u + 3u * 4u);
}
