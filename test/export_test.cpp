/**
 * @file export_test.cpp
 * @brief Tests for CSV, JSON and XLSX export.
 */

#include "pqstudio/export_pipeline.h"

#include "exporters.h"
#include "zip_writer.h"

#include "test_util.h"

#include <cmath>
#include <cstring>
#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <zlib.h>

using namespace pqstudio;

namespace {

// a INT32, s STRING: {1, x"y} and {null, tab\t}
EditBuffer small_buffer() {
  return test_util::make_buffer({{"a", LogicalType::int32()}, {"s", LogicalType::string()}},
                                {{Cell::int32(1), Cell::string("x\"y")},
                                 {Cell::null(), Cell::string("tab\t")}});
}

std::string export_text(const Snapshot& snapshot, ExportFormat format,
                        const ExportOptions& options = {}) {
  std::vector<uint8_t> sink;
  export_snapshot(snapshot, format, sink, options);
  return test_util::as_string(sink);
}

uint16_t u16_at(const std::vector<uint8_t>& b, size_t pos) {
  return static_cast<uint16_t>(b[pos] | (b[pos + 1] << 8));
}

uint32_t u32_at(const std::vector<uint8_t>& b, size_t pos) {
  return static_cast<uint32_t>(b[pos]) | (static_cast<uint32_t>(b[pos + 1]) << 8) |
         (static_cast<uint32_t>(b[pos + 2]) << 16) | (static_cast<uint32_t>(b[pos + 3]) << 24);
}

std::string inflate_raw(const uint8_t* data, size_t size, size_t expected) {
  std::string out(expected, '\0');
  z_stream stream{};
  EXPECT_EQ(inflateInit2(&stream, -15), Z_OK);
  stream.next_in = const_cast<Bytef*>(data);
  stream.avail_in = static_cast<uInt>(size);
  stream.next_out = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());
  int result = inflate(&stream, Z_FINISH);
  inflateEnd(&stream);
  EXPECT_EQ(result, Z_STREAM_END);
  return out;
}

// Entries of a ZIP archive in central directory order, CRCs checked
std::vector<std::pair<std::string, std::string>> unzip(const std::vector<uint8_t>& archive) {
  std::vector<std::pair<std::string, std::string>> entries;
  if (archive.size() < 22) {
    ADD_FAILURE() << "archive too small";
    return entries;
  }
  size_t eocd = archive.size() - 22;
  EXPECT_EQ(u32_at(archive, eocd), 0x06054b50u);
  size_t count = u16_at(archive, eocd + 10);
  size_t pos = u32_at(archive, eocd + 16);

  for (size_t i = 0; i < count; ++i) {
    EXPECT_EQ(u32_at(archive, pos), 0x02014b50u);
    EXPECT_EQ(u16_at(archive, pos + 10), 8); // deflate
    uint32_t crc = u32_at(archive, pos + 16);
    uint32_t compressed = u32_at(archive, pos + 20);
    uint32_t uncompressed = u32_at(archive, pos + 24);
    uint16_t name_len = u16_at(archive, pos + 28);
    uint32_t local = u32_at(archive, pos + 42);
    std::string name(archive.begin() + pos + 46, archive.begin() + pos + 46 + name_len);
    pos += 46 + name_len;

    EXPECT_EQ(u32_at(archive, local), 0x04034b50u);
    size_t data = local + 30 + u16_at(archive, local + 26) + u16_at(archive, local + 28);
    std::string content = inflate_raw(archive.data() + data, compressed, uncompressed);
    uLong actual = crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(content.data()),
                         static_cast<uInt>(content.size()));
    EXPECT_EQ(actual, crc) << name;
    entries.emplace_back(name, content);
  }
  return entries;
}

std::string sheet_xml(const std::vector<uint8_t>& archive) {
  for (const auto& [name, content] : unzip(archive)) {
    if (name == "xl/worksheets/sheet1.xml")
      return content;
  }
  ADD_FAILURE() << "no worksheet in archive";
  return {};
}

} // namespace

// ============================================================================
// FORMAT NAMES
// ============================================================================

TEST(ExportFormatTest, ParseAndName) {
  EXPECT_EQ(parse_export_format("CSV"), ExportFormat::CSV);
  EXPECT_EQ(parse_export_format("json"), ExportFormat::JSON);
  EXPECT_EQ(parse_export_format("Excel"), ExportFormat::XLSX);
  EXPECT_FALSE(parse_export_format("parquet").has_value());
  EXPECT_STREQ(export_format_name(ExportFormat::XLSX), "xlsx");
}

TEST(ExportFormatTest, DefaultFilename) {
  auto when = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
  EXPECT_EQ(default_export_filename(ExportFormat::JSON, when), "export_1700000000123.json");
}

// ============================================================================
// CSV
// ============================================================================

TEST(CsvExportTest, HeaderAndQuoting) {
  EditBuffer buffer = small_buffer();
  EXPECT_EQ(export_text(buffer.snapshot(), ExportFormat::CSV),
            "a,s\n"
            "1,\"x\"\"y\"\n"
            ",tab\t\n");
}

TEST(CsvExportTest, RowNumbersAndSeparator) {
  EditBuffer buffer = small_buffer();
  ExportOptions options;
  options.include_row_numbers = true;
  options.separator = '\t';
  EXPECT_EQ(export_text(buffer.snapshot(), ExportFormat::CSV, options),
            "SN\ta\ts\n"
            "1\t1\t\"x\"\"y\"\n"
            "2\t\t\"tab\t\"\n");
}

TEST(CsvExportTest, NoHeader) {
  EditBuffer buffer = small_buffer();
  ExportOptions options;
  options.include_header = false;
  EXPECT_EQ(export_text(buffer.snapshot(), ExportFormat::CSV, options), "1,\"x\"\"y\"\n,tab\t\n");
}

TEST(CsvExportTest, InvalidSeparator) {
  EditBuffer buffer = small_buffer();
  ExportOptions options;
  options.separator = '"';
  std::vector<uint8_t> sink;
  try {
    export_snapshot(buffer.snapshot(), ExportFormat::CSV, sink, options);
    FAIL() << "expected EXPORT_ERROR";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::EXPORT_ERROR);
  }
  EXPECT_TRUE(sink.empty());
}

TEST(CsvExportTest, CanonicalCellText) {
  EditBuffer buffer =
      test_util::make_buffer(test_util::sample_columns(), test_util::sample_rows());
  std::string csv = export_text(buffer.snapshot(), ExportFormat::CSV);

  EXPECT_EQ(csv.substr(0, csv.find('\n')),
            "id,name,age,score,ratio,active,payload,born,seen,price,big");
  EXPECT_NE(csv.find("1,Alice,30,91.5,0.25,true,AP8=,2022-01-08,2023-11-14T22:13:20.123456Z,"
                     "123.45,12345678901234567812.3456\n"),
            std::string::npos);
  EXPECT_NE(csv.find("2,,-7,,-1.5,false,,,,-0.05,-12345678901234567812.3456\n"), std::string::npos);
  EXPECT_NE(csv.find("3,\"Carol, \"\"C\"\"\",,-0.125,,true,YWJj,1969-12-31,"
                     "1969-12-31T23:59:59.999999Z,,\n"),
            std::string::npos);
}

TEST(CsvExportTest, PendingEditsExportAsEntered) {
  EditBuffer buffer = small_buffer();
  buffer.set_cell(1, "a", "not a number");
  std::string csv = export_text(buffer.snapshot(), ExportFormat::CSV);
  EXPECT_NE(csv.find("not a number,tab"), std::string::npos);
}

TEST(CsvExportTest, EmptyTableHasHeaderOnly) {
  EditBuffer buffer = test_util::make_buffer({{"only", LogicalType::date()}}, {});
  ExportResult result;
  std::vector<uint8_t> sink;
  result = export_snapshot(buffer.snapshot(), ExportFormat::CSV, sink);
  EXPECT_EQ(test_util::as_string(sink), "only\n");
  EXPECT_EQ(result.rows, 0u);
  EXPECT_EQ(result.bytes, 5u);
}

TEST(CsvExportTest, NullAndEmptyStringShareEmptyField) {
  EditBuffer buffer = test_util::make_buffer(
      {{"s", LogicalType::string(), true}},
      {{Cell::null()}, {Cell::string("")}, {Cell::string("a")}});
  std::vector<uint8_t> sink;
  export_snapshot(buffer.snapshot(), ExportFormat::CSV, sink);
  EXPECT_EQ(test_util::as_string(sink), "s\n\n\na\n");

  sink.clear();
  export_snapshot(buffer.snapshot(), ExportFormat::JSON, sink);
  std::string json = test_util::as_string(sink);
  EXPECT_NE(json.find("\"s\": null"), std::string::npos);
  EXPECT_NE(json.find("\"s\": \"\""), std::string::npos);
}

// ============================================================================
// JSON
// ============================================================================

TEST(JsonExportTest, PrettyByDefault) {
  EditBuffer buffer = small_buffer();
  EXPECT_EQ(export_text(buffer.snapshot(), ExportFormat::JSON),
            "[\n"
            "  {\n"
            "    \"a\": 1,\n"
            "    \"s\": \"x\\\"y\"\n"
            "  },\n"
            "  {\n"
            "    \"a\": null,\n"
            "    \"s\": \"tab\\t\"\n"
            "  }\n"
            "]\n");
}

TEST(JsonExportTest, CompactWithRowNumbers) {
  EditBuffer buffer = small_buffer();
  ExportOptions options;
  options.json_indent = 0;
  options.include_row_numbers = true;
  EXPECT_EQ(export_text(buffer.snapshot(), ExportFormat::JSON, options),
            "[{\"SN\":1,\"a\":1,\"s\":\"x\\\"y\"},{\"SN\":2,\"a\":null,\"s\":\"tab\\t\"}]");
}

TEST(JsonExportTest, EmptyArray) {
  EditBuffer buffer = test_util::make_buffer({{"a", LogicalType::int32()}}, {});
  EXPECT_EQ(export_text(buffer.snapshot(), ExportFormat::JSON), "[]\n");
}

TEST(JsonExportTest, NumbersStayNumbersTemporalAsText) {
  EditBuffer buffer =
      test_util::make_buffer(test_util::sample_columns(), test_util::sample_rows());
  ExportOptions options;
  options.json_indent = 0;
  std::string json = export_text(buffer.snapshot(), ExportFormat::JSON, options);
  EXPECT_NE(json.find("\"id\":1,\"name\":\"Alice\",\"age\":30,\"score\":91.5,\"ratio\":0.25,"
                      "\"active\":true,\"payload\":\"AP8=\",\"born\":\"2022-01-08\""),
            std::string::npos);
  EXPECT_NE(json.find("\"price\":\"-0.05\""), std::string::npos);
  EXPECT_NE(json.find("\"name\":\"Carol, \\\"C\\\"\""), std::string::npos);
}

TEST(JsonExportTest, NonFiniteBecomesNullWithWarning) {
  EditBuffer buffer = test_util::make_buffer(
      {{"x", LogicalType::float64()}},
      {{Cell::float64(std::numeric_limits<double>::quiet_NaN())}, {Cell::float64(2.0)}});
  ExportOptions options;
  options.json_indent = 0;
  std::vector<uint8_t> sink;
  ExportResult result = export_snapshot(buffer.snapshot(), ExportFormat::JSON, sink, options);

  EXPECT_EQ(test_util::as_string(sink), "[{\"x\":null},{\"x\":2}]");
  ASSERT_EQ(result.warnings.warning_count(), 1u);
  const StudioError& w = result.warnings.errors()[0];
  EXPECT_EQ(w.code, ErrorCode::EXPORT_ERROR);
  EXPECT_EQ(w.column, "x");
  EXPECT_EQ(w.row, 0u);
}

TEST(JsonExportTest, InvalidUtf8Replaced) {
  EditBuffer buffer = test_util::make_buffer({{"s", LogicalType::string()}},
                                             {{Cell::string("ok\xff")}, {Cell::string("\x01")}});
  ExportOptions options;
  options.json_indent = 0;
  std::vector<uint8_t> sink;
  ExportResult result = export_snapshot(buffer.snapshot(), ExportFormat::JSON, sink, options);
  EXPECT_EQ(test_util::as_string(sink), "[{\"s\":\"ok\xEF\xBF\xBD\"},{\"s\":\"\\u0001\"}]");
  EXPECT_EQ(result.warnings.warning_count(), 1u);
}

TEST(JsonExportTest, WarningsAreCapped) {
  std::vector<Row> rows(20, Row{Cell::float64(std::numeric_limits<double>::infinity())});
  EditBuffer buffer = test_util::make_buffer({{"x", LogicalType::float64()}}, rows);
  ExportOptions options;
  options.max_warnings = 5;
  std::vector<uint8_t> sink;
  ExportResult result = export_snapshot(buffer.snapshot(), ExportFormat::JSON, sink, options);
  EXPECT_EQ(result.warnings.warning_count(), 5u);
  EXPECT_EQ(result.warnings.suppressed_count(), 15u);
}

// ============================================================================
// TEXT HELPERS
// ============================================================================

TEST(ExportTextTest, Utf8Validation) {
  std::string out;
  EXPECT_TRUE(exporters::append_utf8("h\xc3\xa9llo \xf0\x9f\x98\x80", out));
  EXPECT_EQ(out, "h\xc3\xa9llo \xf0\x9f\x98\x80");

  out.clear();
  EXPECT_FALSE(exporters::append_utf8("\xc0\xaf", out)); // overlong '/'
  EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD");

  out.clear();
  EXPECT_FALSE(exporters::append_utf8("\xed\xa0\x80", out)); // surrogate
}

TEST(ExportTextTest, XmlEscapes) {
  std::string out;
  EXPECT_TRUE(exporters::append_xml_text("a<b>&\"c\"\n", out));
  EXPECT_EQ(out, "a&lt;b&gt;&amp;&quot;c&quot;\n");
  out.clear();
  EXPECT_FALSE(exporters::append_xml_text("bell\x07", out));
  EXPECT_EQ(out, "bell\xEF\xBF\xBD");
}

TEST(ExportTextTest, UtcTimestampsCarryZone) {
  Cell ts = Cell::timestamp(0, TimeUnit::MILLIS);
  EXPECT_EQ(exporters::cell_text(ts, {"t", LogicalType::timestamp(TimeUnit::MILLIS, true)}),
            "1970-01-01T00:00:00Z");
  EXPECT_EQ(exporters::cell_text(ts, {"t", LogicalType::timestamp(TimeUnit::MILLIS, false)}),
            "1970-01-01T00:00:00");
}

// ============================================================================
// XLSX
// ============================================================================

TEST(ZipWriterTest, ArchiveIsReadable) {
  exporters::ZipWriter zip;
  zip.add_file("a.txt", "hello hello hello");
  zip.add_file("dir/empty.txt", "");
  EXPECT_EQ(zip.entry_count(), 2u);
  auto entries = unzip(zip.finish());
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first, "a.txt");
  EXPECT_EQ(entries[0].second, "hello hello hello");
  EXPECT_EQ(entries[1].second, "");
  EXPECT_EQ(zip.entry_count(), 0u);
}

TEST(ZipWriterTest, Deterministic) {
  auto build = [] {
    exporters::ZipWriter zip;
    zip.add_file("x.xml", "<x/>");
    return zip.finish();
  };
  EXPECT_EQ(build(), build());
}

TEST(XlsxExportTest, PackageParts) {
  EditBuffer buffer = small_buffer();
  std::vector<uint8_t> sink;
  export_snapshot(buffer.snapshot(), ExportFormat::XLSX, sink);
  ASSERT_GE(sink.size(), 4u);
  EXPECT_EQ(std::memcmp(sink.data(), "PK\x03\x04", 4), 0);

  std::map<std::string, std::string> parts;
  for (auto& [name, content] : unzip(sink)) {
    parts[name] = content;
  }
  ASSERT_EQ(parts.size(), 5u);
  EXPECT_TRUE(parts.count("[Content_Types].xml"));
  EXPECT_TRUE(parts.count("_rels/.rels"));
  EXPECT_TRUE(parts.count("xl/_rels/workbook.xml.rels"));
  EXPECT_NE(parts["xl/workbook.xml"].find("<sheet name=\"Data\""), std::string::npos);
}

TEST(XlsxExportTest, CellsAreTyped) {
  EditBuffer buffer = test_util::make_buffer(
      {{"n", LogicalType::int32()}, {"s", LogicalType::string()}, {"b", LogicalType::boolean()}},
      {{Cell::int32(42), Cell::string("a<b"), Cell::boolean(true)},
       {Cell::null(), Cell::string(""), Cell::boolean(false)}});
  std::vector<uint8_t> sink;
  ExportResult result = export_snapshot(buffer.snapshot(), ExportFormat::XLSX, sink);
  std::string xml = sheet_xml(sink);

  EXPECT_NE(xml.find("<row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">n"
                     "</t></is></c>"),
            std::string::npos);
  EXPECT_NE(xml.find("<c r=\"A2\"><v>42</v></c>"), std::string::npos);
  EXPECT_NE(xml.find("<t xml:space=\"preserve\">a&lt;b</t>"), std::string::npos);
  EXPECT_NE(xml.find("<c r=\"C2\" t=\"b\"><v>1</v></c>"), std::string::npos);
  EXPECT_EQ(xml.find("r=\"A3\""), std::string::npos); // null cell omitted
  EXPECT_NE(xml.find("<c r=\"C3\" t=\"b\"><v>0</v></c>"), std::string::npos);
  EXPECT_EQ(result.rows, 2u);
  EXPECT_EQ(result.warnings.error_count(), 0u);
}

TEST(XlsxExportTest, RowNumberColumnShiftsCells) {
  EditBuffer buffer = small_buffer();
  ExportOptions options;
  options.include_row_numbers = true;
  std::vector<uint8_t> sink;
  export_snapshot(buffer.snapshot(), ExportFormat::XLSX, sink, options);
  std::string xml = sheet_xml(sink);
  EXPECT_NE(xml.find("<t xml:space=\"preserve\">SN</t>"), std::string::npos);
  EXPECT_NE(xml.find("<c r=\"A3\"><v>2</v></c>"), std::string::npos);
  EXPECT_NE(xml.find("<c r=\"B2\"><v>1</v></c>"), std::string::npos);
}

TEST(XlsxExportTest, ImpreciseNumbersBecomeText) {
  Int128 wide = static_cast<Int128>(1234567890123456789LL);
  EditBuffer buffer = test_util::make_buffer(
      {{"big", LogicalType::int64()}, {"d", LogicalType::decimal(20, 2)}},
      {{Cell::int64((int64_t{1} << 53) + 1), Cell::decimal(wide, 20, 2)},
       {Cell::int64(5), Cell::decimal(150, 20, 2)}});
  std::vector<uint8_t> sink;
  ExportResult result = export_snapshot(buffer.snapshot(), ExportFormat::XLSX, sink);
  std::string xml = sheet_xml(sink);

  EXPECT_NE(xml.find("<t xml:space=\"preserve\">9007199254740993</t>"), std::string::npos);
  EXPECT_NE(xml.find("<t xml:space=\"preserve\">12345678901234567.89</t>"), std::string::npos);
  EXPECT_NE(xml.find("<c r=\"A3\"><v>5</v></c>"), std::string::npos);
  EXPECT_NE(xml.find("<c r=\"B3\"><v>1.50</v></c>"), std::string::npos);
  EXPECT_EQ(result.warnings.warning_count(), 2u);
}

TEST(XlsxExportTest, SheetNameValidation) {
  EditBuffer buffer = small_buffer();
  for (const std::string& name :
       {std::string(""), std::string("a/b"), std::string(32, 'x'), std::string("'quoted'"),
        std::string("what?")}) {
    ExportOptions options;
    options.sheet_name = name;
    std::vector<uint8_t> sink;
    try {
      export_snapshot(buffer.snapshot(), ExportFormat::XLSX, sink, options);
      FAIL() << "expected EXPORT_ERROR for '" << name << "'";
    } catch (const StudioException& e) {
      EXPECT_EQ(e.code(), ErrorCode::EXPORT_ERROR);
    }
  }

  ExportOptions options;
  options.sheet_name = "Q3 & Q4";
  std::vector<uint8_t> sink;
  export_snapshot(buffer.snapshot(), ExportFormat::XLSX, sink, options);
  for (auto& [name, content] : unzip(sink)) {
    if (name == "xl/workbook.xml")
      EXPECT_NE(content.find("name=\"Q3 &amp; Q4\""), std::string::npos);
  }
}

TEST(XlsxExportTest, ExportDoesNotTouchBuffer) {
  EditBuffer buffer = small_buffer();
  buffer.set_cell(0, "a", "7");
  std::vector<uint8_t> sink;
  export_snapshot(buffer.snapshot(), ExportFormat::XLSX, sink);
  EXPECT_EQ(buffer.cell(0, 0), Cell::raw("7"));
  EXPECT_EQ(buffer.edit_count(), 1u);
}
