#include "exporters.h"
#include "zip_writer.h"

#include "pqstudio/value_parsers.h"

#include <cmath>
#include <string>
#include <type_traits>
#include <vector>

namespace pqstudio {
namespace exporters {

namespace {

// Worksheet limits of the Office Open XML spreadsheet format
constexpr size_t MAX_SHEET_ROWS = 1048576;
constexpr size_t MAX_SHEET_COLUMNS = 16384;
constexpr size_t MAX_SHEET_NAME = 31;

// Spreadsheet numbers are IEEE doubles
constexpr int64_t MAX_EXACT_INTEGER = int64_t{1} << 53;
constexpr int MAX_EXACT_DIGITS = 15;

constexpr const char CONTENT_TYPES_XML[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" "
    "ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/xl/workbook.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>"
    "<Override PartName=\"/xl/worksheets/sheet1.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>"
    "</Types>";

constexpr const char ROOT_RELS_XML[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
    "Target=\"xl/workbook.xml\"/>"
    "</Relationships>";

constexpr const char WORKBOOK_RELS_XML[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" "
    "Target=\"worksheets/sheet1.xml\"/>"
    "</Relationships>";

void validate_sheet_name(const std::string& name) {
  if (name.empty() || name.size() > MAX_SHEET_NAME) {
    throw StudioException(ErrorCode::EXPORT_ERROR,
                          "worksheet name must be 1 to 31 characters: '" + name + "'");
  }
  if (name.find_first_of("[]:*?/\\") != std::string::npos || name.front() == '\'' ||
      name.back() == '\'') {
    throw StudioException(ErrorCode::EXPORT_ERROR, "invalid worksheet name: '" + name + "'");
  }
}

std::string workbook_xml(const std::string& sheet_name) {
  std::string xml =
      "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
      "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
      "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
      "<sheets><sheet name=\"";
  if (!append_xml_text(sheet_name, xml)) {
    throw StudioException(ErrorCode::EXPORT_ERROR,
                          "worksheet name is not valid UTF-8 text: '" + sheet_name + "'");
  }
  xml += "\" sheetId=\"1\" r:id=\"rId1\"/></sheets></workbook>";
  return xml;
}

// 0 -> "A", 25 -> "Z", 26 -> "AA"
std::string column_letters(size_t index) {
  std::string letters;
  size_t n = index + 1;
  while (n > 0) {
    size_t rem = (n - 1) % 26;
    letters.insert(letters.begin(), static_cast<char>('A' + rem));
    n = (n - 1) / 26;
  }
  return letters;
}

class SheetWriter {
public:
  SheetWriter(const Snapshot& snapshot, const ExportOptions& options, ErrorCollector& warnings)
      : snapshot_(snapshot), catalog_(snapshot.catalog()), options_(options),
        warnings_(warnings) {}

  std::string write() {
    size_t width = catalog_.size() + (options_.include_row_numbers ? 1 : 0);
    size_t height = snapshot_.row_count() + (options_.include_header ? 1 : 0);
    if (width > MAX_SHEET_COLUMNS) {
      throw StudioException(ErrorCode::EXPORT_ERROR, "table has " + std::to_string(width) +
                                                         " columns, a worksheet holds at most " +
                                                         std::to_string(MAX_SHEET_COLUMNS));
    }
    if (height > MAX_SHEET_ROWS) {
      throw StudioException(ErrorCode::EXPORT_ERROR, "table needs " + std::to_string(height) +
                                                         " rows, a worksheet holds at most " +
                                                         std::to_string(MAX_SHEET_ROWS));
    }

    letters_.reserve(width);
    for (size_t i = 0; i < width; ++i)
      letters_.push_back(column_letters(i));

    xml_ = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
           "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">"
           "<sheetData>";

    size_t sheet_row = 0;
    if (options_.include_header)
      write_header(++sheet_row);
    for (size_t row = 0; row < snapshot_.row_count(); ++row)
      write_row(row, ++sheet_row);

    xml_ += "</sheetData></worksheet>";
    return std::move(xml_);
  }

private:
  void begin_row(size_t sheet_row) {
    xml_ += "<row r=\"";
    xml_ += std::to_string(sheet_row);
    xml_ += "\">";
  }

  void begin_cell(size_t sheet_col, size_t sheet_row, const char* type) {
    xml_ += "<c r=\"";
    xml_ += letters_[sheet_col];
    xml_ += std::to_string(sheet_row);
    xml_ += '"';
    if (type) {
      xml_ += " t=\"";
      xml_ += type;
      xml_ += '"';
    }
    xml_ += '>';
  }

  void number_cell(size_t sheet_col, size_t sheet_row, const std::string& text) {
    begin_cell(sheet_col, sheet_row, nullptr);
    xml_ += "<v>";
    xml_ += text;
    xml_ += "</v></c>";
  }

  // Returns false when the text had to be sanitized
  bool string_cell(size_t sheet_col, size_t sheet_row, std::string_view text) {
    begin_cell(sheet_col, sheet_row, "inlineStr");
    xml_ += "<is><t xml:space=\"preserve\">";
    bool clean = append_xml_text(text, xml_);
    xml_ += "</t></is></c>";
    return clean;
  }

  void write_header(size_t sheet_row) {
    begin_row(sheet_row);
    size_t sheet_col = 0;
    if (options_.include_row_numbers)
      string_cell(sheet_col++, sheet_row, ROW_NUMBER_COLUMN);
    for (const Column& column : catalog_.columns()) {
      if (!string_cell(sheet_col++, sheet_row, column.name)) {
        StudioError err(ErrorCode::EXPORT_ERROR, ErrorSeverity::WARNING,
                        "column name contains characters not allowed in XML, replaced with U+FFFD");
        err.column = column.name;
        warnings_.add_error(err);
      }
    }
    xml_ += "</row>";
  }

  void write_row(size_t row, size_t sheet_row) {
    begin_row(sheet_row);
    size_t sheet_col = 0;
    if (options_.include_row_numbers)
      number_cell(sheet_col++, sheet_row, std::to_string(row + 1));
    for (size_t col = 0; col < catalog_.size(); ++col, ++sheet_col) {
      const Cell& cell = snapshot_.cell(row, col);
      if (cell.is_null())
        continue; // absent cell = empty
      write_value(cell, catalog_.column(col), row, sheet_col, sheet_row);
    }
    xml_ += "</row>";
  }

  // Numbers a double cannot hold exactly are written as text
  void imprecise_number(const std::string& text, const Column& column, size_t row,
                        size_t sheet_col, size_t sheet_row) {
    string_cell(sheet_col, sheet_row, text);
    warnings_.add_warning(ErrorCode::EXPORT_ERROR, column.name, row,
                          "value " + text +
                              " exceeds spreadsheet number precision, written as text");
  }

  template <typename T>
  void floating_cell(T value, const Column& column, size_t row, size_t sheet_col,
                     size_t sheet_row) {
    std::string text;
    if constexpr (std::is_same_v<T, float>)
      text = format_float32(value);
    else
      text = format_float64(value);
    if (!std::isfinite(value)) {
      string_cell(sheet_col, sheet_row, text);
      warnings_.add_warning(ErrorCode::EXPORT_ERROR, column.name, row,
                            "non-finite value " + text +
                                " has no spreadsheet number form, written as text");
      return;
    }
    number_cell(sheet_col, sheet_row, text);
  }

  void write_value(const Cell& cell, const Column& column, size_t row, size_t sheet_col,
                   size_t sheet_row) {
    if (cell.holds<bool>()) {
      begin_cell(sheet_col, sheet_row, "b");
      xml_ += cell.get<bool>() ? "<v>1</v></c>" : "<v>0</v></c>";
    } else if (cell.holds<int32_t>()) {
      number_cell(sheet_col, sheet_row, std::to_string(cell.get<int32_t>()));
    } else if (cell.holds<int64_t>()) {
      int64_t v = cell.get<int64_t>();
      if (v > MAX_EXACT_INTEGER || v < -MAX_EXACT_INTEGER)
        imprecise_number(std::to_string(v), column, row, sheet_col, sheet_row);
      else
        number_cell(sheet_col, sheet_row, std::to_string(v));
    } else if (cell.holds<float>()) {
      floating_cell(cell.get<float>(), column, row, sheet_col, sheet_row);
    } else if (cell.holds<double>()) {
      floating_cell(cell.get<double>(), column, row, sheet_col, sheet_row);
    } else if (cell.holds<Decimal>()) {
      const Decimal& d = cell.get<Decimal>();
      std::string text = format_decimal(d.unscaled, d.scale);
      if (decimal_digits(d.unscaled) > MAX_EXACT_DIGITS)
        imprecise_number(text, column, row, sheet_col, sheet_row);
      else
        number_cell(sheet_col, sheet_row, text);
    } else {
      // Strings, raw edits, binary (base64), dates and timestamps
      if (!string_cell(sheet_col, sheet_row, cell_text(cell, column))) {
        warnings_.add_warning(ErrorCode::EXPORT_ERROR, column.name, row,
                              "text is not valid UTF-8 or contains characters not allowed "
                              "in XML, replaced with U+FFFD");
      }
    }
  }

  const Snapshot& snapshot_;
  const SchemaCatalog& catalog_;
  const ExportOptions& options_;
  ErrorCollector& warnings_;
  std::vector<std::string> letters_;
  std::string xml_;
};

} // namespace

void write_xlsx(const Snapshot& snapshot, const ExportOptions& options,
                std::vector<uint8_t>& out, ErrorCollector& warnings) {
  validate_sheet_name(options.sheet_name);

  SheetWriter sheet(snapshot, options, warnings);
  std::string sheet_xml = sheet.write();

  ZipWriter zip;
  zip.add_file("[Content_Types].xml", CONTENT_TYPES_XML);
  zip.add_file("_rels/.rels", ROOT_RELS_XML);
  zip.add_file("xl/workbook.xml", workbook_xml(options.sheet_name));
  zip.add_file("xl/_rels/workbook.xml.rels", WORKBOOK_RELS_XML);
  zip.add_file("xl/worksheets/sheet1.xml", sheet_xml);

  std::vector<uint8_t> archive = zip.finish();
  out.insert(out.end(), archive.begin(), archive.end());
}

} // namespace exporters
} // namespace pqstudio
