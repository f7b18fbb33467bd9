#include "exporters.h"

#include "pqstudio/value_parsers.h"

#include <cmath>
#include <string>
#include <type_traits>
#include <vector>

namespace pqstudio {
namespace exporters {

namespace {

class JsonWriter {
public:
  JsonWriter(const Snapshot& snapshot, const ExportOptions& options, std::string& out,
             ErrorCollector& warnings)
      : snapshot_(snapshot), catalog_(snapshot.catalog()), options_(options), out_(out),
        warnings_(warnings) {}

  void write() {
    encode_keys();

    if (snapshot_.row_count() == 0) {
      out_ += "[]";
      newline_at_end();
      return;
    }

    out_ += '[';
    for (size_t row = 0; row < snapshot_.row_count(); ++row) {
      if (row > 0)
        out_ += ',';
      newline(1);
      write_row(row);
    }
    newline(0);
    out_ += ']';
    newline_at_end();
  }

private:
  bool pretty() const { return options_.json_indent > 0; }

  void newline(int depth) {
    if (!pretty())
      return;
    out_ += '\n';
    out_.append(static_cast<size_t>(depth * options_.json_indent), ' ');
  }

  void newline_at_end() {
    if (pretty())
      out_ += '\n';
  }

  // Keys are the same for every row, so escape them once
  void encode_keys() {
    const char* separator = pretty() ? ": " : ":";
    keys_.clear();
    keys_.reserve(catalog_.size());
    for (const Column& column : catalog_.columns()) {
      std::string key;
      if (!append_json_string(column.name, key)) {
        StudioError err(ErrorCode::EXPORT_ERROR, ErrorSeverity::WARNING,
                        "column name is not valid UTF-8, replaced invalid bytes with U+FFFD");
        err.column = column.name;
        warnings_.add_error(err);
      }
      key += separator;
      keys_.push_back(std::move(key));
    }
    row_number_key_ = std::string("\"") + ROW_NUMBER_COLUMN + "\"" + separator;
  }

  void write_row(size_t row) {
    out_ += '{';
    bool first = true;
    if (options_.include_row_numbers) {
      newline(2);
      out_ += row_number_key_;
      out_ += std::to_string(row + 1);
      first = false;
    }
    for (size_t col = 0; col < catalog_.size(); ++col) {
      if (!first)
        out_ += ',';
      first = false;
      newline(2);
      out_ += keys_[col];
      write_value(snapshot_.cell(row, col), catalog_.column(col), row);
    }
    newline(1);
    out_ += '}';
  }

  template <typename T> void write_floating(T value, const Column& column, size_t row) {
    if (!std::isfinite(value)) {
      out_ += "null";
      warnings_.add_warning(ErrorCode::EXPORT_ERROR, column.name, row,
                            "non-finite value " + format_float64(static_cast<double>(value)) +
                                " has no JSON representation, written as null");
      return;
    }
    out_ += std::is_same_v<T, float> ? format_float32(static_cast<float>(value))
                                     : format_float64(static_cast<double>(value));
  }

  void write_text(std::string_view text, const Column& column, size_t row) {
    if (!append_json_string(text, out_)) {
      warnings_.add_warning(ErrorCode::EXPORT_ERROR, column.name, row,
                            "text is not valid UTF-8, replaced invalid bytes with U+FFFD");
    }
  }

  void write_value(const Cell& cell, const Column& column, size_t row) {
    if (cell.is_null()) {
      out_ += "null";
    } else if (cell.holds<bool>()) {
      out_ += cell.get<bool>() ? "true" : "false";
    } else if (cell.holds<int32_t>()) {
      out_ += std::to_string(cell.get<int32_t>());
    } else if (cell.holds<int64_t>()) {
      out_ += std::to_string(cell.get<int64_t>());
    } else if (cell.holds<float>()) {
      write_floating(cell.get<float>(), column, row);
    } else if (cell.holds<double>()) {
      write_floating(cell.get<double>(), column, row);
    } else if (cell.holds<std::string>()) {
      write_text(cell.get<std::string>(), column, row);
    } else if (cell.holds<RawEdit>()) {
      write_text(cell.get<RawEdit>().text, column, row);
    } else {
      // Binary (base64), Date, Timestamp and Decimal as canonical text
      write_text(cell_text(cell, column), column, row);
    }
  }

  const Snapshot& snapshot_;
  const SchemaCatalog& catalog_;
  const ExportOptions& options_;
  std::string& out_;
  ErrorCollector& warnings_;
  std::vector<std::string> keys_;
  std::string row_number_key_;
};

} // namespace

void write_json(const Snapshot& snapshot, const ExportOptions& options, std::string& out,
                ErrorCollector& warnings) {
  JsonWriter writer(snapshot, options, out, warnings);
  writer.write();
}

} // namespace exporters
} // namespace pqstudio
