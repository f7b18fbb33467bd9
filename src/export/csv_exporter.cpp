#include "exporters.h"

#include <string>

namespace pqstudio {
namespace exporters {

void write_csv(const Snapshot& snapshot, const ExportOptions& options, std::string& out,
               ErrorCollector& /*warnings*/) {
  const SchemaCatalog& catalog = snapshot.catalog();
  const char sep = options.separator;

  if (options.include_header) {
    bool first = true;
    if (options.include_row_numbers) {
      append_csv_field(ROW_NUMBER_COLUMN, sep, out);
      first = false;
    }
    for (const Column& column : catalog.columns()) {
      if (!first)
        out += sep;
      append_csv_field(column.name, sep, out);
      first = false;
    }
    out += '\n';
  }

  // Text is written byte for byte; CSV carries no encoding of its own
  for (size_t row = 0; row < snapshot.row_count(); ++row) {
    bool first = true;
    if (options.include_row_numbers) {
      out += std::to_string(row + 1);
      first = false;
    }
    for (size_t col = 0; col < catalog.size(); ++col) {
      if (!first)
        out += sep;
      first = false;
      const Cell& cell = snapshot.cell(row, col);
      if (cell.is_null()) // same empty field as ""
        continue;
      append_csv_field(cell_text(cell, catalog.column(col)), sep, out);
    }
    out += '\n';
  }
}

} // namespace exporters
} // namespace pqstudio
