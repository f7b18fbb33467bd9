#pragma once

#include "pqstudio/edit_buffer.h"
#include "pqstudio/error.h"
#include "pqstudio/options.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pqstudio {
namespace exporters {

// Name of the row-number column added by ExportOptions::include_row_numbers
inline constexpr const char* ROW_NUMBER_COLUMN = "SN";

// Canonical text of a cell in its column. Unlike Cell::to_string() this
// knows the column, so UTC-adjusted timestamps carry their 'Z'.
std::string cell_text(const Cell& cell, const Column& column);

// Append `text` to `out`, replacing each invalid UTF-8 sequence with U+FFFD.
// Returns false when anything was replaced.
bool append_utf8(std::string_view text, std::string& out);

// CSV field: quoted when it contains the separator, a quote, CR or LF;
// embedded quotes doubled
void append_csv_field(std::string_view text, char separator, std::string& out);

// JSON string literal including the surrounding quotes. Returns false when
// invalid UTF-8 was replaced.
bool append_json_string(std::string_view text, std::string& out);

// XML character data with &, <, > and " escaped. Invalid UTF-8 and the C0
// controls XML 1.0 forbids become U+FFFD; returns false when that happened.
bool append_xml_text(std::string_view text, std::string& out);

// Per-format writers. Each appends a complete document to `out` and records
// cell-level problems in `warnings`.
void write_csv(const Snapshot& snapshot, const ExportOptions& options, std::string& out,
               ErrorCollector& warnings);
void write_json(const Snapshot& snapshot, const ExportOptions& options, std::string& out,
                ErrorCollector& warnings);
void write_xlsx(const Snapshot& snapshot, const ExportOptions& options,
                std::vector<uint8_t>& out, ErrorCollector& warnings);

} // namespace exporters
} // namespace pqstudio
