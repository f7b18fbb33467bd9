#include <CLI/CLI.hpp>

#include "pqstudio/commit_pipeline.h"
#include "pqstudio/export_pipeline.h"
#include "pqstudio/session.h"

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CellEdit {
  size_t row = 0;
  std::string column;
  std::string text;
};

int fail(const pqstudio::StudioError& error) {
  std::cerr << error.to_string() << '\n';
  return 1;
}

int usage_error(const std::string& message) {
  std::cerr << "Error: " << message << '\n';
  return 2;
}

bool parse_row(const std::string& text, size_t& row) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
    return false;
  try {
    row = static_cast<size_t>(std::stoull(text));
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

// "ROW:COLUMN" (and "ROW:COLUMN=TEXT" when want_text)
bool parse_cell_ref(const std::string& ref, bool want_text, CellEdit& out) {
  size_t colon = ref.find(':');
  if (colon == std::string::npos || !parse_row(ref.substr(0, colon), out.row))
    return false;
  std::string rest = ref.substr(colon + 1);
  if (want_text) {
    size_t eq = rest.find('=');
    if (eq == std::string::npos)
      return false;
    out.column = rest.substr(0, eq);
    out.text = rest.substr(eq + 1);
  } else {
    out.column = rest;
  }
  return !out.column.empty();
}

pqstudio::Result<void> load(pqstudio::Session& session, const std::string& path) {
  auto loaded = session.load(path);
  if (!loaded)
    return pqstudio::Result<void>::failure(loaded.error);
  return pqstudio::Result<void>::success();
}

int cmd_schema(pqstudio::Session& session, const std::string& path) {
  if (auto loaded = load(session, path); !loaded)
    return fail(loaded.error);

  const pqstudio::SchemaCatalog& catalog = *session.catalog();
  std::cout << "Schema:\n";
  std::cout << std::left << std::setw(4) << "#" << std::setw(30) << "Column" << std::setw(28)
            << "Type" << "Nullable\n";
  std::cout << std::string(70, '-') << "\n";
  for (size_t i = 0; i < catalog.size(); ++i) {
    const pqstudio::Column& column = catalog.column(i);
    std::cout << std::left << std::setw(4) << i << std::setw(30)
              << (column.name.length() > 28 ? column.name.substr(0, 27) + "..." : column.name)
              << std::setw(28) << column.type.to_string() << (column.nullable ? "Yes" : "No")
              << "\n";
  }
  std::cout << "\n" << session.status().to_string() << "\n";
  return 0;
}

int cmd_show(pqstudio::Session& session, const std::string& path) {
  if (auto loaded = load(session, path); !loaded)
    return fail(loaded.error);

  std::vector<uint8_t> csv;
  pqstudio::ExportPipeline pipeline(session.options().exports);
  try {
    pipeline.run(session.snapshot(), pqstudio::ExportFormat::CSV, csv);
  } catch (const pqstudio::StudioException& e) {
    return fail(e.error());
  }
  std::fwrite(csv.data(), 1, csv.size(), stdout);
  return 0;
}

int cmd_edit(pqstudio::Session& session, const std::string& path,
             const std::vector<std::string>& sets, const std::vector<std::string>& nulls,
             const std::vector<size_t>& deletes, const std::string& output) {
  std::vector<CellEdit> edits;
  for (const auto& ref : sets) {
    CellEdit edit;
    if (!parse_cell_ref(ref, true, edit))
      return usage_error("--set expects ROW:COLUMN=TEXT, got '" + ref + "'");
    edits.push_back(std::move(edit));
  }
  std::vector<CellEdit> null_edits;
  for (const auto& ref : nulls) {
    CellEdit edit;
    if (!parse_cell_ref(ref, false, edit))
      return usage_error("--null expects ROW:COLUMN, got '" + ref + "'");
    null_edits.push_back(std::move(edit));
  }

  if (auto loaded = load(session, path); !loaded)
    return fail(loaded.error);
  const pqstudio::SchemaCatalog& catalog = *session.catalog();

  for (const auto& edit : edits) {
    if (auto r = session.edit(edit.row, edit.column, edit.text); !r)
      return fail(r.error);

    // Validate on edit so the failing argument is reported directly
    try {
      size_t col = catalog.column_index(edit.column);
      pqstudio::CommitPipeline::coerce_cell(session.buffer()->cell(edit.row, col),
                                            catalog.column(col), edit.row);
    } catch (const pqstudio::StudioException& e) {
      return fail(e.error());
    }
  }
  for (const auto& edit : null_edits) {
    if (auto r = session.set_null(edit.row, edit.column); !r)
      return fail(r.error);
  }

  // Deletions last, so every row index refers to the file as loaded
  if (!deletes.empty()) {
    std::set<size_t> doomed(deletes.begin(), deletes.end());
    if (auto r = session.delete_rows(doomed); !r)
      return fail(r.error);
  }

  if (auto saved = session.save(output); !saved)
    return fail(saved.error);

  std::cerr << "Saved " << session.current_path() << " (" << session.status().rows << " rows)\n";
  return 0;
}

int cmd_export(pqstudio::Session& session, const std::string& path,
               pqstudio::ExportFormat format, const std::string& output) {
  if (auto loaded = load(session, path); !loaded)
    return fail(loaded.error);

  auto exported = session.export_to(format, output);
  if (!exported)
    return fail(exported.error);

  const pqstudio::ExportResult& result = exported.value;
  std::cerr << "Exported " << result.rows << " rows (" << result.bytes << " bytes) to "
            << result.target << "\n";
  if (result.warnings.has_errors())
    std::cerr << result.warnings.summary() << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  CLI::App app{"pqstudio - view, edit and export Parquet files without losing their schema"};
  app.require_subcommand(1);

  bool verbose = false;
  app.add_flag("-v,--verbose", verbose, "Log load/commit/save details to stderr");
  size_t num_threads = 0;
  app.add_option("--threads", num_threads, "Worker threads for commit and encoding (0 = auto)");
  std::map<std::string, pqstudio::Compression> compression_map{
      {"none", pqstudio::Compression::NONE},     {"gzip", pqstudio::Compression::GZIP},
      {"zstd", pqstudio::Compression::ZSTD},     {"snappy", pqstudio::Compression::SNAPPY},
      {"lz4", pqstudio::Compression::LZ4}};
  pqstudio::Compression compression = pqstudio::Compression::ZSTD;
  app.add_option("--compression", compression, "Page compression for saved files")
      ->transform(CLI::CheckedTransformer(compression_map, CLI::ignore_case));

  std::string file;

  auto* schema = app.add_subcommand("schema", "Print the columns of a file");
  schema->add_option("file", file, "Parquet file")->required();

  auto* show = app.add_subcommand("show", "Print rows as CSV");
  show->add_option("file", file, "Parquet file")->required();
  size_t head = 0;
  show->add_option("--head", head, "Only the first N rows (0 = all)");

  auto* edit = app.add_subcommand("edit", "Apply edits and save");
  edit->add_option("file", file, "Parquet file")->required();
  std::vector<std::string> sets;
  edit->add_option("--set", sets, "Set a cell: ROW:COLUMN=TEXT (0-based row)");
  std::vector<std::string> nulls;
  edit->add_option("--null", nulls, "Set a cell to null: ROW:COLUMN");
  std::vector<size_t> deletes;
  edit->add_option("--delete", deletes, "Delete a row (0-based, as loaded)");
  std::string edit_output;
  edit->add_option("-o,--output", edit_output, "Write here instead of overwriting the input");

  auto* exp = app.add_subcommand("export", "Export rows to CSV, JSON or Excel");
  exp->add_option("file", file, "Parquet file")->required();
  std::string format_name;
  exp->add_option("--format", format_name, "csv, json or xlsx")
      ->required()
      ->check(CLI::IsMember({"csv", "json", "xlsx", "excel"}, CLI::ignore_case));
  std::string export_output;
  exp->add_option("-o,--output", export_output, "Target file (default: export_<millis>.<ext>)");
  bool row_numbers = false;
  exp->add_flag("--row-numbers", row_numbers, "Prepend an SN column with 1-based row numbers");

  CLI11_PARSE(app, argc, argv);

  pqstudio::StudioOptions options;
  options.verbose = verbose;
  options.commit.num_threads = num_threads;
  options.parquet.num_threads = num_threads;
  options.parquet.compression = compression;
  options.load.max_rows = head;
  options.exports.include_row_numbers = row_numbers;

  pqstudio::Session session(options);

  if (*schema)
    return cmd_schema(session, file);
  if (*show)
    return cmd_show(session, file);
  if (*edit) {
    if (app.count("--compression") > 0 && !pqstudio::compression_available(compression)) {
      std::cerr << "Warning: " << pqstudio::compression_name(compression)
                << " support is not compiled in, pages will be stored uncompressed\n";
    }
    return cmd_edit(session, file, sets, nulls, deletes, edit_output);
  }
  if (*exp) {
    auto format = pqstudio::parse_export_format(format_name);
    if (!format)
      return usage_error("unknown export format '" + format_name + "'");
    return cmd_export(session, file, *format, export_output);
  }
  return 0;
}
