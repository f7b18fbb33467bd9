#include "pqstudio/session.h"

#include "pqstudio/commit_pipeline.h"
#include "pqstudio/debug.h"
#include "pqstudio/load_pipeline.h"

#include <exception>
#include <new>
#include <optional>
#include <type_traits>

namespace pqstudio {

std::string StatusSummary::to_string() const {
  std::string out = "File: " + file + " | Rows: " + std::to_string(rows) +
                    " | Columns: " + std::to_string(columns);
  if (preview)
    out += " | Preview";
  if (dirty)
    out += " | Modified";
  return out;
}

namespace {

DebugConfig debug_config(const StudioOptions& options) {
  DebugConfig config;
  config.verbose = options.verbose;
  config.timing = options.timing;
  return config;
}

StudioError no_table_error() {
  return StudioError(ErrorCode::INTERNAL_ERROR, ErrorSeverity::RECOVERABLE, "no table is loaded");
}

// Run `op`, converting exceptions into a failed Result
template <typename T, typename Op> Result<T> guarded(Op&& op) {
  try {
    if constexpr (std::is_void_v<T>) {
      op();
      return Result<T>::success();
    } else {
      return Result<T>::success(op());
    }
  } catch (const StudioException& e) {
    return Result<T>::failure(e.error());
  } catch (const std::bad_alloc&) {
    return Result<T>::failure(StudioError(ErrorCode::INTERNAL_ERROR, "out of memory"));
  } catch (const std::exception& e) {
    return Result<T>::failure(StudioError(ErrorCode::INTERNAL_ERROR, e.what()));
  }
}

} // namespace

struct Session::Impl {
  StudioOptions options;
  std::shared_ptr<Storage> storage;
  std::shared_ptr<Codec> codec;
  DebugTrace trace;

  std::optional<EditBuffer> buffer;
  std::string current_path;
  std::string last_path;
  // Rows in the file the buffer was loaded from, when more than were loaded
  std::optional<size_t> preview_of;

  Impl(StudioOptions opts, std::shared_ptr<Storage> st, std::shared_ptr<Codec> cd)
      : options(std::move(opts)), storage(std::move(st)), codec(std::move(cd)),
        trace(debug_config(options)) {}

  EditBuffer& require_buffer() {
    if (!buffer)
      throw StudioException(no_table_error());
    return *buffer;
  }

  void log_error(const char* operation, const StudioError& error) const {
    if (!trace.verbose())
      return;
    std::string line = std::string(operation) + " failed: " + error.to_string();
    trace.log_str(line.c_str());
  }

  LoadSummary load(const std::string& path) {
    trace.log_str(("Loading " + path).c_str());

    trace.start_phase("read");
    std::vector<uint8_t> bytes = storage->read(path);
    trace.end_phase(bytes.size());
    trace.log("  Bytes: %zu", bytes.size());

    trace.start_phase("decode");
    std::shared_ptr<ColumnarTable> table = codec->decode(bytes);
    trace.end_phase(bytes.size());

    trace.start_phase("materialize rows");
    LoadPipeline pipeline(options.load);
    std::optional<LoadResult> loaded = pipeline.run(*table);
    trace.end_phase();
    if (!loaded)
      throw StudioException(ErrorCode::CANCELLED, "load of " + path + " was cancelled");

    // Install only after everything succeeded
    EditBuffer fresh(std::move(*loaded));
    LoadSummary summary{fresh.catalog_ptr(), fresh.row_count(), table->num_rows()};
    buffer.emplace(std::move(fresh));
    current_path = path;
    last_path = path;
    preview_of.reset();
    if (summary.rows < summary.source_rows)
      preview_of = summary.source_rows;

    trace.log("  Rows: %zu", summary.rows);
    if (preview_of)
      trace.log("  Preview of %zu rows, saving is disabled", *preview_of);
    trace.log("  Columns: %zu", summary.catalog->size());
    if (trace.verbose()) {
      for (const Column& column : summary.catalog->columns()) {
        std::string line = "    " + column.name + ": " + column.type.to_string() +
                           (column.nullable ? "" : " NOT NULL");
        trace.log_str(line.c_str());
      }
    }
    trace.print_timing_summary();
    trace.clear_timing();
    return summary;
  }

  std::vector<uint8_t> commit() {
    EditBuffer& buf = require_buffer();
    if (preview_of) {
      throw StudioException(StudioError(
          ErrorCode::INTERNAL_ERROR, ErrorSeverity::RECOVERABLE,
          "table was loaded as a preview of " + std::to_string(options.load.max_rows) +
              " of " + std::to_string(*preview_of) +
              " rows; reload it without a row limit to save"));
    }
    trace.log("Committing %zu rows x %zu columns (threads: %zu)", buf.row_count(),
              buf.column_count(), options.commit.num_threads);

    trace.start_phase("coerce columns");
    CommitPipeline pipeline(options.commit);
    std::shared_ptr<ColumnarTable> table = pipeline.run(buf.snapshot());
    trace.end_phase();

    trace.start_phase("encode");
    std::vector<uint8_t> bytes = codec->encode(*table);
    trace.end_phase(bytes.size());

    trace.log("  Encoded %zu bytes with %s", bytes.size(), codec->name());
    trace.print_timing_summary();
    trace.clear_timing();
    return bytes;
  }

  void save(const std::string& path) {
    std::string target = path.empty() ? current_path : path;
    if (target.empty()) {
      throw StudioException(
          StudioError(ErrorCode::IO_ERROR, ErrorSeverity::RECOVERABLE, "no file path to save to"));
    }

    std::vector<uint8_t> bytes = commit();
    storage->write(target, bytes);
    buffer->mark_clean();
    current_path = target;
    last_path = target;
    trace.log_str(("Saved " + target).c_str());
  }

  ExportResult export_to(ExportFormat format, const std::string& target) {
    EditBuffer& buf = require_buffer();
    std::string path = target.empty() ? default_export_filename(format) : target;

    std::vector<uint8_t> document;
    ExportPipeline pipeline(options.exports);
    ExportResult result = pipeline.run(buf.snapshot(), format, document);
    storage->write(path, document);
    result.target = path;

    trace.log_str(("Exported " + path).c_str());
    trace.log("  Format: %s, rows: %zu, bytes: %zu", export_format_name(format), result.rows,
              result.bytes);
    if (result.warnings.has_errors() && trace.verbose()) {
      std::string summary = result.warnings.summary();
      trace.log_str(summary.c_str());
    }
    return result;
  }
};

Session::Session(StudioOptions options)
    : impl_(std::make_unique<Impl>(options, std::make_shared<FileStorage>(),
                                   std::make_shared<ParquetCodec>(options.parquet))) {}

Session::Session(StudioOptions options, std::shared_ptr<Storage> storage,
                 std::shared_ptr<Codec> codec)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(storage), std::move(codec))) {}

Session::~Session() = default;

Result<LoadSummary> Session::load(const std::string& path) {
  auto result = guarded<LoadSummary>([&] { return impl_->load(path); });
  if (!result)
    impl_->log_error("load", result.error);
  return result;
}

Result<void> Session::edit(size_t row, const std::string& column, const std::string& text) {
  return guarded<void>([&] { impl_->require_buffer().set_cell(row, column, text); });
}

Result<void> Session::set_null(size_t row, const std::string& column) {
  return guarded<void>([&] { impl_->require_buffer().set_null(row, column); });
}

Result<size_t> Session::delete_rows(const std::set<size_t>& indices) {
  return guarded<size_t>([&] { return impl_->require_buffer().delete_rows(indices); });
}

Result<void> Session::select(size_t row) {
  return guarded<void>([&] {
    EditBuffer& buf = impl_->require_buffer();
    if (row >= buf.row_count()) {
      throw StudioException(ErrorCode::INDEX_OUT_OF_RANGE,
                            "row " + std::to_string(row) + " is outside [0, " +
                                std::to_string(buf.row_count()) + ")");
    }
    buf.select(row);
  });
}

Result<void> Session::deselect(size_t row) {
  return guarded<void>([&] { impl_->require_buffer().deselect(row); });
}

Result<void> Session::toggle_selection(size_t row) {
  return guarded<void>([&] {
    EditBuffer& buf = impl_->require_buffer();
    if (row >= buf.row_count()) {
      throw StudioException(ErrorCode::INDEX_OUT_OF_RANGE,
                            "row " + std::to_string(row) + " is outside [0, " +
                                std::to_string(buf.row_count()) + ")");
    }
    buf.toggle_selection(row);
  });
}

Result<void> Session::clear_selection() {
  return guarded<void>([&] { impl_->require_buffer().clear_selection(); });
}

std::set<size_t> Session::selected() const {
  return impl_->buffer ? impl_->buffer->selected() : std::set<size_t>();
}

Result<size_t> Session::delete_selected() {
  return guarded<size_t>([&] { return impl_->require_buffer().delete_selected(); });
}

Result<std::vector<uint8_t>> Session::commit() {
  auto result = guarded<std::vector<uint8_t>>([&] { return impl_->commit(); });
  if (!result)
    impl_->log_error("commit", result.error);
  return result;
}

Result<void> Session::save(const std::string& path) {
  auto result = guarded<void>([&] { impl_->save(path); });
  if (!result)
    impl_->log_error("save", result.error);
  return result;
}

Result<ExportResult> Session::export_to(ExportFormat format, const std::string& target) {
  auto result = guarded<ExportResult>([&] { return impl_->export_to(format, target); });
  if (!result)
    impl_->log_error("export", result.error);
  return result;
}

StatusSummary Session::status() const {
  StatusSummary status;
  if (!impl_->current_path.empty())
    status.file = impl_->current_path;
  if (impl_->buffer) {
    status.rows = impl_->buffer->row_count();
    status.columns = impl_->buffer->column_count();
    status.dirty = impl_->buffer->dirty();
    status.preview = impl_->preview_of.has_value();
  }
  return status;
}

bool Session::has_table() const { return impl_->buffer.has_value(); }

const std::vector<Row>& Session::rows() const {
  static const std::vector<Row> empty;
  if (!impl_->buffer)
    return empty;
  return impl_->buffer->rows();
}

Snapshot Session::snapshot() const {
  if (!impl_->buffer)
    throw StudioException(no_table_error());
  return impl_->buffer->snapshot();
}

std::shared_ptr<const SchemaCatalog> Session::catalog() const {
  return impl_->buffer ? impl_->buffer->catalog_ptr() : nullptr;
}

const EditBuffer* Session::buffer() const {
  return impl_->buffer ? &*impl_->buffer : nullptr;
}

const std::string& Session::current_path() const { return impl_->current_path; }

const std::string& Session::last_path() const { return impl_->last_path; }

const StudioOptions& Session::options() const { return impl_->options; }

} // namespace pqstudio
