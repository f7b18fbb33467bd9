#include "benchmark_data.h"

#include "pqstudio/commit_pipeline.h"
#include "pqstudio/export_pipeline.h"

#include <benchmark/benchmark.h>

using namespace pqstudio;

static void BM_Load(benchmark::State& state) {
  auto table = bench::make_table(static_cast<size_t>(state.range(0)));
  LoadPipeline pipeline;
  for (auto _ : state) {
    auto loaded = pipeline.run(*table);
    benchmark::DoNotOptimize(loaded->rows.data());
  }
  state.SetItemsProcessed(static_cast<int64_t>(table->num_rows() * state.iterations()));
}
BENCHMARK(BM_Load)->Arg(10000)->Arg(100000)->Unit(benchmark::kMillisecond);

// Commit with every 10th row holding a pending text edit
static void BM_CommitThreads(benchmark::State& state) {
  EditBuffer buffer = bench::make_buffer(200000);
  for (size_t r = 0; r < buffer.row_count(); r += 10) {
    buffer.set_cell(r, "score", "12.5");
    buffer.set_cell(r, "born", "2024-02-29");
  }
  CommitOptions options;
  options.num_threads = static_cast<size_t>(state.range(0));
  CommitPipeline pipeline(options);
  Snapshot snapshot = buffer.snapshot();

  for (auto _ : state) {
    auto table = pipeline.run(snapshot);
    benchmark::DoNotOptimize(table.get());
  }
  state.SetItemsProcessed(static_cast<int64_t>(buffer.row_count() * state.iterations()));
  state.counters["Threads"] = static_cast<double>(options.num_threads);
}
BENCHMARK(BM_CommitThreads)->RangeMultiplier(2)->Range(1, 8)->Unit(benchmark::kMillisecond);

static void BM_Export(benchmark::State& state) {
  auto format = static_cast<ExportFormat>(state.range(0));
  EditBuffer buffer = bench::make_buffer(50000);
  Snapshot snapshot = buffer.snapshot();
  ExportPipeline pipeline;

  size_t bytes = 0;
  for (auto _ : state) {
    std::vector<uint8_t> sink;
    ExportResult result = pipeline.run(snapshot, format, sink);
    bytes = result.bytes;
    benchmark::DoNotOptimize(sink.data());
  }
  state.SetLabel(export_format_name(format));
  state.SetBytesProcessed(static_cast<int64_t>(bytes * state.iterations()));
}
BENCHMARK(BM_Export)
    ->Arg(static_cast<int>(ExportFormat::CSV))
    ->Arg(static_cast<int>(ExportFormat::JSON))
    ->Arg(static_cast<int>(ExportFormat::XLSX))
    ->Unit(benchmark::kMillisecond);
