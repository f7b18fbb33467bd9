#include "benchmark_data.h"

#include "pqstudio/codec.h"

#include <benchmark/benchmark.h>

using namespace pqstudio;

// Encode throughput across column encoding threads
static void BM_EncodeThreads(benchmark::State& state) {
  auto table = bench::make_table(200000);
  ParquetOptions options;
  options.compression = Compression::NONE;
  options.num_threads = static_cast<size_t>(state.range(0));
  ParquetCodec codec(options);

  size_t bytes = 0;
  for (auto _ : state) {
    std::vector<uint8_t> encoded = codec.encode(*table);
    bytes = encoded.size();
    benchmark::DoNotOptimize(encoded.data());
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes * state.iterations()));
  state.counters["FileSize"] = static_cast<double>(bytes);
  state.counters["Threads"] = static_cast<double>(options.num_threads);
}
BENCHMARK(BM_EncodeThreads)->RangeMultiplier(2)->Range(1, 8)->Unit(benchmark::kMillisecond);

// Page compression cost per codec; unavailable codecs are skipped
static void BM_EncodeCompression(benchmark::State& state) {
  auto compression = static_cast<Compression>(state.range(0));
  if (compression != Compression::NONE && !compression_available(compression)) {
    state.SkipWithError((std::string(compression_name(compression)) + " not built in").c_str());
    return;
  }
  auto table = bench::make_table(200000);
  ParquetOptions options;
  options.compression = compression;
  ParquetCodec codec(options);

  size_t bytes = 0;
  for (auto _ : state) {
    std::vector<uint8_t> encoded = codec.encode(*table);
    bytes = encoded.size();
    benchmark::DoNotOptimize(encoded.data());
  }
  state.SetLabel(compression_name(compression));
  state.counters["FileSize"] = static_cast<double>(bytes);
}
BENCHMARK(BM_EncodeCompression)
    ->Arg(static_cast<int>(Compression::NONE))
    ->Arg(static_cast<int>(Compression::GZIP))
    ->Arg(static_cast<int>(Compression::ZSTD))
    ->Arg(static_cast<int>(Compression::SNAPPY))
    ->Arg(static_cast<int>(Compression::LZ4))
    ->Unit(benchmark::kMillisecond);

static void BM_Decode(benchmark::State& state) {
  ParquetOptions options;
  options.compression = Compression::GZIP;
  ParquetCodec codec(options);
  std::vector<uint8_t> encoded = codec.encode(*bench::make_table(static_cast<size_t>(state.range(0))));

  for (auto _ : state) {
    auto table = codec.decode(encoded);
    benchmark::DoNotOptimize(table.get());
  }
  state.SetBytesProcessed(static_cast<int64_t>(encoded.size() * state.iterations()));
  state.counters["Rows"] = static_cast<double>(state.range(0));
}
BENCHMARK(BM_Decode)->Arg(10000)->Arg(100000)->Arg(1000000)->Unit(benchmark::kMillisecond);
