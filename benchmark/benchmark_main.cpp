#include "benchmark_data.h"

#include <benchmark/benchmark.h>

namespace bench {

std::shared_ptr<pqstudio::ColumnarTable> make_table(size_t rows) {
  using namespace pqstudio;
  std::vector<Column> columns = {
      {"id", LogicalType::int64(), false},
      {"name", LogicalType::string(), true},
      {"score", LogicalType::float64(), true},
      {"active", LogicalType::boolean(), false},
      {"born", LogicalType::date(), true},
      {"seen", LogicalType::timestamp(TimeUnit::MICROS, true), true},
      {"price", LogicalType::decimal(12, 2), true},
  };

  std::vector<FieldDescriptor> fields;
  std::vector<std::unique_ptr<ColumnVector>> vectors;
  for (const Column& column : columns) {
    fields.push_back(FieldDescriptor::from_column(column));
    vectors.push_back(ColumnVector::create(column.type));
  }

  // Deterministic pseudo-random content; every 7th optional cell is null
  uint64_t state = 0x9E3779B97F4A7C15ull;
  for (size_t r = 0; r < rows; ++r) {
    state ^= state << 13;
    state ^= state >> 7;
    state ^= state << 17;
    bool null = (r % 7) == 3;
    vectors[0]->append(Cell::int64(static_cast<int64_t>(r)));
    vectors[1]->append(null ? Cell::null() : Cell::string("user_" + std::to_string(state % 5000)));
    vectors[2]->append(null ? Cell::null() : Cell::float64(static_cast<double>(state % 100000) / 7.0));
    vectors[3]->append(Cell::boolean((state & 1) != 0));
    vectors[4]->append(null ? Cell::null() : Cell::date(static_cast<int32_t>(state % 20000)));
    vectors[5]->append(null ? Cell::null()
                            : Cell::timestamp(1700000000000000 + static_cast<int64_t>(r) * 1000,
                                              TimeUnit::MICROS));
    vectors[6]->append(null ? Cell::null()
                            : Cell::decimal(static_cast<Int128>(state % 10000000), 12, 2));
  }
  return std::make_shared<ColumnarTable>(std::move(fields), std::move(vectors), rows);
}

pqstudio::EditBuffer make_buffer(size_t rows) {
  pqstudio::LoadPipeline pipeline;
  std::optional<pqstudio::LoadResult> loaded = pipeline.run(*make_table(rows));
  return pqstudio::EditBuffer(std::move(*loaded));
}

} // namespace bench

BENCHMARK_MAIN();
