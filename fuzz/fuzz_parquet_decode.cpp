/**
 * @file fuzz_parquet_decode.cpp
 * @brief LibFuzzer target for the Parquet decoder and the load pipeline.
 */

#include "pqstudio/codec.h"
#include "pqstudio/commit_pipeline.h"
#include "pqstudio/edit_buffer.h"
#include "pqstudio/error.h"
#include "pqstudio/load_pipeline.h"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  // 1MB limit: room for several row groups and dictionary pages, small
  // enough for fast fuzzing iterations
  constexpr size_t MAX_INPUT_SIZE = 1024 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  pqstudio::ParquetOptions options;
  options.num_threads = 1;
  pqstudio::ParquetCodec codec(options);

  try {
    auto table = codec.decode(std::span<const uint8_t>(data, size));

    pqstudio::LoadPipeline load;
    auto loaded = load.run(*table);
    if (!loaded)
      return 0;

    // Whatever decodes must survive commit and re-encode
    pqstudio::EditBuffer buffer(std::move(*loaded));
    pqstudio::CommitOptions commit_options;
    commit_options.num_threads = 1;
    pqstudio::CommitPipeline commit(commit_options);
    auto committed = commit.run(buffer.snapshot());
    codec.encode(*committed);
  } catch (const pqstudio::StudioException&) {
    // Malformed input is expected to be rejected with DECODE_ERROR or
    // UNSUPPORTED_TYPE; crashes and other exceptions are findings
  }
  return 0;
}
