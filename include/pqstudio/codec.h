#pragma once

#include "columnar_table.h"
#include "options.h"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace pqstudio {

/**
 * @brief Converts between encoded file bytes and a ColumnarTable.
 *
 * decode() throws StudioException(DECODE_ERROR) for malformed input and
 * encode() throws StudioException(ENCODE_ERROR) for tables the format cannot
 * hold. Neither touches storage.
 */
class Codec {
public:
  virtual ~Codec() = default;

  virtual std::shared_ptr<ColumnarTable> decode(std::span<const uint8_t> bytes) = 0;
  virtual std::vector<uint8_t> encode(const ColumnarTable& table) = 0;

  // Short format name for logs, e.g. "parquet"
  virtual const char* name() const = 0;
};

// Apache Parquet codec
class ParquetCodec : public Codec {
public:
  explicit ParquetCodec(ParquetOptions options = {}) : options_(std::move(options)) {}

  std::shared_ptr<ColumnarTable> decode(std::span<const uint8_t> bytes) override;
  std::vector<uint8_t> encode(const ColumnarTable& table) override;
  const char* name() const override { return "parquet"; }

  const ParquetOptions& options() const { return options_; }

private:
  ParquetOptions options_;
};

// True when this build can compress pages with `c`
bool compression_available(Compression c);

} // namespace pqstudio
