#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pqstudio {
namespace exporters {

/**
 * @brief Minimal ZIP archive writer (deflate only, no ZIP64).
 *
 * Entries are compressed with raw zlib deflate and carry a CRC-32. All
 * entries get the same fixed DOS timestamp (1980-01-01 00:00) so identical
 * input produces identical archives.
 */
class ZipWriter {
public:
  explicit ZipWriter(int level = -1) : level_(level) {}

  // @throws StudioException EXPORT_ERROR when deflate fails or the archive
  //         would need ZIP64
  void add_file(const std::string& name, std::string_view content);

  // Append the central directory and return the archive. The writer is
  // empty again afterwards.
  std::vector<uint8_t> finish();

  size_t entry_count() const { return entries_.size(); }

private:
  struct Entry {
    std::string name;
    uint32_t crc = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t local_header_offset = 0;
  };

  int level_;
  std::vector<uint8_t> data_;
  std::vector<Entry> entries_;
};

} // namespace exporters
} // namespace pqstudio
