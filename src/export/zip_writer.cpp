#include "zip_writer.h"

#include "pqstudio/error.h"

#include <limits>
#include <zlib.h>

namespace pqstudio {
namespace exporters {

namespace {

constexpr uint32_t LOCAL_FILE_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_DIRECTORY_SIGNATURE = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_DIRECTORY_SIGNATURE = 0x06054b50;

constexpr uint16_t VERSION_NEEDED = 20;  // 2.0: deflate
constexpr uint16_t VERSION_MADE_BY = 20; // MS-DOS attributes, APPNOTE 2.0
constexpr uint16_t FLAG_UTF8_NAMES = 1 << 11;
constexpr uint16_t METHOD_DEFLATE = 8;
constexpr uint16_t DOS_TIME = 0;                     // 00:00:00
constexpr uint16_t DOS_DATE = (0 << 9) | (1 << 5) | 1; // 1980-01-01

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  for (int i = 0; i < 4; ++i)
    out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

[[noreturn]] void zip_error(const std::string& message) {
  throw StudioException(ErrorCode::EXPORT_ERROR, "zip: " + message);
}

uint32_t checked_u32(size_t value, const char* what) {
  if (value > std::numeric_limits<uint32_t>::max())
    zip_error(std::string(what) + " exceeds 4 GiB (ZIP64 is not supported)");
  return static_cast<uint32_t>(value);
}

// Raw deflate stream (no zlib or gzip wrapper), as stored in ZIP entries
std::vector<uint8_t> deflate_raw(std::string_view content, int level) {
  z_stream stream{};
  stream.zalloc = Z_NULL;
  stream.zfree = Z_NULL;
  stream.opaque = Z_NULL;

  // windowBits = -15 for raw deflate
  if (deflateInit2(&stream, level, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK)
    zip_error("deflateInit2 failed");

  std::vector<uint8_t> output(deflateBound(&stream, static_cast<uLong>(content.size())));
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(content.data()));
  stream.avail_in = static_cast<uInt>(content.size());
  stream.next_out = output.data();
  stream.avail_out = static_cast<uInt>(output.size());

  int result = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);

  if (result != Z_STREAM_END)
    zip_error("deflate failed");
  output.resize(stream.total_out);
  return output;
}

} // namespace

void ZipWriter::add_file(const std::string& name, std::string_view content) {
  if (entries_.size() >= std::numeric_limits<uint16_t>::max())
    zip_error("too many entries");
  if (name.size() > std::numeric_limits<uint16_t>::max())
    zip_error("entry name too long");
  if (content.size() > std::numeric_limits<uInt>::max())
    zip_error("entry exceeds 4 GiB (ZIP64 is not supported)");

  Entry entry;
  entry.name = name;
  entry.uncompressed_size = checked_u32(content.size(), "entry");
  entry.crc = static_cast<uint32_t>(
      crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(content.data()),
            static_cast<uInt>(content.size())));
  entry.local_header_offset = checked_u32(data_.size(), "archive");

  std::vector<uint8_t> compressed = deflate_raw(content, level_);
  entry.compressed_size = checked_u32(compressed.size(), "compressed entry");

  put_u32(data_, LOCAL_FILE_HEADER_SIGNATURE);
  put_u16(data_, VERSION_NEEDED);
  put_u16(data_, FLAG_UTF8_NAMES);
  put_u16(data_, METHOD_DEFLATE);
  put_u16(data_, DOS_TIME);
  put_u16(data_, DOS_DATE);
  put_u32(data_, entry.crc);
  put_u32(data_, entry.compressed_size);
  put_u32(data_, entry.uncompressed_size);
  put_u16(data_, static_cast<uint16_t>(name.size()));
  put_u16(data_, 0); // extra field length
  data_.insert(data_.end(), name.begin(), name.end());
  data_.insert(data_.end(), compressed.begin(), compressed.end());

  entries_.push_back(std::move(entry));
}

std::vector<uint8_t> ZipWriter::finish() {
  std::vector<uint8_t> out = std::move(data_);
  data_.clear();

  uint32_t directory_offset = checked_u32(out.size(), "archive");
  for (const Entry& entry : entries_) {
    put_u32(out, CENTRAL_DIRECTORY_SIGNATURE);
    put_u16(out, VERSION_MADE_BY);
    put_u16(out, VERSION_NEEDED);
    put_u16(out, FLAG_UTF8_NAMES);
    put_u16(out, METHOD_DEFLATE);
    put_u16(out, DOS_TIME);
    put_u16(out, DOS_DATE);
    put_u32(out, entry.crc);
    put_u32(out, entry.compressed_size);
    put_u32(out, entry.uncompressed_size);
    put_u16(out, static_cast<uint16_t>(entry.name.size()));
    put_u16(out, 0); // extra field length
    put_u16(out, 0); // comment length
    put_u16(out, 0); // disk number start
    put_u16(out, 0); // internal attributes
    put_u32(out, 0); // external attributes
    put_u32(out, entry.local_header_offset);
    out.insert(out.end(), entry.name.begin(), entry.name.end());
  }
  uint32_t directory_size = checked_u32(out.size() - directory_offset, "central directory");

  put_u32(out, END_OF_CENTRAL_DIRECTORY_SIGNATURE);
  put_u16(out, 0); // this disk
  put_u16(out, 0); // disk with central directory
  put_u16(out, static_cast<uint16_t>(entries_.size()));
  put_u16(out, static_cast<uint16_t>(entries_.size()));
  put_u32(out, directory_size);
  put_u32(out, directory_offset);
  put_u16(out, 0); // comment length

  entries_.clear();
  return out;
}

} // namespace exporters
} // namespace pqstudio
