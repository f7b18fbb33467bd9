#include "pqstudio/storage.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace pqstudio {

namespace {

[[noreturn]] void io_error(const std::string& what, const std::string& path) {
  std::string message = what + ": " + path;
  if (errno != 0) {
    message += " (";
    message += std::strerror(errno);
    message += ")";
  }
  throw StudioException(ErrorCode::IO_ERROR, message);
}

} // namespace

std::vector<uint8_t> FileStorage::read(const std::string& path) {
  errno = 0;
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    io_error("could not open file", path);
  }

  std::streamsize size = file.tellg();
  if (size < 0) {
    io_error("could not determine file size", path);
  }
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> bytes(static_cast<size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), size)) {
    io_error("could not read file", path);
  }
  return bytes;
}

void FileStorage::write(const std::string& path, std::span<const uint8_t> bytes) {
  // Write to temp file, then rename over the target
  std::string temp_path = path + ".tmp";

  errno = 0;
  std::FILE* fp = std::fopen(temp_path.c_str(), "wb");
  if (!fp) {
    io_error("error opening file for writing", path);
  }

  bool success = bytes.empty() || std::fwrite(bytes.data(), 1, bytes.size(), fp) == bytes.size();
  success = (std::fflush(fp) == 0) && success;
  success = (std::fclose(fp) == 0) && success;

  if (!success) {
    int saved = errno;
    std::remove(temp_path.c_str());
    errno = saved;
    io_error("error writing file", path);
  }

  if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
    int saved = errno;
    std::remove(temp_path.c_str());
    errno = saved;
    io_error("error renaming temp file to", path);
  }
}

std::vector<uint8_t> MemoryStorage::read(const std::string& path) {
  auto it = files_.find(path);
  if (it == files_.end()) {
    throw StudioException(ErrorCode::IO_ERROR, "could not open file: " + path);
  }
  return it->second;
}

void MemoryStorage::write(const std::string& path, std::span<const uint8_t> bytes) {
  if (fail_next_write_) {
    fail_next_write_ = false;
    throw StudioException(ErrorCode::IO_ERROR, "error writing file: " + path);
  }
  files_[path].assign(bytes.begin(), bytes.end());
}

} // namespace pqstudio
