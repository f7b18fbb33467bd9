#pragma once

#include "error.h"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace pqstudio {

/**
 * @brief Moves whole files between a path and memory.
 *
 * Both operations throw StudioException(IO_ERROR) naming the path.
 */
class Storage {
public:
  virtual ~Storage() = default;

  virtual std::vector<uint8_t> read(const std::string& path) = 0;
  virtual void write(const std::string& path, std::span<const uint8_t> bytes) = 0;
};

// Local filesystem. write() goes to "<path>.tmp" first and renames it over
// the target, so a failed write never truncates an existing file.
class FileStorage : public Storage {
public:
  std::vector<uint8_t> read(const std::string& path) override;
  void write(const std::string& path, std::span<const uint8_t> bytes) override;
};

// Path -> bytes map, for tests
class MemoryStorage : public Storage {
public:
  std::vector<uint8_t> read(const std::string& path) override;
  void write(const std::string& path, std::span<const uint8_t> bytes) override;

  bool contains(const std::string& path) const { return files_.count(path) != 0; }
  void remove(const std::string& path) { files_.erase(path); }
  size_t size() const { return files_.size(); }

  // Make the next write fail with IO_ERROR, to exercise error paths
  void fail_next_write() { fail_next_write_ = true; }

private:
  std::map<std::string, std::vector<uint8_t>> files_;
  bool fail_next_write_ = false;
};

} // namespace pqstudio
