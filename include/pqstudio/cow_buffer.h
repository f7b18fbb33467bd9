#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace pqstudio {

/**
 * @brief Copy-on-write vector behind EditBuffer rows and Snapshot.
 *
 * share() hands out another reference to the same rows. The first mutation
 * through a reference that is not the only one clones the rows, so a snapshot
 * taken before an edit never observes it. Mutation of an unshared buffer is
 * in place.
 *
 * @note Distinct CowBuffer objects sharing rows may be read from different
 *       threads. A single object must not be mutated concurrently.
 */
template <typename T> class CowBuffer {
public:
  CowBuffer() : rows_(std::make_shared<std::vector<T>>()) {}
  explicit CowBuffer(std::vector<T> rows)
      : rows_(std::make_shared<std::vector<T>>(std::move(rows))) {}

  CowBuffer share() const { return *this; }

  // Clones the rows first when another buffer still references them
  std::vector<T>& to_mut() {
    if (rows_.use_count() > 1)
      rows_ = std::make_shared<std::vector<T>>(*rows_);
    return *rows_;
  }

  const std::vector<T>& as_vec() const { return *rows_; }
  const T& operator[](size_t idx) const { return (*rows_)[idx]; }
  size_t size() const { return rows_->size(); }

  bool is_owned() const { return rows_.use_count() == 1; }
  bool is_shared() const { return rows_.use_count() > 1; }
  long use_count() const { return rows_.use_count(); }

private:
  // Never null
  std::shared_ptr<std::vector<T>> rows_;
};

} // namespace pqstudio
