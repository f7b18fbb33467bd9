#pragma once

#include "cell.h"
#include "column_vector.h"
#include "columnar_table.h"
#include "edit_buffer.h"
#include "options.h"

#include <memory>

namespace pqstudio {

/**
 * @brief Rebuilds a columnar table from an edit buffer snapshot.
 *
 * Every column is built with exactly the type the catalog declares; values
 * are never inspected to choose a type. Pending RawEdit cells are coerced to
 * the column type. The first failure, ordered by column position then row,
 * aborts the commit and is thrown as StudioException:
 * - NULLABILITY_VIOLATION for Null in a non-nullable column
 * - TYPE_COERCION when edited text does not convert
 * - SCHEMA_MISMATCH when a typed cell has the wrong type
 * - CANCELLED when the progress callback returns false
 *
 * The snapshot (and therefore the edit buffer) is never modified.
 */
class CommitPipeline {
public:
  explicit CommitPipeline(CommitOptions options = {}) : options_(std::move(options)) {}

  std::shared_ptr<ColumnarTable> run(const Snapshot& snapshot) const;

  /**
   * @brief Resolve one cell against its column.
   *
   * Returns Null or a typed cell matching column.type. `row` is only used to
   * locate errors.
   *
   * @throws StudioException NULLABILITY_VIOLATION, TYPE_COERCION or SCHEMA_MISMATCH
   */
  static Cell coerce_cell(const Cell& cell, const Column& column, size_t row);

  // Build one column vector from a snapshot (throws like coerce_cell)
  static std::unique_ptr<ColumnVector> build_column(const Snapshot& snapshot, size_t col);

private:
  CommitOptions options_;
};

} // namespace pqstudio
