#pragma once

#include "pqstudio/columnar_table.h"
#include "pqstudio/edit_buffer.h"
#include "pqstudio/load_pipeline.h"

#include <cstddef>
#include <memory>

namespace bench {

// Seven columns covering the common logical types, deterministic content
std::shared_ptr<pqstudio::ColumnarTable> make_table(size_t rows);

// The same table, materialized into an edit buffer
pqstudio::EditBuffer make_buffer(size_t rows);

} // namespace bench
