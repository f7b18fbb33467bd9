#pragma once

#include "parquet_types.h"
#include "pqstudio/columnar_table.h"
#include "pqstudio/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace pqstudio {
namespace parquet {

// Bytes needed to hold any unscaled value of a decimal with this precision
// as a big-endian two's complement FIXED_LEN_BYTE_ARRAY
int32_t decimal_byte_width(uint8_t precision);

// Physical storage of a logical type:
//   DECIMAL(p <= 9) -> INT32, DECIMAL(p <= 18) -> INT64, wider -> FIXED_LEN_BYTE_ARRAY
ParquetType physical_type(const LogicalType& type);

// Leaf schema element that reproduces `column` on read, with both the
// logicalType and the legacy converted_type annotations.
SchemaElement to_schema_element(const Column& column);

// Map a leaf schema element back to a field. Types outside the LogicalType set
// leave `type` empty with `source_type` describing what the file declares.
FieldDescriptor from_schema_element(const SchemaElement& element);

// "INT64 (TIMESTAMP(MICROS, UTC))", "BYTE_ARRAY (UTF8)", "INT96" ...
std::string describe_schema_element(const SchemaElement& element);

} // namespace parquet
} // namespace pqstudio
