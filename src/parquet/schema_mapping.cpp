#include "schema_mapping.h"

#include <string>

namespace pqstudio {
namespace parquet {

namespace {

using Kind = LogicalTypeAnnotation::Kind;

TimeUnitKind to_unit_kind(TimeUnit unit) {
  switch (unit) {
  case TimeUnit::MILLIS:
    return TimeUnitKind::MILLIS;
  case TimeUnit::MICROS:
    return TimeUnitKind::MICROS;
  default:
    return TimeUnitKind::NANOS;
  }
}

const char* unit_kind_name(TimeUnitKind unit) {
  switch (unit) {
  case TimeUnitKind::MILLIS:
    return "MILLIS";
  case TimeUnitKind::MICROS:
    return "MICROS";
  case TimeUnitKind::NANOS:
    return "NANOS";
  }
  return "?";
}

std::string describe_logical(const LogicalTypeAnnotation& lt) {
  std::string s = LogicalTypeAnnotation::kind_name(lt.kind);
  switch (lt.kind) {
  case Kind::DECIMAL:
    s += "(" + std::to_string(lt.precision) + ", " + std::to_string(lt.scale) + ")";
    break;
  case Kind::TIME:
  case Kind::TIMESTAMP:
    s += "(";
    s += unit_kind_name(lt.unit);
    if (lt.is_adjusted_to_utc)
      s += ", UTC";
    s += ")";
    break;
  case Kind::INTEGER:
    s += "(" + std::to_string(lt.bit_width) + (lt.is_signed ? ", signed)" : ", unsigned)");
    break;
  default:
    break;
  }
  return s;
}

std::optional<LogicalType> checked_decimal(int32_t precision, int32_t scale) {
  if (precision < 1 || precision > MAX_DECIMAL_PRECISION || scale < 0 || scale > precision)
    return std::nullopt;
  return LogicalType::decimal(static_cast<uint8_t>(precision), static_cast<uint8_t>(scale));
}

// LogicalType for a leaf annotated with the logicalType union
std::optional<LogicalType> map_logical(ParquetType physical, const LogicalTypeAnnotation& lt) {
  switch (lt.kind) {
  case Kind::STRING:
    if (physical == ParquetType::BYTE_ARRAY)
      return LogicalType::string();
    return std::nullopt;
  case Kind::DATE:
    if (physical == ParquetType::INT32)
      return LogicalType::date();
    return std::nullopt;
  case Kind::TIMESTAMP: {
    if (physical != ParquetType::INT64)
      return std::nullopt;
    TimeUnit unit = lt.unit == TimeUnitKind::MILLIS   ? TimeUnit::MILLIS
                    : lt.unit == TimeUnitKind::MICROS ? TimeUnit::MICROS
                                                      : TimeUnit::NANOS;
    return LogicalType::timestamp(unit, lt.is_adjusted_to_utc);
  }
  case Kind::DECIMAL:
    if (physical == ParquetType::INT32 || physical == ParquetType::INT64 ||
        physical == ParquetType::BYTE_ARRAY || physical == ParquetType::FIXED_LEN_BYTE_ARRAY)
      return checked_decimal(lt.precision, lt.scale);
    return std::nullopt;
  case Kind::INTEGER:
    // Only the widths that already are the physical type
    if (lt.is_signed && lt.bit_width == 32 && physical == ParquetType::INT32)
      return LogicalType::int32();
    if (lt.is_signed && lt.bit_width == 64 && physical == ParquetType::INT64)
      return LogicalType::int64();
    return std::nullopt;
  default:
    // MAP, LIST, ENUM, TIME, JSON, BSON, UUID, FLOAT16, UNKNOWN
    return std::nullopt;
  }
}

// LogicalType for a leaf carrying only the legacy converted_type
std::optional<LogicalType> map_converted(ParquetType physical, ConvertedType ct,
                                         const SchemaElement& element) {
  switch (ct) {
  case ConvertedType::UTF8:
    if (physical == ParquetType::BYTE_ARRAY)
      return LogicalType::string();
    return std::nullopt;
  case ConvertedType::DATE:
    if (physical == ParquetType::INT32)
      return LogicalType::date();
    return std::nullopt;
  case ConvertedType::TIMESTAMP_MILLIS:
    if (physical == ParquetType::INT64)
      return LogicalType::timestamp(TimeUnit::MILLIS, true);
    return std::nullopt;
  case ConvertedType::TIMESTAMP_MICROS:
    if (physical == ParquetType::INT64)
      return LogicalType::timestamp(TimeUnit::MICROS, true);
    return std::nullopt;
  case ConvertedType::DECIMAL:
    if (physical == ParquetType::BOOLEAN || physical == ParquetType::FLOAT ||
        physical == ParquetType::DOUBLE || physical == ParquetType::INT96)
      return std::nullopt;
    return checked_decimal(element.precision.value_or(0), element.scale.value_or(0));
  case ConvertedType::INT_32:
    if (physical == ParquetType::INT32)
      return LogicalType::int32();
    return std::nullopt;
  case ConvertedType::INT_64:
    if (physical == ParquetType::INT64)
      return LogicalType::int64();
    return std::nullopt;
  default:
    return std::nullopt;
  }
}

std::optional<LogicalType> map_unannotated(ParquetType physical) {
  switch (physical) {
  case ParquetType::BOOLEAN:
    return LogicalType::boolean();
  case ParquetType::INT32:
    return LogicalType::int32();
  case ParquetType::INT64:
    return LogicalType::int64();
  case ParquetType::FLOAT:
    return LogicalType::float32();
  case ParquetType::DOUBLE:
    return LogicalType::float64();
  case ParquetType::BYTE_ARRAY:
    return LogicalType::binary();
  default:
    // INT96 and un-annotated FIXED_LEN_BYTE_ARRAY have no counterpart
    return std::nullopt;
  }
}

} // namespace

int32_t decimal_byte_width(uint8_t precision) {
  // Largest unscaled magnitude is 10^p - 1; find the smallest n with
  // 2^(8n - 1) > 10^p - 1
  Int128 max_unscaled = 1;
  for (uint8_t i = 0; i < precision; ++i) {
    max_unscaled *= 10;
  }
  max_unscaled -= 1;

  int32_t n = 1;
  while (n < 16 && (max_unscaled >> (8 * n - 1)) != 0) {
    ++n;
  }
  return n;
}

ParquetType physical_type(const LogicalType& type) {
  switch (type.id) {
  case TypeId::BOOL:
    return ParquetType::BOOLEAN;
  case TypeId::INT32:
  case TypeId::DATE:
    return ParquetType::INT32;
  case TypeId::INT64:
  case TypeId::TIMESTAMP:
    return ParquetType::INT64;
  case TypeId::FLOAT32:
    return ParquetType::FLOAT;
  case TypeId::FLOAT64:
    return ParquetType::DOUBLE;
  case TypeId::DECIMAL:
    if (type.precision <= 9)
      return ParquetType::INT32;
    if (type.precision <= 18)
      return ParquetType::INT64;
    return ParquetType::FIXED_LEN_BYTE_ARRAY;
  case TypeId::STRING:
  case TypeId::BINARY:
  default:
    return ParquetType::BYTE_ARRAY;
  }
}

SchemaElement to_schema_element(const Column& column) {
  const LogicalType& type = column.type;

  SchemaElement elem;
  elem.name = column.name;
  elem.type = physical_type(type);
  elem.repetition_type =
      column.nullable ? FieldRepetitionType::OPTIONAL : FieldRepetitionType::REQUIRED;

  LogicalTypeAnnotation lt;
  switch (type.id) {
  case TypeId::STRING:
    elem.converted_type = ConvertedType::UTF8;
    lt.kind = Kind::STRING;
    break;
  case TypeId::DATE:
    elem.converted_type = ConvertedType::DATE;
    lt.kind = Kind::DATE;
    break;
  case TypeId::TIMESTAMP:
    lt.kind = Kind::TIMESTAMP;
    lt.is_adjusted_to_utc = type.adjusted_to_utc;
    lt.unit = to_unit_kind(type.unit);
    // The legacy annotations imply UTC and have no nanosecond form
    if (type.adjusted_to_utc && type.unit == TimeUnit::MILLIS)
      elem.converted_type = ConvertedType::TIMESTAMP_MILLIS;
    else if (type.adjusted_to_utc && type.unit == TimeUnit::MICROS)
      elem.converted_type = ConvertedType::TIMESTAMP_MICROS;
    break;
  case TypeId::DECIMAL:
    elem.converted_type = ConvertedType::DECIMAL;
    elem.scale = type.scale;
    elem.precision = type.precision;
    if (*elem.type == ParquetType::FIXED_LEN_BYTE_ARRAY)
      elem.type_length = decimal_byte_width(type.precision);
    lt.kind = Kind::DECIMAL;
    lt.scale = type.scale;
    lt.precision = type.precision;
    break;
  default:
    break;
  }
  if (lt.kind != Kind::NONE)
    elem.logical_type = lt;
  return elem;
}

std::string describe_schema_element(const SchemaElement& element) {
  std::string s;
  if (element.repetition_type == FieldRepetitionType::REPEATED)
    s = "REPEATED ";

  if (!element.type) {
    s += "group";
    if (element.num_children)
      s += " of " + std::to_string(*element.num_children) + " fields";
    return s;
  }

  s += physical_type_name(*element.type);
  if (*element.type == ParquetType::FIXED_LEN_BYTE_ARRAY && element.type_length)
    s += "(" + std::to_string(*element.type_length) + ")";

  if (element.logical_type && element.logical_type->kind != Kind::NONE) {
    s += " (" + describe_logical(*element.logical_type) + ")";
  } else if (element.converted_type) {
    s += " (";
    s += converted_type_name(*element.converted_type);
    if (*element.converted_type == ConvertedType::DECIMAL) {
      s += "(" + std::to_string(element.precision.value_or(0)) + ", " +
           std::to_string(element.scale.value_or(0)) + ")";
    }
    s += ")";
  }
  return s;
}

FieldDescriptor from_schema_element(const SchemaElement& element) {
  FieldDescriptor field;
  field.name = element.name;
  field.source_type = describe_schema_element(element);
  field.nullable = element.repetition_type == FieldRepetitionType::OPTIONAL;

  // Nested and repeated fields are reported, never flattened
  if (!element.type || element.repetition_type == FieldRepetitionType::REPEATED)
    return field;

  ParquetType physical = *element.type;
  if (element.logical_type && element.logical_type->kind != Kind::NONE) {
    field.type = map_logical(physical, *element.logical_type);
  } else if (element.converted_type) {
    field.type = map_converted(physical, *element.converted_type, element);
  } else {
    field.type = map_unannotated(physical);
  }

  // Fixed-width decimals must fit the declared width
  if (field.type && field.type->id == TypeId::DECIMAL &&
      physical == ParquetType::FIXED_LEN_BYTE_ARRAY) {
    int32_t width = element.type_length.value_or(0);
    if (width < 1 || width > 16)
      field.type.reset();
  }
  return field;
}

} // namespace parquet
} // namespace pqstudio
