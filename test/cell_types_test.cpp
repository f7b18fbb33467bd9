#include "pqstudio/cell.h"
#include "pqstudio/column_vector.h"
#include "pqstudio/columnar_table.h"
#include "pqstudio/types.h"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace pqstudio;

// ============================================================================
// LOGICAL TYPES
// ============================================================================

TEST(LogicalTypeTest, ToString) {
  EXPECT_EQ(LogicalType::int32().to_string(), "INT32");
  EXPECT_EQ(LogicalType::string().to_string(), "STRING");
  EXPECT_EQ(LogicalType::timestamp(TimeUnit::MICROS, true).to_string(), "TIMESTAMP(MICROS, UTC)");
  EXPECT_EQ(LogicalType::timestamp(TimeUnit::NANOS).to_string(), "TIMESTAMP(NANOS)");
  EXPECT_EQ(LogicalType::decimal(10, 2).to_string(), "DECIMAL(10, 2)");
}

TEST(LogicalTypeTest, EqualityIncludesParameters) {
  EXPECT_EQ(LogicalType::decimal(10, 2), LogicalType::decimal(10, 2));
  EXPECT_NE(LogicalType::decimal(10, 2), LogicalType::decimal(10, 3));
  EXPECT_NE(LogicalType::timestamp(TimeUnit::MILLIS), LogicalType::timestamp(TimeUnit::MICROS));
  EXPECT_NE(LogicalType::timestamp(TimeUnit::MILLIS, true),
            LogicalType::timestamp(TimeUnit::MILLIS, false));
  EXPECT_NE(LogicalType::int32(), LogicalType::date());
}

// ============================================================================
// CELLS
// ============================================================================

TEST(CellTest, NullByDefault) {
  Cell cell;
  EXPECT_TRUE(cell.is_null());
  EXPECT_FALSE(cell.is_raw());
  EXPECT_EQ(cell.to_string(), "");
  EXPECT_EQ(cell, Cell::null());
}

TEST(CellTest, MatchesExactType) {
  EXPECT_TRUE(Cell::int32(1).matches(LogicalType::int32()));
  EXPECT_FALSE(Cell::int32(1).matches(LogicalType::int64()));
  EXPECT_FALSE(Cell::int64(1).matches(LogicalType::int32()));
  EXPECT_FALSE(Cell::float64(1.0).matches(LogicalType::float32()));
  EXPECT_TRUE(Cell::date(0).matches(LogicalType::date()));
  EXPECT_FALSE(Cell::date(0).matches(LogicalType::int32()));
  EXPECT_TRUE(Cell::binary("x").matches(LogicalType::binary()));
  EXPECT_FALSE(Cell::string("x").matches(LogicalType::binary()));
}

TEST(CellTest, MatchesParameterizedTypes) {
  Cell ts = Cell::timestamp(5, TimeUnit::MILLIS);
  EXPECT_TRUE(ts.matches(LogicalType::timestamp(TimeUnit::MILLIS, true)));
  EXPECT_TRUE(ts.matches(LogicalType::timestamp(TimeUnit::MILLIS, false)));
  EXPECT_FALSE(ts.matches(LogicalType::timestamp(TimeUnit::MICROS)));

  Cell dec = Cell::decimal(12345, 10, 2);
  EXPECT_TRUE(dec.matches(LogicalType::decimal(10, 2)));
  EXPECT_FALSE(dec.matches(LogicalType::decimal(12, 2)));
}

TEST(CellTest, DecimalBeyondPrecisionDoesNotMatch) {
  EXPECT_TRUE(Cell::decimal(99999, 5, 2).matches(LogicalType::decimal(5, 2)));
  EXPECT_TRUE(Cell::decimal(-99999, 5, 2).matches(LogicalType::decimal(5, 2)));
  EXPECT_FALSE(Cell::decimal(100000, 5, 2).matches(LogicalType::decimal(5, 2)));
  EXPECT_FALSE(Cell::decimal(100000000000, 5, 2).matches(LogicalType::decimal(5, 2)));
}

TEST(CellTest, NullMatchesEverythingRawMatchesNothing) {
  EXPECT_TRUE(Cell::null().matches(LogicalType::boolean()));
  EXPECT_TRUE(Cell::null().matches(LogicalType::decimal(5, 1)));
  EXPECT_FALSE(Cell::raw("1").matches(LogicalType::int32()));
  EXPECT_FALSE(Cell::raw("x").matches(LogicalType::string()));
}

TEST(CellTest, ToString) {
  EXPECT_EQ(Cell::boolean(true).to_string(), "true");
  EXPECT_EQ(Cell::int64(-9).to_string(), "-9");
  EXPECT_EQ(Cell::float64(0.5).to_string(), "0.5");
  EXPECT_EQ(Cell::date(0).to_string(), "1970-01-01");
  EXPECT_EQ(Cell::timestamp(1000, TimeUnit::MILLIS).to_string(), "1970-01-01T00:00:01");
  EXPECT_EQ(Cell::decimal(-12345, 10, 2).to_string(), "-123.45");
  EXPECT_EQ(Cell::binary("Man").to_string(), "TWFu");
  EXPECT_EQ(Cell::raw(" 12 ").to_string(), " 12 ");
}

TEST(CellTest, Base64Padding) {
  EXPECT_EQ(base64_encode(""), "");
  EXPECT_EQ(base64_encode("M"), "TQ==");
  EXPECT_EQ(base64_encode("Ma"), "TWE=");
  EXPECT_EQ(base64_encode(std::string("\x00\xff", 2)), "AP8=");
}

TEST(CellTest, EqualityDistinguishesTypes) {
  EXPECT_NE(Cell::int32(1), Cell::int64(1));
  EXPECT_NE(Cell::string("1"), Cell::raw("1"));
  EXPECT_NE(Cell::date(1), Cell::int32(1));
  EXPECT_NE(Cell::timestamp(1, TimeUnit::MILLIS), Cell::timestamp(1, TimeUnit::MICROS));
}

TEST(CellTest, FloatEqualityIsBitwise) {
  double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(Cell::float64(nan), Cell::float64(nan));
  EXPECT_NE(Cell::float64(0.0), Cell::float64(-0.0));
}

TEST(CellTest, TypedAccess) {
  Cell cell = Cell::decimal(7, 3, 1);
  ASSERT_TRUE(cell.holds<Decimal>());
  EXPECT_TRUE(cell.get<Decimal>().unscaled == 7);
  EXPECT_EQ(cell.get<Decimal>().scale, 1);
  EXPECT_THROW(cell.get<int32_t>(), std::bad_variant_access);
}

// ============================================================================
// COLUMN VECTORS
// ============================================================================

TEST(ColumnVectorTest, CreatePicksStorage) {
  EXPECT_NE(dynamic_cast<Int32ColumnVector*>(ColumnVector::create(LogicalType::date()).get()),
            nullptr);
  EXPECT_NE(dynamic_cast<Int64ColumnVector*>(
                ColumnVector::create(LogicalType::timestamp(TimeUnit::NANOS)).get()),
            nullptr);
  EXPECT_NE(
      dynamic_cast<ByteArrayColumnVector*>(ColumnVector::create(LogicalType::binary()).get()),
      nullptr);
  EXPECT_NE(
      dynamic_cast<DecimalColumnVector*>(ColumnVector::create(LogicalType::decimal(4, 2)).get()),
      nullptr);
}

TEST(ColumnVectorTest, AppendAndRead) {
  auto vec = ColumnVector::create(LogicalType::timestamp(TimeUnit::MILLIS, true));
  vec->append(Cell::timestamp(10, TimeUnit::MILLIS));
  vec->append(Cell::null());
  vec->append_null();
  vec->append(Cell::timestamp(-5, TimeUnit::MILLIS));

  ASSERT_EQ(vec->size(), 4u);
  EXPECT_EQ(vec->null_count(), 2u);
  EXPECT_EQ(vec->cell_at(0), Cell::timestamp(10, TimeUnit::MILLIS));
  EXPECT_TRUE(vec->cell_at(1).is_null());
  EXPECT_TRUE(vec->is_null(2));
  EXPECT_EQ(vec->cell_at(3), Cell::timestamp(-5, TimeUnit::MILLIS));
}

TEST(ColumnVectorTest, AppendRejectsMismatch) {
  auto vec = ColumnVector::create(LogicalType::int32());
  try {
    vec->append(Cell::int64(1));
    FAIL() << "expected SCHEMA_MISMATCH";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::SCHEMA_MISMATCH);
  }
  EXPECT_THROW(vec->append(Cell::raw("1")), StudioException);
  EXPECT_EQ(vec->size(), 0u);
}

TEST(ColumnVectorTest, StatisticsSkipNullsAndNaN) {
  auto vec = ColumnVector::create(LogicalType::float64());
  vec->append(Cell::float64(2.5));
  vec->append(Cell::null());
  vec->append(Cell::float64(std::nan("")));
  vec->append(Cell::float64(-1.0));

  ColumnStatistics stats = vec->statistics();
  EXPECT_EQ(stats.null_count, 1);
  ASSERT_TRUE(stats.has_min_max());
  EXPECT_DOUBLE_EQ(std::get<double>(stats.min_value), -1.0);
  EXPECT_DOUBLE_EQ(std::get<double>(stats.max_value), 2.5);

  ColumnStatistics tail = vec->statistics(1, 3);
  EXPECT_EQ(tail.null_count, 1);
  EXPECT_FALSE(tail.has_min_max());
}

TEST(ColumnVectorTest, StringStatisticsUseByteOrder) {
  auto vec = ColumnVector::create(LogicalType::string());
  vec->append(Cell::string("b"));
  vec->append(Cell::string("\xc3\xa9")); // e-acute sorts after ASCII
  vec->append(Cell::string("a"));
  ColumnStatistics stats = vec->statistics();
  EXPECT_EQ(std::get<std::string>(stats.min_value), "a");
  EXPECT_EQ(std::get<std::string>(stats.max_value), "\xc3\xa9");
}

TEST(ColumnVectorTest, NoMinMaxForBoolBinaryDecimal) {
  for (const LogicalType& type :
       {LogicalType::boolean(), LogicalType::binary(), LogicalType::decimal(9, 0)}) {
    auto vec = ColumnVector::create(type);
    vec->append_null();
    EXPECT_FALSE(vec->statistics().has_min_max()) << type.to_string();
    EXPECT_EQ(vec->statistics().null_count, 1) << type.to_string();
  }
}

// ============================================================================
// COLUMNAR TABLE
// ============================================================================

TEST(ColumnarTableTest, FieldAndColumnCountsMustAgree) {
  std::vector<FieldDescriptor> fields{FieldDescriptor::from_column({"a", LogicalType::int32()})};
  std::vector<std::unique_ptr<ColumnVector>> columns;
  try {
    ColumnarTable table(std::move(fields), std::move(columns), 0);
    FAIL() << "expected DECODE_ERROR";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::DECODE_ERROR);
  }
}

TEST(ColumnarTableTest, Lookup) {
  std::vector<FieldDescriptor> fields{
      FieldDescriptor::from_column({"a", LogicalType::int32()}),
      FieldDescriptor::from_column({"b", LogicalType::string(), false})};
  std::vector<std::unique_ptr<ColumnVector>> columns;
  columns.push_back(ColumnVector::create(LogicalType::int32()));
  columns.push_back(ColumnVector::create(LogicalType::string()));
  ColumnarTable table(std::move(fields), std::move(columns), 0);

  EXPECT_EQ(table.num_columns(), 2u);
  EXPECT_EQ(table.column_names(), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(table.find_column("b"), 1u);
  EXPECT_FALSE(table.find_column("c").has_value());
  EXPECT_FALSE(table.field(1).nullable);
  EXPECT_EQ(table.field(1).source_type, "STRING");
}
