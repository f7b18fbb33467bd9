#include "pqstudio/cow_buffer.h"
#include "pqstudio/edit_buffer.h"

#include "test_util.h"

#include <gtest/gtest.h>

using namespace pqstudio;

namespace {

std::vector<Column> letter_columns() {
  return {{"letter", LogicalType::string(), false}, {"n", LogicalType::int32()},
          {"flag", LogicalType::boolean()}};
}

// Rows A, B, C, D with n = 0..3
EditBuffer letter_buffer() {
  std::vector<Row> rows;
  const char* letters[] = {"A", "B", "C", "D"};
  for (int32_t i = 0; i < 4; ++i) {
    rows.push_back({Cell::string(letters[i]), Cell::int32(i), Cell::boolean(i % 2 == 0)});
  }
  return test_util::make_buffer(letter_columns(), std::move(rows));
}

std::vector<std::string> letters(const EditBuffer& buffer) {
  std::vector<std::string> out;
  for (const auto& row : buffer.rows()) {
    out.push_back(row[0].get<std::string>());
  }
  return out;
}

} // namespace

// ============================================================================
// COPY-ON-WRITE STORAGE
// ============================================================================

TEST(CowBufferTest, ShareThenMutateClones) {
  CowBuffer<int> a(std::vector<int>{1, 2, 3});
  EXPECT_TRUE(a.is_owned());

  CowBuffer<int> b = a.share();
  EXPECT_TRUE(a.is_shared());
  EXPECT_EQ(a.use_count(), 2);

  b.to_mut().push_back(4);
  EXPECT_EQ(a.size(), 3u);
  EXPECT_EQ(b.size(), 4u);
  EXPECT_TRUE(a.is_owned());
  EXPECT_TRUE(b.is_owned());
}

TEST(CowBufferTest, OwnedMutationIsInPlace) {
  CowBuffer<int> a(std::vector<int>{1});
  const int* before = a.as_vec().data();
  a.to_mut()[0] = 5;
  EXPECT_EQ(a.as_vec().data(), before);
  EXPECT_EQ(a[0], 5);
}

// ============================================================================
// EDITING
// ============================================================================

TEST(EditBufferTest, SetCellStoresRawText) {
  EditBuffer buffer = letter_buffer();
  buffer.set_cell(1, "n", "12.5");
  EXPECT_EQ(buffer.cell(1, 1), Cell::raw("12.5"));
  EXPECT_EQ(buffer.edit_count(), 1u);
  EXPECT_TRUE(buffer.dirty());
}

TEST(EditBufferTest, BoolTextIsTypedImmediately) {
  EditBuffer buffer = letter_buffer();
  buffer.set_cell(0, "flag", "no");
  EXPECT_EQ(buffer.cell(0, 2), Cell::boolean(false));
  buffer.set_cell(1, "flag", "perhaps");
  EXPECT_EQ(buffer.cell(1, 2), Cell::raw("perhaps"));
}

TEST(EditBufferTest, SetNullAndSetValue) {
  EditBuffer buffer = letter_buffer();
  buffer.set_null(2, "n");
  EXPECT_TRUE(buffer.cell(2, 1).is_null());

  buffer.set_value(3, "n", Cell::int32(99));
  EXPECT_EQ(buffer.cell(3, 1), Cell::int32(99));
  EXPECT_EQ(buffer.edit_count(), 2u);
}

TEST(EditBufferTest, SetValueRejectsWrongType) {
  EditBuffer buffer = letter_buffer();
  try {
    buffer.set_value(0, "n", Cell::int64(1));
    FAIL() << "expected SCHEMA_MISMATCH";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::SCHEMA_MISMATCH);
    EXPECT_EQ(e.error().column, "n");
  }
  EXPECT_EQ(buffer.cell(0, 1), Cell::int32(0));
  EXPECT_FALSE(buffer.dirty());
}

TEST(EditBufferTest, SetValueRejectsDecimalBeyondPrecision) {
  std::vector<Column> columns{{"price", LogicalType::decimal(5, 2), true}};
  EditBuffer buffer = test_util::make_buffer(columns, {{Cell::decimal(100, 5, 2)}});
  buffer.set_value(0, "price", Cell::decimal(99999, 5, 2));
  try {
    buffer.set_value(0, "price", Cell::decimal(100000, 5, 2));
    FAIL() << "expected SCHEMA_MISMATCH";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::SCHEMA_MISMATCH);
    EXPECT_EQ(e.error().column, "price");
  }
  EXPECT_EQ(buffer.cell(0, 0), Cell::decimal(99999, 5, 2));
}

TEST(EditBufferTest, EditErrors) {
  EditBuffer buffer = letter_buffer();
  try {
    buffer.set_cell(4, "n", "1");
    FAIL() << "expected INDEX_OUT_OF_RANGE";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(e.error().row, 4u);
  }
  try {
    buffer.set_null(0, "missing");
    FAIL() << "expected UNKNOWN_COLUMN";
  } catch (const StudioException& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_COLUMN);
  }
  EXPECT_THROW(buffer.cell(0, 3), StudioException);
  EXPECT_FALSE(buffer.dirty());
}

TEST(EditBufferTest, RowsMustMatchCatalog) {
  std::vector<Row> rows{{Cell::string("A")}};
  EXPECT_THROW(test_util::make_buffer(letter_columns(), rows), StudioException);
}

// ============================================================================
// DELETION AND SELECTION
// ============================================================================

TEST(EditBufferTest, DeleteKeepsSurvivorsInOrder) {
  EditBuffer buffer = letter_buffer();
  EXPECT_EQ(buffer.delete_rows({1, 3}), 2u);
  EXPECT_EQ(letters(buffer), (std::vector<std::string>{"A", "C"}));
  EXPECT_EQ(buffer.column_count(), 3u);
}

TEST(EditBufferTest, DeleteIgnoresOutOfRange) {
  EditBuffer buffer = letter_buffer();
  EXPECT_EQ(buffer.delete_rows({7, 100}), 4u);
  EXPECT_FALSE(buffer.dirty());
  EXPECT_EQ(buffer.delete_rows({0, 9}), 3u);
  EXPECT_EQ(letters(buffer), (std::vector<std::string>{"B", "C", "D"}));
}

TEST(EditBufferTest, DeleteEverything) {
  EditBuffer buffer = letter_buffer();
  EXPECT_EQ(buffer.delete_rows({0, 1, 2, 3}), 0u);
  EXPECT_EQ(buffer.row_count(), 0u);
  EXPECT_EQ(buffer.column_count(), 3u);
}

TEST(EditBufferTest, Selection) {
  EditBuffer buffer = letter_buffer();
  buffer.select(0);
  buffer.select(2);
  buffer.select(10); // ignored
  buffer.toggle_selection(2);
  buffer.toggle_selection(3);
  EXPECT_EQ(buffer.selected(), (std::set<size_t>{0, 3}));
  EXPECT_TRUE(buffer.is_selected(3));

  buffer.deselect(0);
  EXPECT_EQ(buffer.selected(), (std::set<size_t>{3}));
  buffer.clear_selection();
  EXPECT_TRUE(buffer.selected().empty());
}

TEST(EditBufferTest, DeleteSelected) {
  EditBuffer buffer = letter_buffer();
  buffer.select(0);
  buffer.select(2);
  EXPECT_EQ(buffer.delete_selected(), 2u);
  EXPECT_EQ(letters(buffer), (std::vector<std::string>{"B", "D"}));
  EXPECT_TRUE(buffer.selected().empty());
}

TEST(EditBufferTest, DeletionClearsSelection) {
  EditBuffer buffer = letter_buffer();
  buffer.select(3);
  buffer.delete_rows({0});
  EXPECT_TRUE(buffer.selected().empty());
}

TEST(EditBufferTest, MarkClean) {
  EditBuffer buffer = letter_buffer();
  buffer.set_cell(0, "letter", "Z");
  buffer.mark_clean();
  EXPECT_FALSE(buffer.dirty());
  EXPECT_EQ(buffer.cell(0, 0), Cell::raw("Z"));
}

// ============================================================================
// SNAPSHOTS
// ============================================================================

TEST(SnapshotTest, UnaffectedByLaterEdits) {
  EditBuffer buffer = letter_buffer();
  Snapshot before = buffer.snapshot();

  buffer.set_cell(0, "n", "41");
  buffer.delete_rows({1});

  EXPECT_EQ(before.row_count(), 4u);
  EXPECT_EQ(before.cell(0, 1), Cell::int32(0));
  EXPECT_EQ(before.cell(1, 0), Cell::string("B"));
  EXPECT_EQ(buffer.row_count(), 3u);
  EXPECT_EQ(buffer.cell(0, 1), Cell::raw("41"));
}

TEST(SnapshotTest, SharesCatalog) {
  EditBuffer buffer = letter_buffer();
  Snapshot snap = buffer.snapshot();
  EXPECT_EQ(snap.catalog_ptr(), buffer.catalog_ptr());
  EXPECT_EQ(snap.column_count(), 3u);
}
