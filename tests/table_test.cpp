/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file table_test.cpp
 * @brief Tests for Value normalization and the Table column store
 *
 * Test categories:
 *   1. Value helpers (null, NaN, equality, difference, printing)
 *   2. Column construction and validation
 *   3. select / explode
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <copairs/copairs.h>

using namespace copairs;

// ============================================================================
// 1. Value helpers
// ============================================================================

TEST(ValueTest, NanNormalizesToNull) {
    Value v = normalizeValue(Value{std::numeric_limits<double>::quiet_NaN()});
    EXPECT_TRUE(isNull(v));
    EXPECT_EQ(kindOf(v), ValueKind::NONE);
    EXPECT_EQ(kindOf(normalizeValue(Value{1.5})), ValueKind::DOUBLE);
}

TEST(ValueTest, NullIsNeverSameAndAlwaysDifferent) {
    const Value null{};
    EXPECT_FALSE(cellsEqual(null, null));
    EXPECT_FALSE(cellsEqual(null, Value{int64_t{1}}));
    EXPECT_TRUE(cellsDiffer(null, null));
    EXPECT_TRUE(cellsDiffer(Value{std::string("a")}, null));
}

TEST(ValueTest, EqualityIsTypeSensitive) {
    EXPECT_TRUE(cellsEqual(Value{int64_t{3}}, Value{int64_t{3}}));
    EXPECT_FALSE(cellsEqual(Value{int64_t{3}}, Value{3.0}));
    EXPECT_TRUE(cellsDiffer(Value{std::string("x")}, Value{std::string("y")}));
    EXPECT_FALSE(cellsDiffer(Value{true}, Value{true}));
}

TEST(ValueTest, Printing) {
    std::ostringstream os;
    os << Value{} << ";" << Value{int64_t{-4}} << ";" << Value{std::string("abc")} << ";" << Value{false};
    EXPECT_EQ(os.str(), "<null>;-4;abc;false");
    EXPECT_EQ(toString(Value{0.5}), "0.5");
}

// ============================================================================
// 2. Column construction
// ============================================================================

TEST(TableTest, TypedColumnsConvertToValues) {
    Table t;
    t.addColumn("name", std::vector<std::string>{"a", "b", "c"});
    t.addColumn("n", std::vector<int>{1, 2, 3});
    t.addColumn("x", std::vector<double>{0.5, std::nan(""), 2.0});

    EXPECT_EQ(t.columnCount(), 3u);
    EXPECT_EQ(t.rowCount(), 3u);
    EXPECT_TRUE(t.hasColumn("n"));
    EXPECT_FALSE(t.hasColumn("missing"));
    EXPECT_EQ(t.columnIndex("x"), 2u);
    EXPECT_EQ(t.columnName(0), "name");

    EXPECT_EQ(std::get<std::string>(t.at(1, 0)), "b");
    EXPECT_EQ(std::get<int64_t>(t.at(2, 1)), 3);
    EXPECT_TRUE(isNull(t.at(1, 2)));
}

TEST(TableTest, RejectsMalformedColumns) {
    Table t;
    t.addColumn("a", std::vector<int>{1, 2});
    EXPECT_THROW(t.addColumn("a", std::vector<int>{3, 4}), TableError);
    EXPECT_THROW(t.addColumn("", std::vector<int>{3, 4}), TableError);
    EXPECT_THROW(t.addColumn("b", std::vector<int>{1, 2, 3}), TableError);
    EXPECT_THROW(t.addListColumn("l", std::vector<Labels>(5)), TableError);
    EXPECT_THROW(t.columnIndex("zzz"), TableError);
}

TEST(TableTest, ListColumnAccess) {
    Table t;
    t.addColumn("id", std::vector<int>{0, 1});
    t.addListColumn("tags", {Labels{Value{std::string("a")}, Value{std::string("b")}}, Labels{}});

    const size_t col = t.columnIndex("tags");
    EXPECT_TRUE(t.isListColumn(col));
    EXPECT_FALSE(t.isListColumn(0));
    EXPECT_EQ(t.labels(0, col).size(), 2u);
    EXPECT_TRUE(t.labels(1, col).empty());
    EXPECT_THROW(t.at(0, col), TableError);
    EXPECT_THROW(t.labels(0, 0), TableError);
    EXPECT_THROW(t.column(col), TableError);
}

// ============================================================================
// 3. select / explode
// ============================================================================

TEST(TableTest, SelectReordersAndSubsets) {
    Table t;
    t.addColumn("a", std::vector<int>{1, 2});
    t.addColumn("b", std::vector<int>{3, 4});
    t.addColumn("c", std::vector<int>{5, 6});

    Table s = t.select({"c", "a"});
    ASSERT_EQ(s.columnCount(), 2u);
    EXPECT_EQ(s.columnName(0), "c");
    EXPECT_EQ(std::get<int64_t>(s.at(1, 0)), 6);
    EXPECT_EQ(std::get<int64_t>(s.at(0, 1)), 1);
    EXPECT_THROW(t.select({"a", "nope"}), TableError);
}

TEST(TableTest, ExplodeRepeatsOtherColumns) {
    Table t;
    t.addColumn("id", std::vector<std::string>{"r0", "r1", "r2"});
    t.addListColumn("c", {
        Labels{Value{std::string("a")}, Value{std::string("b")}},
        Labels{},
        Labels{Value{std::string("c")}},
    });

    std::vector<RowId> original;
    Table e = t.explode("c", original);

    ASSERT_EQ(e.rowCount(), 4u);
    EXPECT_EQ(original, (std::vector<RowId>{0, 0, 1, 2}));
    const size_t c = e.columnIndex("c");
    EXPECT_FALSE(e.isListColumn(c));
    EXPECT_EQ(std::get<std::string>(e.at(0, c)), "a");
    EXPECT_EQ(std::get<std::string>(e.at(1, c)), "b");
    EXPECT_TRUE(isNull(e.at(2, c)));
    EXPECT_EQ(std::get<std::string>(e.at(3, c)), "c");
    EXPECT_EQ(std::get<std::string>(e.at(1, e.columnIndex("id"))), "r0");

    EXPECT_THROW(t.explode("id", original), TableError);
}
