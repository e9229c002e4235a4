/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file pair_table_test.cpp
 * @brief Tests for flattenPairs (PairCollection to Table)
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <copairs/copairs.h>

using namespace copairs;

namespace {

Table plates() {
    Table t;
    t.addColumn("compound", std::vector<std::string>{"X", "X", "X", "Y", "Y"});
    t.addColumn("dose", std::vector<int64_t>{1, 1, 1, 2, 2});
    t.addColumn("plate", std::vector<int64_t>{1, 2, 3, 1, 2});
    return t;
}

} // namespace

TEST(PairTableTest, SingleKeyColumn) {
    Matcher matcher(plates(), {"compound", "plate"}, 0);
    const PairCollection pairs = matcher.getAllPairs("compound", "plate");
    const Table flat = flattenPairs(pairs, "compound");

    ASSERT_EQ(flat.columnNames(), (ColumnNames{"compound", "ix1", "ix2"}));
    ASSERT_EQ(flat.rowCount(), 4u);   // X: 3 pairs, Y: 1 pair

    EXPECT_EQ(std::get<std::string>(flat.at(0, 0)), "X");
    EXPECT_EQ(std::get<int64_t>(flat.at(0, 1)), 0);
    EXPECT_EQ(std::get<int64_t>(flat.at(0, 2)), 1);
    EXPECT_EQ(std::get<std::string>(flat.at(3, 0)), "Y");
    EXPECT_EQ(std::get<int64_t>(flat.at(3, 1)), 3);
    EXPECT_EQ(std::get<int64_t>(flat.at(3, 2)), 4);
}

TEST(PairTableTest, CompositeKeyColumns) {
    Matcher matcher(plates(), {"compound", "dose", "plate"}, 0);
    const ColumnNames sameby{"dose", "compound"};
    const Table flat = flattenPairs(matcher.getAllPairs(sameby, "plate"), sameby);

    ASSERT_EQ(flat.columnNames(), (ColumnNames{"dose", "compound", "ix1", "ix2"}));
    ASSERT_EQ(flat.rowCount(), 4u);
    for (size_t row = 0; row < flat.rowCount(); ++row) {
        const std::string compound = std::get<std::string>(flat.at(row, 1));
        EXPECT_EQ(std::get<int64_t>(flat.at(row, 0)), compound == "X" ? 1 : 2);
    }
}

TEST(PairTableTest, NullKeyBecomesKeyColumn) {
    Matcher matcher(plates(), {"compound", "plate"}, 0);
    const Table flat = flattenPairs(matcher.getAllPairs(ColumnNames{}, "compound"), ColumnNames{});

    ASSERT_EQ(flat.columnNames(), (ColumnNames{"key", "ix1", "ix2"}));
    ASSERT_EQ(flat.rowCount(), 6u);
    for (size_t row = 0; row < flat.rowCount(); ++row) {
        EXPECT_TRUE(isNull(flat.at(row, 0)));
        EXPECT_LT(std::get<int64_t>(flat.at(row, 1)), std::get<int64_t>(flat.at(row, 2)));
    }
}

TEST(PairTableTest, EmptyCollectionThrows) {
    try {
        flattenPairs(PairCollection{}, "compound");
        FAIL() << "expected EmptyPairsError";
    } catch (const EmptyPairsError& ex) {
        EXPECT_STREQ(ex.what(), "no pairs found");
    }
}
