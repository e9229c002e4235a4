/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file matcher_multilabel_test.cpp
 * @brief Tests for MatcherMultilabel (label-list columns)
 */

#include <gtest/gtest.h>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <copairs/copairs.h>
#include "test_helpers.hpp"

using namespace copairs;
using copairs_test::naivePairs;
using copairs_test::pairSet;
using copairs_test::Query;

namespace {

Labels labels(std::initializer_list<const char*> items) {
    Labels out;
    for (const char* s : items) {
        out.emplace_back(std::string(s));
    }
    return out;
}

/// c=[{a,b}, {b}, {c}]
Table threeRows() {
    Table t;
    t.addColumn("id", std::vector<int64_t>{0, 1, 2});
    t.addListColumn("c", {labels({"a", "b"}), labels({"b"}), labels({"c"})});
    return t;
}

/// Random table with a "targets" list column: 0 to 3 labels per row, duplicates allowed.
Table randomTargets(size_t rows, uint32_t seed) {
    std::mt19937 gen(seed);
    std::vector<std::string> compound;
    std::vector<int64_t> plate;
    std::vector<std::string> well;
    std::vector<Labels> targets;
    for (size_t i = 0; i < rows; ++i) {
        compound.push_back("c" + std::to_string(gen() % 10));
        plate.push_back(static_cast<int64_t>(gen() % 3));
        well.push_back("w" + std::to_string(gen() % 4));
        Labels row;
        const size_t n = gen() % 4;
        for (size_t k = 0; k < n; ++k) {
            row.emplace_back(std::string("t") + std::to_string(gen() % 8));
        }
        targets.push_back(std::move(row));
    }
    Table t;
    t.addColumn("compound", compound);
    t.addColumn("plate", plate);
    t.addColumn("well", well);
    t.addListColumn("targets", std::move(targets));
    return t;
}

bool shareLabel(const Table& t, RowId a, RowId b, const std::string& column) {
    return copairs_test::rowsSame(t, a, b, t.columnIndex(column));
}

} // namespace

TEST(MatcherMultilabelTest, DiffbyMultilabelMeansDisjointLabelSets) {
    MatcherMultilabel matcher(threeRows(), {"c"}, "c", 0);
    const PairCollection pairs = matcher.getAllPairs(ColumnNames{}, ColumnNames{"c"});

    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_TRUE(pairs.begin()->first.isNull());
    EXPECT_EQ(pairs.begin()->second, (std::vector<Pair>{{0, 2}, {1, 2}}));
}

TEST(MatcherMultilabelTest, SamebyMultilabelMeansSharedLabel) {
    MatcherMultilabel matcher(threeRows(), {"id"}, "c", 0);
    const PairCollection pairs = matcher.getAllPairs("c", "id");

    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs.at(PairKey("c", Value{std::string("b")})), (std::vector<Pair>{{0, 1}}));
}

TEST(MatcherMultilabelTest, ExplodedRowsMapToOriginals) {
    MatcherMultilabel matcher(threeRows(), {"id"}, "c", 0);
    EXPECT_EQ(matcher.multilabelColumn(), "c");
    EXPECT_EQ(matcher.rowCount(), 3u);
    EXPECT_EQ(matcher.originalIndex(), (std::vector<RowId>{0, 0, 1, 2}));
    EXPECT_EQ(matcher.matcher().rowCount(), 4u);
    EXPECT_EQ(matcher.matcher().columns(), (ColumnNames{"id", "c"}));
}

TEST(MatcherMultilabelTest, RowsWithoutLabelsMatchNothingAndDifferFromAll) {
    Table t;
    t.addListColumn("c", {labels({"a"}), Labels{}, labels({"a"}), Labels{}});
    MatcherMultilabel matcher(t, {}, "c", 0);

    EXPECT_EQ(pairSet(matcher.getAllPairs("c", ColumnNames{})), (std::set<Pair>{{0, 2}}));
    EXPECT_EQ(pairSet(matcher.getAllPairs(ColumnNames{}, "c")),
              (std::set<Pair>{{0, 1}, {0, 3}, {1, 2}, {1, 3}, {2, 3}}));
}

TEST(MatcherMultilabelTest, DiffbyMultilabelIgnoresGroupClipping) {
    Table t;
    t.addListColumn("c", std::vector<Labels>(6, labels({"a"})));
    MatcherMultilabel matcher(t, {"c"}, "c", 1, size_t{2});
    EXPECT_TRUE(matcher.matcher().reverseIndex("c").isClipped());
    EXPECT_TRUE(matcher.getAllPairs(ColumnNames{}, "c").empty());

    Table mixed;
    mixed.addListColumn("c", {labels({"a"}), labels({"a"}), labels({"a", "b"}), labels({"b"}), labels({"a"})});
    MatcherMultilabel clipped(mixed, {"c"}, "c", 1, size_t{2});
    EXPECT_EQ(pairSet(clipped.getAllPairs(ColumnNames{}, "c")), (std::set<Pair>{{0, 3}, {1, 3}, {3, 4}}));
}

TEST(MatcherMultilabelTest, RepeatedLabelsProduceNoSelfPairs) {
    Table t;
    t.addColumn("plate", std::vector<int64_t>{1, 2});
    t.addListColumn("c", {labels({"a", "a"}), labels({"a"})});
    MatcherMultilabel matcher(t, {"plate"}, "c", 0);

    const PairCollection pairs = matcher.getAllPairs("c", ColumnNames{});
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs.begin()->second, (std::vector<Pair>{{0, 1}}));
}

TEST(MatcherMultilabelTest, RejectsMultilabelInDiffbyAny) {
    Table t = randomTargets(10, 1);
    MatcherMultilabel matcher(t, {"compound", "plate"}, "targets", 0);
    EXPECT_THROW(matcher.getAllPairs("compound", ColumnGroup{{}, {"targets", "plate"}}), SpecificationError);
    EXPECT_THROW(matcher.getAllPairs("targets", "targets"), SpecificationError);
}

TEST(MatcherMultilabelTest, RejectsScalarMultilabelColumn) {
    Table t = randomTargets(10, 1);
    EXPECT_THROW(MatcherMultilabel(t, {"plate"}, "compound", 0), TableError);
}

// ============================================================================
// Null-pair sampling
// ============================================================================

TEST(MatcherMultilabelTest, NullPairsHaveDisjointLabels) {
    const Table t = randomTargets(40, 3);
    MatcherMultilabel matcher(t, {"compound"}, "targets", 11);
    for (const auto& [a, b] : matcher.getNullPairs(ColumnNames{"targets"}, 300, 50)) {
        ASSERT_NE(a, b);
        ASSERT_LT(a, t.rowCount());
        ASSERT_LT(b, t.rowCount());
        ASSERT_FALSE(shareLabel(t, a, b, "targets")) << a << ", " << b;
    }
}

TEST(MatcherMultilabelTest, NullPairsOnScalarColumnMapToDistinctRows) {
    const Table t = randomTargets(40, 4);
    MatcherMultilabel matcher(t, {"compound"}, "targets", 11);
    const size_t c = t.columnIndex("compound");
    for (int i = 0; i < 300; ++i) {
        const auto [a, b] = matcher.sampleNullPair("compound", 50);
        ASSERT_NE(a, b);
        ASSERT_NE(t.at(a, c), t.at(b, c));
    }
}

TEST(MatcherMultilabelTest, NullPairsAreReproducible) {
    const Table t = randomTargets(30, 5);
    MatcherMultilabel first(t, {"compound"}, "targets", 8);
    MatcherMultilabel second(t, {"compound"}, "targets", 8);
    EXPECT_EQ(first.getNullPairs("compound", 200, 20), second.getNullPairs("compound", 200, 20));
}

TEST(MatcherMultilabelTest, SamplingExhaustsWhenAllLabelsOverlap) {
    Table t;
    t.addListColumn("c", {labels({"a", "b"}), labels({"a"}), labels({"b", "a"})});
    MatcherMultilabel matcher(t, {}, "c", 0);
    EXPECT_THROW(matcher.sampleNullPair("c", 10), SamplingExhaustedError);
}

// ============================================================================
// Cross-check against the O(n^2) reference
// ============================================================================

class MultilabelCrossCheckTest : public ::testing::TestWithParam<Query> {};

TEST_P(MultilabelCrossCheckTest, MatchesNaiveReference) {
    const Query& q = GetParam();
    for (uint32_t seed : {7u, 8u}) {
        const Table t = randomTargets(40, seed);
        MatcherMultilabel matcher(t, {"compound", "plate", "well"}, "targets", seed);

        const PairCollection pairs = matcher.getAllPairs(copairs_test::sameSpec(q), copairs_test::diffSpec(q));
        for (const auto& [key, list] : pairs) {
            EXPECT_FALSE(list.empty());
            std::set<Pair> inKey;
            for (const auto& [a, b] : list) {
                EXPECT_LT(a, b);
                EXPECT_TRUE(inKey.emplace(a, b).second) << "duplicate under key " << key;
            }
        }
        EXPECT_EQ(pairSet(pairs), naivePairs(t, q)) << "seed " << seed;
    }
}

INSTANTIATE_TEST_SUITE_P(ConstraintShapes, MultilabelCrossCheckTest, ::testing::Values(
    Query{{"targets"}, {}, {}, {}},
    Query{{"targets"}, {}, {"compound"}, {}},
    Query{{"compound"}, {}, {"targets"}, {}},
    Query{{}, {}, {"targets"}, {}},
    Query{{}, {}, {"targets", "plate"}, {}},
    Query{{"targets", "plate"}, {}, {}, {}},
    Query{{}, {"targets", "plate"}, {"compound"}, {}},
    Query{{}, {}, {"targets"}, {"plate", "well"}},
    Query{{"plate"}, {}, {"targets"}, {}}
));
