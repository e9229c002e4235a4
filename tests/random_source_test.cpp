/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file random_source_test.cpp
 * @brief Tests for the seeded, batched RandomSource
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <set>
#include <vector>

#include <copairs/copairs.h>

using namespace copairs;

TEST(RandomSourceTest, SameSeedSameSequence) {
    RandomSource a(123);
    RandomSource b(123);
    for (int i = 0; i < 1000; ++i) {
        ASSERT_EQ(a.nextUniform(), b.nextUniform());
    }
}

TEST(RandomSourceTest, DifferentSeedsDiverge) {
    RandomSource a(1);
    RandomSource b(2);
    int equal = 0;
    for (int i = 0; i < 100; ++i) {
        equal += (a.nextUniform() == b.nextUniform()) ? 1 : 0;
    }
    EXPECT_LT(equal, 5);
}

TEST(RandomSourceTest, SequenceIndependentOfBatchSize) {
    RandomSource ref(99);
    RandomSource one(99, 1);
    RandomSource seven(99, 7);
    EXPECT_EQ(one.batchSize(), 1u);
    for (int i = 0; i < 50; ++i) {
        const double u = ref.nextUniform();
        ASSERT_EQ(u, one.nextUniform()) << "at draw " << i;
        ASSERT_EQ(u, seven.nextUniform()) << "at draw " << i;
    }
}

TEST(RandomSourceTest, ZeroBatchSizeIsClamped) {
    RandomSource rng(5, 0);
    EXPECT_EQ(rng.batchSize(), 1u);
    const double u = rng.nextUniform();
    EXPECT_GE(u, 0.0);
    EXPECT_LT(u, 1.0);
}

TEST(RandomSourceTest, UniformInUnitInterval) {
    RandomSource rng(7, 16);
    for (int i = 0; i < 10000; ++i) {
        const double u = rng.nextUniform();
        ASSERT_GE(u, 0.0);
        ASSERT_LT(u, 1.0);
    }
}

TEST(RandomSourceTest, IntegersCoverInclusiveRange) {
    RandomSource rng(11);
    std::set<size_t> seen;
    for (int i = 0; i < 2000; ++i) {
        const size_t v = rng.integers(3, 7);
        ASSERT_GE(v, 3u);
        ASSERT_LE(v, 7u);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 5u);
    EXPECT_EQ(rng.integers(4, 4), 4u);
    EXPECT_THROW(rng.integers(5, 4), std::invalid_argument);
}

TEST(RandomSourceTest, ChoicePicksElements) {
    RandomSource rng(3);
    const std::vector<int> items{10, 20, 30};
    for (int i = 0; i < 100; ++i) {
        const int v = rng.choice(items);
        ASSERT_TRUE(v == 10 || v == 20 || v == 30);
    }
}

TEST(RandomSourceTest, SampleWithoutReplacementIsSortedAndDistinct) {
    RandomSource rng(17);
    RowIds items(50);
    std::iota(items.begin(), items.end(), RowId{100});

    const RowIds sample = rng.sampleWithoutReplacement(items, 10);
    ASSERT_EQ(sample.size(), 10u);
    EXPECT_TRUE(std::is_sorted(sample.begin(), sample.end()));
    EXPECT_EQ(std::adjacent_find(sample.begin(), sample.end()), sample.end());
    for (RowId id : sample) {
        EXPECT_GE(id, 100u);
        EXPECT_LT(id, 150u);
    }

    // k larger than the population returns everything
    EXPECT_EQ(rng.sampleWithoutReplacement(RowIds{4, 2, 9}, 10), (RowIds{2, 4, 9}));
    EXPECT_TRUE(rng.sampleWithoutReplacement(items, 0).empty());
}
