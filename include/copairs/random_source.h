/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file random_source.h
 * @brief Seeded uniform random source with batched refill.
 *
 * Every random decision of a matcher (group subsampling, row draws, partner
 * draws) is derived from nextUniform(). Uniforms are generated in batches;
 * the sequence depends on the seed only, never on the batch size.
 */

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "definitions.h"

namespace copairs {

    class RandomSource {
        std::mt19937_64         engine_;
        std::vector<double>     batch_;
        size_t                  batch_size_;
        size_t                  pos_ = 0;

        void refill();

    public:
        explicit RandomSource(uint64_t seed, size_t batchSize = RANDOM_BATCH_SIZE);

        // Non-copyable, movable: a copy would replay the same sequence
        RandomSource(const RandomSource&) = delete;
        RandomSource& operator=(const RandomSource&) = delete;
        RandomSource(RandomSource&&) noexcept = default;
        RandomSource& operator=(RandomSource&&) noexcept = default;

        size_t batchSize() const { return batch_size_; }

        /// Next uniform value in [0, 1).
        double nextUniform();

        /// Uniform integer in [minVal, maxVal], both inclusive.
        size_t integers(size_t minVal, size_t maxVal);

        /// Uniformly chosen element of a non-empty vector.
        template<typename T>
        const T& choice(const std::vector<T>& items) {
            return items[integers(0, items.size() - 1)];
        }

        /// k distinct elements drawn uniformly (partial Fisher-Yates), returned sorted.
        RowIds sampleWithoutReplacement(const RowIds& items, size_t k);
    };

} // namespace copairs
