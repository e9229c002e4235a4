/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "random_source.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace copairs {

    inline RandomSource::RandomSource(uint64_t seed, size_t batchSize)
        : engine_(seed)
        , batch_size_(batchSize == 0 ? 1 : batchSize)
    {
    }

    inline void RandomSource::refill() {
        batch_.resize(batch_size_);
        for (auto& u : batch_) {
            // top 53 bits -> [0, 1); independent of the standard library's distributions
            u = static_cast<double>(engine_() >> 11) * 0x1.0p-53;
        }
        pos_ = 0;
    }

    inline double RandomSource::nextUniform() {
        if (pos_ >= batch_.size()) {
            refill();
        }
        return batch_[pos_++];
    }

    inline size_t RandomSource::integers(size_t minVal, size_t maxVal) {
        if (maxVal < minVal) {
            throw std::invalid_argument("RandomSource::integers: empty range");
        }
        const double span = static_cast<double>(maxVal - minVal) + 1.0;
        size_t offset = static_cast<size_t>(nextUniform() * span);
        // guard against rounding up to span for values very close to 1
        offset = std::min(offset, maxVal - minVal);
        return minVal + offset;
    }

    inline RowIds RandomSource::sampleWithoutReplacement(const RowIds& items, size_t k) {
        RowIds pool = items;
        k = std::min(k, pool.size());
        for (size_t i = 0; i < k; ++i) {
            size_t j = integers(i, pool.size() - 1);
            std::swap(pool[i], pool[j]);
        }
        pool.resize(k);
        std::sort(pool.begin(), pool.end());
        return pool;
    }

} // namespace copairs
