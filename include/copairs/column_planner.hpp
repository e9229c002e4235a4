/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "column_planner.h"
#include "exceptions.h"

#include <algorithm>
#include <numeric>

namespace copairs {

    inline ColumnPlanner::ColumnPlanner(const std::vector<ReverseIndex>& indices) {
        std::vector<size_t> order(indices.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::stable_sort(order.begin(), order.end(), [&indices](size_t a, size_t b) {
            return indices[a].pairCount() < indices[b].pairCount();
        });
        for (size_t r = 0; r < order.size(); ++r) {
            const ReverseIndex& index = indices[order[r]];
            rank_[index.column()] = r;
            n_pairs_[index.column()] = index.pairCount();
        }
    }

    inline size_t ColumnPlanner::rank(const std::string& column) const {
        auto it = rank_.find(column);
        if (it == rank_.end()) {
            throw SpecificationError("Column not planned: " + column);
        }
        return it->second;
    }

    inline size_t ColumnPlanner::pairCount(const std::string& column) const {
        auto it = n_pairs_.find(column);
        if (it == n_pairs_.end()) {
            throw SpecificationError("Column not planned: " + column);
        }
        return it->second;
    }

    inline ColumnNames ColumnPlanner::order(ColumnNames columns) const {
        std::stable_sort(columns.begin(), columns.end(), [this](const std::string& a, const std::string& b) {
            return rank(a) < rank(b);
        });
        return columns;
    }

} // namespace copairs
