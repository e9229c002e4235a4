/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "constraint_filter.h"
#include "table.hpp"
#include "reverse_index.hpp"

#include <algorithm>
#include <iterator>

namespace copairs {

    inline RowIds ConstraintFilter::filterDiffby(RowId id, const Constraint& diffby, RowIds pool) const {
        RowIds scratch;

        for (const auto& name : diffby.all) {
            if (pool.empty()) {
                return pool;
            }
            const size_t col = table_->columnIndex(name);
            const Value& val = table_->at(id, col);
            if (isNull(val)) {
                continue;
            }
            const RowIds& same = indexOf(col).members(val);
            scratch.clear();
            std::set_difference(pool.begin(), pool.end(), same.begin(), same.end(), std::back_inserter(scratch));
            pool.swap(scratch);
        }

        if (!diffby.any.empty() && !pool.empty()) {
            // rows sharing id's value on every non-null any-column; null columns are skipped
            RowIds shared;
            bool first = true;
            for (const auto& name : diffby.any) {
                const size_t col = table_->columnIndex(name);
                const Value& val = table_->at(id, col);
                if (isNull(val)) {
                    continue;
                }
                const RowIds& same = indexOf(col).members(val);
                if (first) {
                    shared = same;
                    first = false;
                } else {
                    scratch.clear();
                    std::set_intersection(shared.begin(), shared.end(), same.begin(), same.end(), std::back_inserter(scratch));
                    shared.swap(scratch);
                }
                if (shared.empty()) {
                    break;
                }
            }
            if (first) {
                return pool;    // null on every any-column: nothing to compare against
            }
            scratch.clear();
            std::set_difference(pool.begin(), pool.end(), shared.begin(), shared.end(), std::back_inserter(scratch));
            pool.swap(scratch);
        }
        return pool;
    }

    inline bool ConstraintFilter::check(const Pair& pair, const std::vector<size_t>& columns, PairCondition condition) const {
        const bool same = (condition == PairCondition::ALL_SAME || condition == PairCondition::ANY_SAME);
        const bool all  = (condition == PairCondition::ALL_SAME || condition == PairCondition::ALL_DIFF);

        for (size_t col : columns) {
            const Value& a = table_->at(pair.first, col);
            const Value& b = table_->at(pair.second, col);
            const bool ok = same ? cellsEqual(a, b) : cellsDiffer(a, b);
            if (all && !ok) {
                return false;
            }
            if (!all && ok) {
                return true;
            }
        }
        // all: every column passed; any: none did (an empty any-group never passes)
        return all;
    }

    inline std::vector<Pair> ConstraintFilter::filterPairs(const std::vector<Pair>& pairs, const ColumnNames& columns, PairCondition condition) const {
        const std::vector<size_t> cols = columnIndices(columns);
        std::vector<Pair> out;
        out.reserve(pairs.size());
        std::copy_if(pairs.begin(), pairs.end(), std::back_inserter(out), [&](const Pair& p) {
            return check(p, cols, condition);
        });
        return out;
    }

    inline bool ConstraintFilter::differsFromFirst(const Pair& pair, const std::vector<size_t>& columns) const {
        bool compared = false;
        for (size_t col : columns) {
            const Value& a = table_->at(pair.first, col);
            if (isNull(a)) {
                continue;
            }
            compared = true;
            if (cellsDiffer(a, table_->at(pair.second, col))) {
                return true;
            }
        }
        return !compared;
    }

    inline std::vector<Pair> ConstraintFilter::filterDiffbyAny(const std::vector<Pair>& pairs, const ColumnNames& columns) const {
        const std::vector<size_t> cols = columnIndices(columns);
        std::vector<Pair> out;
        out.reserve(pairs.size());
        std::copy_if(pairs.begin(), pairs.end(), std::back_inserter(out), [&](const Pair& p) {
            return differsFromFirst(p, cols);
        });
        return out;
    }

    inline std::vector<size_t> ConstraintFilter::columnIndices(const ColumnNames& columns) const {
        std::vector<size_t> cols;
        cols.reserve(columns.size());
        for (const auto& name : columns) {
            cols.push_back(table_->columnIndex(name));
        }
        return cols;
    }

} // namespace copairs
