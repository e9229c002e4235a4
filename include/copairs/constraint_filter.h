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
 * @file constraint_filter.h
 * @brief Candidate filtering against sameby / diffby conditions.
 *
 * ConstraintFilter is a non-owning view over a matcher's table and reverse
 * indices. It works in two modes:
 *   - row mode:  filterDiffby() removes from a pool of candidates every row
 *                that would violate diffby when paired with a given row,
 *                using reverse-index set differences.
 *   - pair mode: filterPairs() keeps the pairs whose cell values satisfy a
 *                PairCondition over a set of columns.
 */

#include <cstdint>
#include <vector>

#include "constraint_spec.h"
#include "definitions.h"
#include "reverse_index.h"
#include "table.h"

namespace copairs {

    enum class PairCondition : uint8_t {
        ALL_SAME = 0,
        ANY_SAME = 1,
        ALL_DIFF = 2,
        ANY_DIFF = 3,
    };

    class ConstraintFilter {
        const Table*                        table_;
        const std::vector<ReverseIndex>*    indices_;   // one per table column, same order

        const ReverseIndex& indexOf(size_t col) const   { return (*indices_)[col]; }

    public:
        ConstraintFilter(const Table& table, const std::vector<ReverseIndex>& indices)
            : table_(&table)
            , indices_(&indices)
        {}

        /**
         * @brief Remove from @p pool the rows that may not be paired with @p id.
         *
         * diffby all: for each column where @p id is non-null, drop every row
         * sharing its value.
         * diffby any: drop the rows sharing @p id's value on every any-column
         * where @p id is non-null. If @p id is null on all of them, nothing is
         * dropped.
         * @param pool Sorted candidate rows.
         * @return Sorted surviving rows.
         */
        RowIds filterDiffby(RowId id, const Constraint& diffby, RowIds pool) const;

        /// True if the pair satisfies @p condition over @p columns.
        bool check(const Pair& pair, const std::vector<size_t>& columns, PairCondition condition) const;

        /// Pairs satisfying @p condition over @p columns, order preserved.
        std::vector<Pair> filterPairs(const std::vector<Pair>& pairs, const ColumnNames& columns, PairCondition condition) const;

        /// Pair-level form of the diffby-any rule of filterDiffby, relative to pair.first.
        bool differsFromFirst(const Pair& pair, const std::vector<size_t>& columns) const;
        std::vector<Pair> filterDiffbyAny(const std::vector<Pair>& pairs, const ColumnNames& columns) const;

        std::vector<size_t> columnIndices(const ColumnNames& columns) const;
    };

} // namespace copairs
