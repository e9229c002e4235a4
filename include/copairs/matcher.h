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
 * @file matcher.h
 * @brief Pair-matching engine: exhaustive enumeration and null-pair sampling.
 *
 * A Matcher is built once from a snapshot of a table restricted to the
 * columns of interest. Construction builds one reverse index per column and
 * ranks the columns by selectivity; every query reuses them.
 *
 * Usage:
 *     copairs::Matcher matcher(table, {"compound", "plate"}, 42);
 *     auto pairs = matcher.getAllPairs("compound", "plate");
 *     for (const auto& [key, list] : pairs) {
 *         for (const auto& [id1, id2] : list) { ... }
 *     }
 *     auto [a, b] = matcher.sampleNullPair("compound");
 *
 * Only sampling touches mutable state (the random source). Concurrent calls
 * on one Matcher need external serialization.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "column_planner.h"
#include "constraint_filter.h"
#include "constraint_spec.h"
#include "definitions.h"
#include "pair_key.h"
#include "random_source.h"
#include "reverse_index.h"
#include "table.h"

namespace copairs {

    class MatcherMultilabel;

    class Matcher {
        Table                       table_;     // selected columns only
        std::vector<ReverseIndex>   indices_;   // one per column of table_
        ColumnPlanner               planner_;
        RandomSource                rng_;
        RowIds                      all_rows_;  // 0..N-1

        friend class MatcherMultilabel;

    public:
        /**
         * @param table    Source table; only @p columns are kept.
         * @param columns  Columns that queries may reference.
         * @param seed     Seed of the random source.
         * @param maxSize  Optional cap on the rows kept per value group (0 = no cap).
         * @throws TableError for unknown or multilabel columns.
         */
        Matcher(const Table& table,
                const ColumnNames& columns,
                uint64_t seed,
                std::optional<size_t> maxSize = std::nullopt);

        // Non-copyable, movable
        Matcher(const Matcher&) = delete;
        Matcher& operator=(const Matcher&) = delete;
        Matcher(Matcher&&) noexcept = default;
        Matcher& operator=(Matcher&&) noexcept = default;

        const Table&            table() const           { return table_; }
        const ColumnNames&      columns() const         { return table_.columnNames(); }
        size_t                  rowCount() const        { return table_.rowCount(); }
        const ColumnPlanner&    planner() const         { return planner_; }
        const ReverseIndex&     reverseIndex(const std::string& column) const;

        /**
         * @brief Every pair satisfying the sameby and diffby constraints.
         *
         * Keys are null when no sameby-all column is given, the shared value
         * for a single sameby-all column and a composite key otherwise.
         * @throws SpecificationError on malformed specifications.
         */
        PairCollection          getAllPairs(const ColumnSpec& sameby, const ColumnSpec& diffby) const;

        /**
         * @brief Random pair of rows satisfying diffby.
         *
         * Each attempt draws a first row, filters the partners and draws the
         * second row among them. A row without partners costs one attempt.
         * @throws SamplingExhaustedError after @p nTries failed attempts.
         */
        Pair                    sampleNullPair(const ColumnSpec& diffby, size_t nTries = DEFAULT_N_TRIES);

        /// @p size null pairs, drawn one after the other.
        std::vector<Pair>       getNullPairs(const ColumnSpec& diffby, size_t size, size_t nTries = DEFAULT_N_TRIES);

    private:
        ConstraintFilter        filter() const          { return ConstraintFilter(table_, indices_); }

        Pair                    nullSample(const Constraint& diffby);
        Pair                    sampleValidated(const Constraint& diffby, size_t nTries);

        PairCollection          pairsSingle(const std::string& column, const Constraint& diffby) const;
        PairCollection          pairsComposite(const ColumnNames& sameby, const Constraint& diffby) const;
        PairCollection          pairsSamebyAny(const ColumnNames& samebyAny, const Constraint& diffby) const;

        std::vector<Pair>       onlyDiffbyAll(const ColumnNames& diffbyAll) const;
        std::vector<Pair>       onlyDiffbyAny(const ColumnNames& diffbyAny) const;
        std::vector<Pair>       onlyDiffbyAllAny(const ColumnNames& diffbyAll, const ColumnNames& diffbyAny) const;

        /// Cross pairs between every two distinct value groups of a column.
        /// Rows null in the column belong to no group and take no part.
        std::vector<Pair>       fullPairs(const std::string& column) const;
    };

} // namespace copairs
