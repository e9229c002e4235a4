/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "matcher.h"
#include "column_planner.hpp"
#include "constraint_filter.hpp"
#include "constraint_spec.hpp"
#include "exceptions.h"
#include "pair_key.hpp"
#include "random_source.hpp"
#include "reverse_index.hpp"
#include "table.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>
#include <utility>

namespace copairs {

    namespace detail {

        inline Pair canonical(const Pair& p) {
            return p.first < p.second ? p : Pair{p.second, p.first};
        }

        /// Canonicalize every pair to (min, max), then sort and drop duplicates.
        inline void canonicalizeSorted(std::vector<Pair>& pairs) {
            for (auto& p : pairs) {
                p = canonical(p);
            }
            std::sort(pairs.begin(), pairs.end());
            pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());
        }

        /// Keep the pairs satisfying the condition in every key, dropping keys left empty.
        inline void filterCollection(PairCollection& pairs,
                                     const ConstraintFilter& filter,
                                     const ColumnNames& columns,
                                     PairCondition condition) {
            for (auto it = pairs.begin(); it != pairs.end(); ) {
                it->second = filter.filterPairs(it->second, columns, condition);
                if (it->second.empty()) {
                    it = pairs.erase(it);
                } else {
                    ++it;
                }
            }
        }

    } // namespace detail

    // ── Construction ────────────────────────────────────────────────────

    inline Matcher::Matcher(const Table& table,
                            const ColumnNames& columns,
                            uint64_t seed,
                            std::optional<size_t> maxSize)
        : table_(table.select(columns))
        , rng_(seed)
    {
        indices_.reserve(table_.columnCount());
        for (size_t col = 0; col < table_.columnCount(); ++col) {
            if (table_.isListColumn(col)) {
                throw TableError("Column '" + table_.columnName(col) +
                                 "' holds label lists; use MatcherMultilabel for it");
            }
            indices_.emplace_back(table_.columnName(col), table_.column(col), maxSize, rng_);
        }
        planner_ = ColumnPlanner(indices_);

        all_rows_.resize(table_.rowCount());
        std::iota(all_rows_.begin(), all_rows_.end(), RowId{0});
    }

    inline const ReverseIndex& Matcher::reverseIndex(const std::string& column) const {
        return indices_[table_.columnIndex(column)];
    }

    // ── Exhaustive enumeration ──────────────────────────────────────────

    inline PairCollection Matcher::getAllPairs(const ColumnSpec& sameby, const ColumnSpec& diffby) const {
        const Constraint same = normalizeSpec(sameby, "sameby");
        const Constraint diff = normalizeSpec(diffby, "diffby");
        validateQuery(same, diff, columns());

        if (same.empty()) {
            std::vector<Pair> pairs;
            if (diff.any.empty()) {
                pairs = onlyDiffbyAll(diff.all);
            } else if (diff.all.empty()) {
                pairs = onlyDiffbyAny(diff.any);
            } else {
                pairs = onlyDiffbyAllAny(diff.all, diff.any);
            }
            PairCollection out;
            if (!pairs.empty()) {
                out.emplace(PairKey{}, std::move(pairs));
            }
            return out;
        }

        PairCollection pairs;
        if (same.all.size() == 1) {
            pairs = pairsSingle(same.all.front(), diff);
        } else if (same.all.size() > 1) {
            pairs = pairsComposite(same.all, diff);
        }

        if (!same.any.empty()) {
            if (same.all.empty()) {
                pairs = pairsSamebyAny(same.any, diff);
            } else {
                // every pair is checked, not one representative pair per key
                detail::filterCollection(pairs, filter(), same.any, PairCondition::ANY_SAME);
            }
        }

        // diffby-any is applied relative to the first row during enumeration;
        // verify it on the final pairs, whatever key they ended up under
        if (!diff.any.empty()) {
            const ConstraintFilter f = filter();
            for (auto it = pairs.begin(); it != pairs.end(); ) {
                it->second = f.filterDiffbyAny(it->second, diff.any);
                if (it->second.empty()) {
                    it = pairs.erase(it);
                } else {
                    ++it;
                }
            }
        }
        return pairs;
    }

    inline PairCollection Matcher::pairsSingle(const std::string& column, const Constraint& diffby) const {
        const ReverseIndex& index = reverseIndex(column);
        const ConstraintFilter f = filter();

        PairCollection out;
        for (const auto& [value, rows] : index.groups()) {
            std::vector<Pair> list;
            // rows before i were already used as id1, so only later rows are candidates
            for (size_t i = 0; i + 1 < rows.size(); ++i) {
                RowIds pool(rows.begin() + static_cast<std::ptrdiff_t>(i) + 1, rows.end());
                pool = f.filterDiffby(rows[i], diffby, std::move(pool));
                for (RowId id2 : pool) {
                    list.emplace_back(rows[i], id2);
                }
            }
            if (!list.empty()) {
                out.emplace(PairKey(column, value), std::move(list));
            }
        }
        return out;
    }

    inline PairCollection Matcher::pairsComposite(const ColumnNames& sameby, const Constraint& diffby) const {
        const ColumnNames ordered = planner_.order(sameby);
        const std::string& lead = ordered.front();
        const ConstraintFilter f = filter();
        const std::vector<size_t> rest = f.columnIndices(ColumnNames(ordered.begin() + 1, ordered.end()));

        // key components in the caller's column order
        std::vector<size_t> keyCols;
        keyCols.reserve(sameby.size());
        for (const auto& name : sameby) {
            keyCols.push_back(table_.columnIndex(name));
        }
        const size_t leadCol = table_.columnIndex(lead);

        PairCollection out;
        for (const auto& [key, list] : pairsSingle(lead, diffby)) {
            for (const Pair& p : list) {
                if (!f.check(p, rest, PairCondition::ALL_SAME)) {
                    continue;
                }
                std::vector<Value> values;
                values.reserve(keyCols.size());
                for (size_t col : keyCols) {
                    values.push_back(col == leadCol ? key.value() : table_.at(p.first, col));
                }
                out[PairKey(sameby, std::move(values))].push_back(p);
            }
        }
        return out;
    }

    inline PairCollection Matcher::pairsSamebyAny(const ColumnNames& samebyAny, const Constraint& diffby) const {
        std::vector<Pair> merged;
        for (const auto& column : samebyAny) {
            for (const auto& [key, list] : pairsSingle(column, diffby)) {
                merged.insert(merged.end(), list.begin(), list.end());
            }
        }
        detail::canonicalizeSorted(merged);

        PairCollection out;
        if (!merged.empty()) {
            out.emplace(PairKey{}, std::move(merged));
        }
        return out;
    }

    inline std::vector<Pair> Matcher::onlyDiffbyAll(const ColumnNames& diffbyAll) const {
        const ColumnNames ordered = planner_.order(diffbyAll);

        // cross product of the most selective column, pruned by the others
        std::vector<Pair> pairs = fullPairs(ordered.front());
        if (ordered.size() > 1) {
            pairs = filter().filterPairs(pairs, ColumnNames(ordered.begin() + 1, ordered.end()), PairCondition::ALL_DIFF);
        }
        detail::canonicalizeSorted(pairs);
        return pairs;
    }

    inline std::vector<Pair> Matcher::onlyDiffbyAny(const ColumnNames& diffbyAny) const {
        std::vector<Pair> pairs;
        for (const auto& column : planner_.order(diffbyAny)) {
            std::vector<Pair> full = fullPairs(column);
            pairs.insert(pairs.end(), full.begin(), full.end());
        }
        detail::canonicalizeSorted(pairs);
        return pairs;
    }

    inline std::vector<Pair> Matcher::onlyDiffbyAllAny(const ColumnNames& diffbyAll, const ColumnNames& diffbyAny) const {
        return filter().filterPairs(onlyDiffbyAll(diffbyAll), diffbyAny, PairCondition::ANY_DIFF);
    }

    inline std::vector<Pair> Matcher::fullPairs(const std::string& column) const {
        const ReverseIndex& index = reverseIndex(column);

        std::vector<const RowIds*> groups;
        groups.reserve(index.groupCount());
        size_t grouped = 0;
        for (const auto& [value, rows] : index.groups()) {
            groups.push_back(&rows);
            grouped += rows.size();
        }

        size_t expected = 0;
        for (const RowIds* g : groups) {
            expected += g->size() * (grouped - g->size());
        }

        std::vector<Pair> pairs;
        pairs.reserve(expected / 2);
        for (size_t a = 0; a < groups.size(); ++a) {
            for (size_t b = a + 1; b < groups.size(); ++b) {
                for (RowId x : *groups[a]) {
                    for (RowId y : *groups[b]) {
                        pairs.emplace_back(x, y);
                    }
                }
            }
        }
        return pairs;
    }

    // ── Null sampling ───────────────────────────────────────────────────

    inline Pair Matcher::nullSample(const Constraint& diffby) {
        if (all_rows_.size() < 2) {
            throw UnpairedError("table has fewer than two rows");
        }
        const RowId id1 = rng_.integers(0, all_rows_.size() - 1);

        RowIds pool;
        pool.reserve(all_rows_.size() - 1);
        for (RowId id : all_rows_) {
            if (id != id1) {
                pool.push_back(id);
            }
        }
        pool = filter().filterDiffby(id1, diffby, std::move(pool));

        if (pool.empty()) {
            throw UnpairedError(std::to_string(id1) + " has no pairs");
        }
        return {id1, rng_.choice(pool)};
    }

    inline Pair Matcher::sampleValidated(const Constraint& diffby, size_t nTries) {
        for (size_t attempt = 0; attempt < nTries; ++attempt) {
            try {
                return nullSample(diffby);
            } catch (const UnpairedError& ex) {
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "Warning: null sample attempt " << attempt + 1 << " failed: " << ex.what() << std::endl;
                }
            }
        }
        throw SamplingExhaustedError("Number of tries exhausted (" + std::to_string(nTries) +
                                     "). Could not find a valid pair");
    }

    inline Pair Matcher::sampleNullPair(const ColumnSpec& diffby, size_t nTries) {
        const Constraint diff = normalizeSpec(diffby, "diffby");
        validateDiffby(diff, columns());
        return sampleValidated(diff, nTries);
    }

    inline std::vector<Pair> Matcher::getNullPairs(const ColumnSpec& diffby, size_t size, size_t nTries) {
        const Constraint diff = normalizeSpec(diffby, "diffby");
        validateDiffby(diff, columns());

        std::vector<Pair> pairs;
        pairs.reserve(size);
        for (size_t i = 0; i < size; ++i) {
            pairs.push_back(sampleValidated(diff, nTries));
        }
        return pairs;
    }

} // namespace copairs
