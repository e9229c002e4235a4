/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "matcher_multilabel.h"
#include "matcher.hpp"

#include <algorithm>
#include <iostream>
#include <set>

namespace copairs {

    namespace detail {

        inline ColumnNames withColumn(ColumnNames columns, const std::string& column) {
            if (std::find(columns.begin(), columns.end(), column) == columns.end()) {
                columns.push_back(column);
            }
            return columns;
        }

        inline bool removeColumn(ColumnNames& columns, const std::string& column) {
            auto it = std::find(columns.begin(), columns.end(), column);
            if (it == columns.end()) {
                return false;
            }
            columns.erase(it);
            return true;
        }

    } // namespace detail

    inline Table MatcherMultilabel::explodeTable(const Table& table,
                                                 const ColumnNames& columns,
                                                 const std::string& multilabelColumn,
                                                 std::vector<RowId>& original) {
        return table.select(detail::withColumn(columns, multilabelColumn)).explode(multilabelColumn, original);
    }

    inline MatcherMultilabel::MatcherMultilabel(const Table& table,
                                                const ColumnNames& columns,
                                                const std::string& multilabelColumn,
                                                uint64_t seed,
                                                std::optional<size_t> maxSize)
        : multilabel_column_(multilabelColumn)
        , size_(table.rowCount())
        , matcher_(explodeTable(table, columns, multilabelColumn, original_),
                   detail::withColumn(columns, multilabelColumn),
                   seed,
                   maxSize)
    {
        const size_t col = table.columnIndex(multilabelColumn);
        label_sets_.reserve(size_);
        for (RowId row = 0; row < size_; ++row) {
            LabelSet labels;
            for (const auto& label : table.labels(row, col)) {
                if (!isNull(label)) {
                    labels.insert(label);
                }
            }
            label_sets_.push_back(std::move(labels));
        }
    }

    inline bool MatcherMultilabel::disjoint(RowId a, RowId b) const {
        const LabelSet& small = label_sets_[a].size() <= label_sets_[b].size() ? label_sets_[a] : label_sets_[b];
        const LabelSet& large = &small == &label_sets_[a] ? label_sets_[b] : label_sets_[a];
        for (const auto& label : small) {
            if (large.count(label)) {
                return false;
            }
        }
        return true;
    }

    inline Pair MatcherMultilabel::toOriginal(const Pair& exploded) const {
        return {original_[exploded.first], original_[exploded.second]};
    }

    // ── Exhaustive enumeration ──────────────────────────────────────────

    inline PairCollection MatcherMultilabel::getAllPairs(const ColumnSpec& sameby, const ColumnSpec& diffby) const {
        Constraint same = normalizeSpec(sameby, "sameby");
        Constraint diff = normalizeSpec(diffby, "diffby");
        validateQuery(same, diff, matcher_.columns());

        if (std::find(diff.any.begin(), diff.any.end(), multilabel_column_) != diff.any.end()) {
            throw SpecificationError("diffby: multilabel column '" + multilabel_column_ +
                                     "' is only supported as an all column");
        }

        // label sets must be disjoint, not just one exploded label different: filtered after mapping
        const bool diffbyMulti = detail::removeColumn(diff.all, multilabel_column_);
        if (same.empty() && diff.empty() && diffbyMulti) {
            return onlyDiffbyMulti();
        }

        const PairCollection exploded = matcher_.getAllPairs(ColumnGroup{same.all, same.any},
                                                             ColumnGroup{diff.all, diff.any});
        PairCollection out;
        for (const auto& [key, list] : exploded) {
            std::vector<Pair> mapped;
            std::set<Pair> seen;
            for (const Pair& p : list) {
                const Pair q = detail::canonical(toOriginal(p));
                if (q.first == q.second) {
                    continue;
                }
                if (diffbyMulti && !disjoint(q.first, q.second)) {
                    continue;
                }
                if (seen.insert(q).second) {
                    mapped.push_back(q);
                }
            }
            if (!mapped.empty()) {
                out.emplace(key, std::move(mapped));
            }
        }
        return out;
    }

    inline PairCollection MatcherMultilabel::onlyDiffbyMulti() const {
        // every row pair with disjoint label sets, taken from the full sets so maxSize cannot drop an overlap
        std::vector<Pair> pairs;
        for (RowId i = 0; i < size_; ++i) {
            for (RowId j = i + 1; j < size_; ++j) {
                if (disjoint(i, j)) {
                    pairs.emplace_back(i, j);
                }
            }
        }

        PairCollection out;
        if (!pairs.empty()) {
            out.emplace(PairKey{}, std::move(pairs));
        }
        return out;
    }

    // ── Null sampling ───────────────────────────────────────────────────

    inline Pair MatcherMultilabel::sampleValidated(const Constraint& diffby, bool diffbyMulti, size_t nTries) {
        for (size_t attempt = 0; attempt < nTries; ++attempt) {
            try {
                const Pair p = toOriginal(matcher_.nullSample(diffby));
                if (p.first == p.second) {
                    throw UnpairedError("labels of row " + std::to_string(p.first) + " paired with each other");
                }
                if (diffbyMulti && !disjoint(p.first, p.second)) {
                    throw UnpairedError("rows " + std::to_string(p.first) + " and " + std::to_string(p.second) +
                                        " share a label");
                }
                return p;
            } catch (const UnpairedError& ex) {
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "Warning: null sample attempt " << attempt + 1 << " failed: " << ex.what() << std::endl;
                }
            }
        }
        throw SamplingExhaustedError("Number of tries exhausted (" + std::to_string(nTries) +
                                     "). Could not find a valid pair");
    }

    inline Pair MatcherMultilabel::sampleNullPair(const ColumnSpec& diffby, size_t nTries) {
        const Constraint diff = normalizeSpec(diffby, "diffby");
        validateDiffby(diff, matcher_.columns());
        const bool diffbyMulti = std::find(diff.all.begin(), diff.all.end(), multilabel_column_) != diff.all.end();
        return sampleValidated(diff, diffbyMulti, nTries);
    }

    inline std::vector<Pair> MatcherMultilabel::getNullPairs(const ColumnSpec& diffby, size_t size, size_t nTries) {
        const Constraint diff = normalizeSpec(diffby, "diffby");
        validateDiffby(diff, matcher_.columns());
        const bool diffbyMulti = std::find(diff.all.begin(), diff.all.end(), multilabel_column_) != diff.all.end();

        std::vector<Pair> pairs;
        pairs.reserve(size);
        for (size_t i = 0; i < size; ++i) {
            pairs.push_back(sampleValidated(diff, diffbyMulti, nTries));
        }
        return pairs;
    }

} // namespace copairs
