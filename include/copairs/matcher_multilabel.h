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
 * @file matcher_multilabel.h
 * @brief Pair matching over a column holding several labels per row.
 *
 * The multilabel column is exploded (one row per label) and a Matcher runs
 * on the exploded table. Results are mapped back to the original rows:
 *   - sameby on the multilabel column: the two rows share at least one label
 *   - diffby on the multilabel column: the label sets are disjoint
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "constraint_spec.h"
#include "definitions.h"
#include "matcher.h"
#include "pair_key.h"
#include "table.h"

namespace copairs {

    class MatcherMultilabel {
        using LabelSet = std::set<Value>;

        std::string             multilabel_column_;
        size_t                  size_;              // rows of the original table
        std::vector<LabelSet>   label_sets_;        // per original row, nulls excluded
        std::vector<RowId>      original_;          // exploded row -> original row
        Matcher                 matcher_;

        static Table explodeTable(const Table& table,
                                  const ColumnNames& columns,
                                  const std::string& multilabelColumn,
                                  std::vector<RowId>& original);

        bool                    disjoint(RowId a, RowId b) const;
        Pair                    toOriginal(const Pair& exploded) const;
        PairCollection          onlyDiffbyMulti() const;
        Pair                    sampleValidated(const Constraint& diffby, bool diffbyMulti, size_t nTries);

    public:
        /**
         * @param table             Source table; @p multilabelColumn must be a list column.
         * @param columns           Columns that queries may reference (the multilabel column is added if absent).
         * @param multilabelColumn  Name of the list column.
         * @param seed              Seed of the random source.
         * @param maxSize           Optional cap on the rows kept per value group.
         */
        MatcherMultilabel(const Table& table,
                          const ColumnNames& columns,
                          const std::string& multilabelColumn,
                          uint64_t seed,
                          std::optional<size_t> maxSize = std::nullopt);

        const std::string&          multilabelColumn() const    { return multilabel_column_; }
        size_t                      rowCount() const            { return size_; }
        const std::vector<RowId>&   originalIndex() const       { return original_; }
        const Matcher&              matcher() const             { return matcher_; }

        /// Pairs of original rows; see the file comment for multilabel semantics.
        PairCollection              getAllPairs(const ColumnSpec& sameby, const ColumnSpec& diffby) const;

        Pair                        sampleNullPair(const ColumnSpec& diffby, size_t nTries = DEFAULT_N_TRIES);
        std::vector<Pair>           getNullPairs(const ColumnSpec& diffby, size_t size, size_t nTries = DEFAULT_N_TRIES);
    };

} // namespace copairs
