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
 * @file reverse_index.h
 * @brief Per-column mapping from value to the rows holding it.
 *
 * Groups are keyed in value order and each group is a sorted vector of row
 * ids, so set operations over groups are plain merges. Null cells belong to
 * no group.
 *
 * With a maximum group size, larger groups are replaced by a uniform
 * subsample (without replacement) for enumeration. The complete membership
 * stays available through members() so that diffby filtering still sees
 * every row sharing a value.
 */

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "definitions.h"
#include "random_source.h"
#include "value.h"

namespace copairs {

    class ReverseIndex {
    public:
        using Groups = std::map<Value, RowIds>;

    private:
        std::string             column_;
        Groups                  groups_;        // possibly subsampled, drives enumeration
        Groups                  full_;          // complete groups, only filled when subsampling happened
        size_t                  n_pairs_ = 0;   // sum of C(|group|, 2) over groups_

    public:
        ReverseIndex() = default;
        ReverseIndex(std::string column,
                     const std::vector<Value>& values,
                     std::optional<size_t> maxSize,
                     RandomSource& rng);

        const std::string&      column() const          { return column_; }
        const Groups&           groups() const          { return groups_; }
        size_t                  groupCount() const      { return groups_.size(); }
        bool                    isClipped() const       { return !full_.empty(); }

        /// Number of same-value pairs this column induces on its own.
        size_t                  pairCount() const       { return n_pairs_; }

        /// Enumeration group of a value; empty for null or unseen values.
        const RowIds&           rows(const Value& value) const;

        /// Every row holding the value, regardless of subsampling.
        const RowIds&           members(const Value& value) const;
    };

} // namespace copairs
