/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "reverse_index.h"
#include "random_source.hpp"

#include <iostream>
#include <utility>

namespace copairs {

    namespace detail {
        inline const RowIds& emptyRowIds() {
            static const RowIds empty;
            return empty;
        }
    }

    inline ReverseIndex::ReverseIndex(std::string column,
                                      const std::vector<Value>& values,
                                      std::optional<size_t> maxSize,
                                      RandomSource& rng)
        : column_(std::move(column))
    {
        for (RowId id = 0; id < values.size(); ++id) {
            if (isNull(values[id])) {
                continue;
            }
            groups_[values[id]].push_back(id);   // ids arrive ascending, groups stay sorted
        }

        // maxSize of 0 means no limit
        if (maxSize && *maxSize > 0) {
            for (auto& [value, rows] : groups_) {
                if (rows.size() <= *maxSize) {
                    continue;
                }
                std::cerr << "Warning: Sampling " << *maxSize << " out of " << rows.size()
                          << " rows for value '" << toString(value) << "' of column '" << column_ << "'" << std::endl;
                if (full_.empty()) {
                    full_ = groups_;
                }
                rows = rng.sampleWithoutReplacement(rows, *maxSize);
            }
        }

        for (const auto& [value, rows] : groups_) {
            const size_t n = rows.size();
            n_pairs_ += n * (n - 1) / 2;
        }
    }

    inline const RowIds& ReverseIndex::rows(const Value& value) const {
        auto it = groups_.find(value);
        return it == groups_.end() ? detail::emptyRowIds() : it->second;
    }

    inline const RowIds& ReverseIndex::members(const Value& value) const {
        if (full_.empty()) {
            return rows(value);
        }
        auto it = full_.find(value);
        return it == full_.end() ? detail::emptyRowIds() : it->second;
    }

} // namespace copairs
