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
 * @file column_planner.h
 * @brief Orders columns by the number of same-value pairs they induce.
 *
 * Enumeration starts from the most selective column (fewest candidate
 * pairs) and prunes with the others. Ties keep the table's column order.
 */

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "definitions.h"
#include "reverse_index.h"

namespace copairs {

    class ColumnPlanner {
        std::unordered_map<std::string, size_t> rank_;
        std::unordered_map<std::string, size_t> n_pairs_;

    public:
        ColumnPlanner() = default;
        explicit ColumnPlanner(const std::vector<ReverseIndex>& indices);

        size_t          rank(const std::string& column) const;
        size_t          pairCount(const std::string& column) const;

        /// Columns sorted by ascending pair count.
        ColumnNames     order(ColumnNames columns) const;
    };

} // namespace copairs
