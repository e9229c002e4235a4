/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the copairs library */
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace copairs {

    // Version information
    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 5;
    constexpr int VERSION_PATCH = 1;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // Diagnostics
    constexpr bool DEBUG_OUTPUTS   = false;   // chatty stderr output (warnings that are not always relevant)
    constexpr bool RANGE_CHECKING  = true;    // bounds-checked column and row access

    // Sampling
    constexpr size_t RANDOM_BATCH_SIZE = 1000000; // uniforms generated per refill of the random source
    constexpr size_t DEFAULT_N_TRIES   = 5;       // attempts per null pair before giving up

    // Row identifiers are dense, 0-based positions in the matcher's table
    using RowId = size_t;

    // A pair of distinct rows. Order is enumeration order; (a,b) and (b,a) never both appear.
    using Pair = std::pair<RowId, RowId>;

    using RowIds = std::vector<RowId>;    // always kept sorted ascending
    using ColumnNames = std::vector<std::string>;

} // namespace copairs
