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
 * @file pair_table.h
 * @brief Flatten a PairCollection into a Table with one row per pair.
 *
 * Columns: one per sameby-all column holding the key component (a single
 * "key" column of nulls when the query had no sameby-all column), followed
 * by "ix1" and "ix2".
 */

#include "constraint_spec.h"
#include "pair_key.h"
#include "table.h"

namespace copairs {

    /// @throws EmptyPairsError when @p pairs holds no pair.
    Table flattenPairs(const PairCollection& pairs, const ColumnSpec& sameby);

} // namespace copairs
