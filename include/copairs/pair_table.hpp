/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "pair_table.h"
#include "constraint_spec.hpp"
#include "exceptions.h"
#include "pair_key.hpp"
#include "table.hpp"

namespace copairs {

    inline Table flattenPairs(const PairCollection& pairs, const ColumnSpec& sameby) {
        const size_t total = totalPairs(pairs);
        if (total == 0) {
            throw EmptyPairsError("no pairs found");
        }

        ColumnNames keyColumns = normalizeSpec(sameby, "sameby").all;
        const bool nullKey = keyColumns.empty();
        if (nullKey) {
            keyColumns.push_back("key");
        }

        std::vector<std::vector<Value>> keyCells(keyColumns.size());
        for (auto& cells : keyCells) {
            cells.reserve(total);
        }
        std::vector<int64_t> ix1;
        std::vector<int64_t> ix2;
        ix1.reserve(total);
        ix2.reserve(total);

        for (const auto& [key, list] : pairs) {
            for (size_t c = 0; c < keyColumns.size(); ++c) {
                const Value cell = (nullKey || key.isNull()) ? Value{} : key[keyColumns[c]];
                keyCells[c].insert(keyCells[c].end(), list.size(), cell);
            }
            for (const Pair& p : list) {
                ix1.push_back(static_cast<int64_t>(p.first));
                ix2.push_back(static_cast<int64_t>(p.second));
            }
        }

        Table table;
        for (size_t c = 0; c < keyColumns.size(); ++c) {
            table.addColumn(keyColumns[c], std::move(keyCells[c]));
        }
        table.addColumn("ix1", ix1);
        table.addColumn("ix2", ix2);
        return table;
    }

} // namespace copairs
