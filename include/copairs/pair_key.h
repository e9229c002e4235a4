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
 * @file pair_key.h
 * @brief Keys of a pair collection.
 *
 * A key is one of:
 *   - null       no sameby-all column was requested
 *   - scalar     the shared value of the single sameby-all column
 *   - composite  the shared values of several sameby-all columns, in the
 *                column order given by the caller
 */

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "definitions.h"
#include "value.h"

namespace copairs {

    class PairKey {
        ColumnNames         names_;
        std::vector<Value>  values_;

    public:
        PairKey() = default;
        PairKey(std::string column, Value value);
        PairKey(ColumnNames names, std::vector<Value> values);

        bool                        isNull() const          { return values_.empty(); }
        bool                        isComposite() const     { return values_.size() > 1; }
        size_t                      size() const            { return values_.size(); }
        const ColumnNames&          names() const           { return names_; }
        const std::vector<Value>&   values() const          { return values_; }

        /// Value of a scalar key.
        const Value&                value() const;

        /// Component of the key by column name.
        const Value&                operator[](const std::string& column) const;

        std::string                 toString() const;

        bool operator==(const PairKey& other) const;
        bool operator!=(const PairKey& other) const         { return !(*this == other); }
        bool operator<(const PairKey& other) const;
    };

    struct PairKeyHash {
        size_t operator()(const PairKey& key) const;
    };

    /// Pairs grouped by the values they share.
    using PairCollection = std::map<PairKey, std::vector<Pair>>;

    /// Total number of pairs over all keys.
    size_t totalPairs(const PairCollection& pairs);

    std::ostream& operator<<(std::ostream& os, const PairKey& key);

} // namespace copairs
