/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "pair_key.h"
#include "exceptions.h"

#include <functional>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace copairs {

    inline PairKey::PairKey(std::string column, Value value) {
        names_.push_back(std::move(column));
        values_.push_back(std::move(value));
    }

    inline PairKey::PairKey(ColumnNames names, std::vector<Value> values)
        : names_(std::move(names))
        , values_(std::move(values))
    {
        if (names_.size() != values_.size()) {
            throw std::invalid_argument("PairKey: " + std::to_string(names_.size()) + " names for " +
                                        std::to_string(values_.size()) + " values");
        }
    }

    inline const Value& PairKey::value() const {
        if (values_.size() != 1) {
            throw std::logic_error("PairKey::value() requires a scalar key, got " + toString());
        }
        return values_.front();
    }

    inline const Value& PairKey::operator[](const std::string& column) const {
        for (size_t i = 0; i < names_.size(); ++i) {
            if (names_[i] == column) {
                return values_[i];
            }
        }
        throw std::out_of_range("PairKey has no column '" + column + "'");
    }

    inline std::string PairKey::toString() const {
        if (isNull()) {
            return "None";
        }
        if (!isComposite()) {
            return copairs::toString(values_.front());
        }
        std::string out = "(";
        for (size_t i = 0; i < values_.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += names_[i] + "=" + copairs::toString(values_[i]);
        }
        out += ")";
        return out;
    }

    inline bool PairKey::operator==(const PairKey& other) const {
        return values_ == other.values_ && names_ == other.names_;
    }

    inline bool PairKey::operator<(const PairKey& other) const {
        if (values_ != other.values_) {
            return values_ < other.values_;
        }
        return names_ < other.names_;
    }

    inline size_t PairKeyHash::operator()(const PairKey& key) const {
        size_t seed = key.size();
        for (const auto& v : key.values()) {
            seed ^= std::hash<Value>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }

    inline size_t totalPairs(const PairCollection& pairs) {
        size_t n = 0;
        for (const auto& [key, list] : pairs) {
            n += list.size();
        }
        return n;
    }

    inline std::ostream& operator<<(std::ostream& os, const PairKey& key) {
        return os << key.toString();
    }

} // namespace copairs
