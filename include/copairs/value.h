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
 * @file value.h
 * @brief Cell value model shared by tables, reverse indices and pair keys.
 *
 * A cell holds one of bool, int64, double or string, or is null
 * (std::monostate). A null is never "same" as anything (it forms no
 * reverse-index group) and never blocks a "different" requirement.
 */

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

namespace copairs {

    using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

    enum class ValueKind : uint8_t {
        NONE   = 0,
        BOOL   = 1,
        INT64  = 2,
        DOUBLE = 3,
        STRING = 4
    };

    inline ValueKind kindOf(const Value& value) {
        return static_cast<ValueKind>(value.index());
    }

    inline bool isNull(const Value& value) {
        return std::holds_alternative<std::monostate>(value);
    }

    /// NaN carries the meaning of a missing value, same as an empty cell.
    inline Value normalizeValue(Value value) {
        if (const double* d = std::get_if<double>(&value)) {
            if (std::isnan(*d)) {
                return std::monostate{};
            }
        }
        return value;
    }

    /// Matching equality: false whenever either side is null.
    inline bool cellsEqual(const Value& a, const Value& b) {
        if (isNull(a) || isNull(b)) {
            return false;
        }
        return a == b;
    }

    /// Matching inequality: a null imposes no constraint, so it always differs.
    inline bool cellsDiffer(const Value& a, const Value& b) {
        if (isNull(a) || isNull(b)) {
            return true;
        }
        return a != b;
    }

    inline std::string toString(const Value& value) {
        return std::visit([](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::string{};
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                std::ostringstream oss;
                oss << std::setprecision(17) << v;
                return oss.str();
            } else {
                return v;
            }
        }, value);
    }

    inline std::ostream& operator<<(std::ostream& os, const Value& value) {
        if (isNull(value)) {
            return os << "<null>";
        }
        return os << toString(value);
    }

} // namespace copairs
