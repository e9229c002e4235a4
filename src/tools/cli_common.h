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
 * @file cli_common.h
 * @brief Shared utilities for copairs CLI tools
 *
 * Provides standardised helpers used across the CLI tools:
 *   - valueKindStr()        ValueKind to human-readable string
 *   - columnKindStr()       kind of the first non-null cell of a column, or "list"
 *   - printTableSummary()   tabular column dump to any ostream
 *   - splitNames()          "a,b,c" to ColumnNames
 *   - makeColumnSpec()      all/any name lists to a ColumnSpec
 *   - parseCount()          positive integer option value
 */

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <copairs/copairs.h>

namespace copairs_cli {

// ── valueKindStr ───────────────────────────────────────────────────

/// Convert ValueKind to human-readable string.
inline std::string valueKindStr(copairs::ValueKind kind) {
    switch (kind) {
        case copairs::ValueKind::NONE:   return "null";
        case copairs::ValueKind::BOOL:   return "bool";
        case copairs::ValueKind::INT64:  return "int64";
        case copairs::ValueKind::DOUBLE: return "double";
        case copairs::ValueKind::STRING: return "string";
        default:                         return "unknown";
    }
}

inline std::string columnKindStr(const copairs::Table& table, size_t col) {
    if (table.isListColumn(col)) {
        return "list";
    }
    for (const auto& cell : table.column(col)) {
        if (!copairs::isNull(cell)) {
            return valueKindStr(copairs::kindOf(cell));
        }
    }
    return "null";
}

// ── printTableSummary ──────────────────────────────────────────────

/// Print vertical column table: kind histogram + full column listing.
inline void printTableSummary(const std::string& label,
                              const copairs::Table& table,
                              std::ostream& os = std::cerr) {
    const size_t n = table.columnCount();
    if (n == 0) {
        os << label << ": (empty)\n";
        return;
    }

    // Build kind histogram
    std::map<std::string, size_t> kind_counts;
    size_t max_name_len = 4;   // minimum width for "Name" header
    size_t max_kind_len = 4;   // minimum width for "Kind" header
    for (size_t i = 0; i < n; ++i) {
        const std::string& name = table.columnName(i);
        const std::string kind = columnKindStr(table, i);
        kind_counts[kind]++;
        if (name.size() > max_name_len) max_name_len = name.size();
        if (kind.size() > max_kind_len) max_kind_len = kind.size();
    }

    os << label << " (" << n << " columns, " << table.rowCount() << " rows)  [ ";
    bool first = true;
    for (const auto& [kname, cnt] : kind_counts) {
        if (!first) os << ", ";
        os << cnt << "\xc3\x97" << kname;   // UTF-8 ×
        first = false;
    }
    os << " ]\n";

    size_t idx_width = 1;
    for (size_t v = n - 1; v >= 10; v /= 10) ++idx_width;
    if (idx_width < 3) idx_width = 3;

    os << "  " << std::right << std::setw(static_cast<int>(idx_width)) << "Idx"
       << "  " << std::left  << std::setw(static_cast<int>(max_name_len)) << "Name"
       << "  " << std::left  << std::setw(static_cast<int>(max_kind_len)) << "Kind"
       << "\n";

    os << "  " << std::string(idx_width, '-')
       << "  " << std::string(max_name_len, '-')
       << "  " << std::string(max_kind_len, '-')
       << "\n";

    for (size_t i = 0; i < n; ++i) {
        os << "  " << std::right << std::setw(static_cast<int>(idx_width)) << i
           << "  " << std::left  << std::setw(static_cast<int>(max_name_len)) << table.columnName(i)
           << "  " << std::left  << std::setw(static_cast<int>(max_kind_len)) << columnKindStr(table, i)
           << "\n";
    }
}

// ── Option parsing helpers ────────────────────────────────────────

/// Split a comma-separated column list. Empty entries are dropped.
inline copairs::ColumnNames splitNames(const std::string& list) {
    copairs::ColumnNames names;
    size_t start = 0;
    for (size_t i = 0; i <= list.size(); ++i) {
        if (i == list.size() || list[i] == ',') {
            if (i > start) {
                names.push_back(list.substr(start, i - start));
            }
            start = i + 1;
        }
    }
    return names;
}

inline copairs::ColumnSpec makeColumnSpec(const copairs::ColumnNames& all, const copairs::ColumnNames& any) {
    if (any.empty()) {
        return all;
    }
    return copairs::ColumnGroup{all, any};
}

/// Parse a positive integer option value.  Throws std::runtime_error on invalid value.
inline size_t parseCount(const std::string& option, const std::string& text) {
    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + text);
    }
    if (pos != text.size() || value == 0 || text.front() == '-') {
        throw std::runtime_error("Invalid value for " + option + ": " + text);
    }
    return static_cast<size_t>(value);
}

} // namespace copairs_cli
