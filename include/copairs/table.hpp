/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "table.h"
#include "exceptions.h"

#include <utility>

namespace copairs {

    inline void Table::checkNewColumn(const std::string& name, size_t rows) const {
        if (name.empty()) {
            throw TableError("Column name must not be empty");
        }
        if (hasColumn(name)) {
            throw TableError("Duplicate column name: " + name);
        }
        if (!column_names_.empty() && rows != row_count_) {
            throw TableError("Column '" + name + "' has " + std::to_string(rows) +
                             " rows, expected " + std::to_string(row_count_));
        }
    }

    inline void Table::addColumn(const std::string& name, std::vector<Value> values) {
        checkNewColumn(name, values.size());
        for (auto& v : values) {
            v = normalizeValue(std::move(v));
        }
        row_count_ = values.size();
        column_index_[name] = column_names_.size();
        column_names_.push_back(name);
        columns_.push_back(std::move(values));
        lists_.emplace_back();
        is_list_.push_back(false);
    }

    inline void Table::addListColumn(const std::string& name, std::vector<Labels> labels) {
        checkNewColumn(name, labels.size());
        for (auto& row : labels) {
            for (auto& v : row) {
                v = normalizeValue(std::move(v));
            }
        }
        row_count_ = labels.size();
        column_index_[name] = column_names_.size();
        column_names_.push_back(name);
        columns_.emplace_back();
        lists_.push_back(std::move(labels));
        is_list_.push_back(true);
    }

    inline size_t Table::columnIndex(const std::string& name) const {
        auto it = column_index_.find(name);
        if (it == column_index_.end()) {
            throw TableError("Unknown column: " + name);
        }
        return it->second;
    }

    inline const Value& Table::at(size_t row, size_t col) const {
        if constexpr (RANGE_CHECKING) {
            if (isListColumn(col)) {
                throw TableError("Column '" + column_names_[col] + "' holds label lists, not scalar values");
            }
            return columns_[col].at(row);
        } else {
            return columns_[col][row];
        }
    }

    inline const Labels& Table::labels(size_t row, size_t col) const {
        if constexpr (RANGE_CHECKING) {
            if (!isListColumn(col)) {
                throw TableError("Column '" + column_names_[col] + "' holds scalar values, not label lists");
            }
            return lists_[col].at(row);
        } else {
            return lists_[col][row];
        }
    }

    inline const std::vector<Value>& Table::column(size_t col) const {
        if (isListColumn(col)) {
            throw TableError("Column '" + column_names_[col] + "' holds label lists, not scalar values");
        }
        return columns_[col];
    }

    inline Table Table::select(const ColumnNames& columns) const {
        Table out;
        for (const auto& name : columns) {
            size_t col = columnIndex(name);
            if (is_list_[col]) {
                out.addListColumn(name, lists_[col]);
            } else {
                out.addColumn(name, columns_[col]);
            }
        }
        if (columns.empty()) {
            out.row_count_ = row_count_;
        }
        return out;
    }

    inline Table Table::explode(const std::string& column, std::vector<RowId>& original) const {
        const size_t target = columnIndex(column);
        if (!is_list_[target]) {
            throw TableError("Cannot explode scalar column: " + column);
        }

        // Row mapping first, then every column follows it
        original.clear();
        std::vector<Value> exploded;
        for (size_t row = 0; row < row_count_; ++row) {
            const Labels& cell = lists_[target][row];
            if (cell.empty()) {
                original.push_back(row);
                exploded.emplace_back(std::monostate{});
                continue;
            }
            for (const auto& label : cell) {
                original.push_back(row);
                exploded.push_back(label);
            }
        }

        Table out;
        for (size_t col = 0; col < column_names_.size(); ++col) {
            if (col == target) {
                out.addColumn(column_names_[col], exploded);
            } else if (is_list_[col]) {
                std::vector<Labels> repeated;
                repeated.reserve(original.size());
                for (RowId row : original) {
                    repeated.push_back(lists_[col][row]);
                }
                out.addListColumn(column_names_[col], std::move(repeated));
            } else {
                std::vector<Value> repeated;
                repeated.reserve(original.size());
                for (RowId row : original) {
                    repeated.push_back(columns_[col][row]);
                }
                out.addColumn(column_names_[col], std::move(repeated));
            }
        }
        return out;
    }

} // namespace copairs
