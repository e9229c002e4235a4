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
 * @file table.h
 * @brief In-memory column store the matchers operate on.
 *
 * A Table is an ordered set of named columns of equal length. A column holds
 * either one scalar Value per row, or a list of labels per row (a multilabel
 * column). Row order defines row identifiers 0..N-1.
 *
 * Usage:
 *     copairs::Table table;
 *     table.addColumn("compound", std::vector<std::string>{"X", "X", "Y", "Y"});
 *     table.addColumn("plate",    std::vector<int64_t>{1, 2, 1, 2});
 *     const copairs::Value& v = table.at(2, table.columnIndex("compound"));
 */

#include <concepts>
#include <cstddef>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "definitions.h"
#include "value.h"

namespace copairs {

    using Labels = std::vector<Value>;

    /// Convert a native cell to a Value. Integers widen to int64, floats to double.
    template<typename T>
    Value toValue(const T& v) {
        if constexpr (std::is_same_v<T, Value>) {
            return normalizeValue(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return Value{v};
        } else if constexpr (std::is_integral_v<T>) {
            return Value{static_cast<int64_t>(v)};
        } else if constexpr (std::is_floating_point_v<T>) {
            return normalizeValue(Value{static_cast<double>(v)});
        } else if constexpr (std::is_convertible_v<T, std::string>) {
            return Value{std::string(v)};
        } else {
            static_assert(std::is_same_v<T, Value>, "Unsupported cell type");
        }
    }

    class Table {
        std::vector<std::string>                column_names_;
        std::unordered_map<std::string, size_t> column_index_;
        std::vector<std::vector<Value>>         columns_;   // scalar cells; empty for list columns
        std::vector<std::vector<Labels>>        lists_;     // list cells; empty for scalar columns
        std::vector<bool>                       is_list_;
        size_t                                  row_count_ = 0;

        void checkNewColumn(const std::string& name, size_t rows) const;

    public:
        Table() = default;
        Table(const Table&) = default;
        Table(Table&&) noexcept = default;
        Table& operator=(const Table&) = default;
        Table& operator=(Table&&) noexcept = default;
        ~Table() = default;

        // Column construction
        void addColumn(const std::string& name, std::vector<Value> values);
        template<typename T>
        requires (!std::same_as<T, Value>)
        void addColumn(const std::string& name, const std::vector<T>& values) {
            std::vector<Value> converted;
            converted.reserve(values.size());
            for (const auto& v : values) {
                converted.push_back(toValue(v));
            }
            addColumn(name, std::move(converted));
        }
        void addListColumn(const std::string& name, std::vector<Labels> labels);

        // Basic table information
        size_t                      columnCount() const                     { return column_names_.size(); }
        size_t                      rowCount() const                        { return row_count_; }
        bool                        hasColumn(const std::string& name) const { return column_index_.find(name) != column_index_.end(); }
        size_t                      columnIndex(const std::string& name) const;
        const std::string&          columnName(size_t index) const          { if constexpr (RANGE_CHECKING) { return column_names_.at(index); } else { return column_names_[index]; } }
        const ColumnNames&          columnNames() const                     { return column_names_; }
        bool                        isListColumn(size_t index) const        { if constexpr (RANGE_CHECKING) { return is_list_.at(index); } else { return is_list_[index]; } }

        // Cell access
        const Value&                at(size_t row, size_t col) const;
        const Labels&               labels(size_t row, size_t col) const;
        const std::vector<Value>&   column(size_t col) const;

        /// New table holding only the given columns, in the given order.
        Table select(const ColumnNames& columns) const;

        /**
         * @brief One row per label of a list column.
         *
         * Every other column is repeated for each label. A row with an empty
         * label list yields a single row with a null label.
         * @param column         Name of the list column to explode.
         * @param[out] original  For every exploded row, the row it came from.
         */
        Table explode(const std::string& column, std::vector<RowId>& original) const;
    };

} // namespace copairs
