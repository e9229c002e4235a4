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
 * @file csv_table.hpp
 * @brief CsvTableReader and CSV writer implementations.
 */

#include "csv_table.h"
#include "exceptions.h"
#include "table.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace copairs {

    namespace detail {

        enum class CellKind : uint8_t { NONE = 0, INT64, DOUBLE, BOOL, STRING };

        inline std::string_view trimSpaces(std::string_view cell) {
            while (!cell.empty() && (cell.front() == ' ' || cell.front() == '\t')) cell.remove_prefix(1);
            while (!cell.empty() && (cell.back() == ' ' || cell.back() == '\t')) cell.remove_suffix(1);
            return cell;
        }

        inline bool parseBool(std::string_view cell, bool& out) {
            if (cell == "true" || cell == "True" || cell == "TRUE") {
                out = true;
                return true;
            }
            if (cell == "false" || cell == "False" || cell == "FALSE") {
                out = false;
                return true;
            }
            return false;
        }

        template<typename T>
        bool parseNumber(std::string_view cell, T& out) {
            if (cell.empty()) {
                return false;
            }
            const char* first = cell.data();
            const char* last = cell.data() + cell.size();
            if (*first == '+') {
                ++first;
            }
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        }

        inline CellKind classify(std::string_view cell) {
            const std::string_view t = trimSpaces(cell);
            if (isNullToken(t)) {
                return CellKind::NONE;
            }
            int64_t i = 0;
            if (parseNumber(t, i)) {
                return CellKind::INT64;
            }
            double d = 0;
            if (parseNumber(t, d)) {
                return CellKind::DOUBLE;
            }
            bool b = false;
            if (parseBool(t, b)) {
                return CellKind::BOOL;
            }
            return CellKind::STRING;
        }

        /// Widest kind able to hold both: int64 widens to double, anything else mixed is string.
        inline CellKind combine(CellKind a, CellKind b) {
            if (a == CellKind::NONE) return b;
            if (b == CellKind::NONE) return a;
            if (a == b) return a;
            if ((a == CellKind::INT64 && b == CellKind::DOUBLE) || (a == CellKind::DOUBLE && b == CellKind::INT64)) {
                return CellKind::DOUBLE;
            }
            return CellKind::STRING;
        }

        inline Value convert(std::string_view cell, CellKind kind) {
            const std::string_view t = trimSpaces(cell);
            if (isNullToken(t)) {
                return Value{};
            }
            switch (kind) {
                case CellKind::INT64: {
                    int64_t v = 0;
                    parseNumber(t, v);
                    return Value{v};
                }
                case CellKind::DOUBLE: {
                    double v = 0;
                    parseNumber(t, v);
                    return normalizeValue(Value{v});
                }
                case CellKind::BOOL: {
                    bool v = false;
                    parseBool(t, v);
                    return Value{v};
                }
                case CellKind::STRING:
                    return Value{std::string(cell)};    // strings keep their whitespace
                default:
                    return Value{};
            }
        }

        inline std::vector<std::string> splitLabels(const std::string& cell, char separator) {
            std::vector<std::string> labels;
            if (isNullToken(trimSpaces(cell))) {
                return labels;
            }
            size_t start = 0;
            for (size_t i = 0; i <= cell.size(); ++i) {
                if (i == cell.size() || cell[i] == separator) {
                    std::string label = cell.substr(start, i - start);
                    if (!isNullToken(trimSpaces(label))) {
                        labels.push_back(std::move(label));
                    }
                    start = i + 1;
                }
            }
            return labels;
        }

        inline bool needsQuotes(std::string_view cell, char delimiter) {
            return std::any_of(cell.begin(), cell.end(), [delimiter](char c) {
                return c == delimiter || c == '"' || c == '\n' || c == '\r';
            });
        }

        inline void writeField(std::ostream& os, const std::string& cell, char delimiter) {
            if (!needsQuotes(cell, delimiter)) {
                os << cell;
                return;
            }
            os << '"';
            for (char c : cell) {
                if (c == '"') {
                    os << '"';
                }
                os << c;
            }
            os << '"';
        }

    } // namespace detail

    inline bool isNullToken(std::string_view cell) {
        static constexpr std::array<std::string_view, 8> tokens = {
            "", "NA", "NaN", "nan", "null", "NULL", "None", "N/A"
        };
        return std::find(tokens.begin(), tokens.end(), cell) != tokens.end();
    }

    inline Value parseCell(std::string_view cell) {
        return detail::convert(cell, detail::classify(cell));
    }

    // ── Constructor / Destructor ────────────────────────────────────────

    inline CsvTableReader::CsvTableReader(CsvOptions options)
        : options_(std::move(options))
    {
        line_buf_.reserve(4096);
    }

    inline CsvTableReader::~CsvTableReader() {
        if (isOpen()) {
            close();
        }
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    inline void CsvTableReader::close() {
        if (!stream_.is_open()) {
            return;
        }
        stream_.close();
        file_path_.clear();
        file_line_ = 0;
    }

    inline bool CsvTableReader::open(const FilePath& filepath) {
        err_msg_.clear();

        if (isOpen()) {
            err_msg_ = "Warning: File is already open: " + file_path_.string();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        }

        try {
            FilePath absolutePath = std::filesystem::absolute(filepath);

            if (!std::filesystem::exists(absolutePath)) {
                throw std::runtime_error("Error: File does not exist: " + absolutePath.string());
            }
            if (!std::filesystem::is_regular_file(absolutePath)) {
                throw std::runtime_error("Error: Path is not a regular file: " + absolutePath.string());
            }

            stream_.open(absolutePath, std::ios::in);
            if (!stream_.is_open()) {
                throw std::runtime_error("Error: Cannot open file for reading: " + absolutePath.string());
            }

            file_path_ = absolutePath;
            file_line_ = 0;
            return true;

        } catch (const std::exception& ex) {
            err_msg_ = ex.what();
            if (stream_.is_open()) {
                stream_.close();
            }
            file_path_.clear();
            return false;
        }
    }

    // ── Reading ─────────────────────────────────────────────────────────

    inline bool CsvTableReader::readTable(Table& table) {
        if (!isOpen()) {
            err_msg_ = "Error: No file is open";
            return false;
        }
        return readStream(stream_, table);
    }

    inline bool CsvTableReader::readStream(std::istream& input, Table& table) {
        err_msg_.clear();
        file_line_ = 0;

        if (!readLogicalLine(input)) {
            err_msg_ = "Error: CSV file is empty (no header line)";
            return false;
        }

        // Strip BOM if present (UTF-8 BOM: EF BB BF)
        if (line_buf_.size() >= 3 &&
            static_cast<unsigned char>(line_buf_[0]) == 0xEF &&
            static_cast<unsigned char>(line_buf_[1]) == 0xBB &&
            static_cast<unsigned char>(line_buf_[2]) == 0xBF) {
            line_buf_.erase(0, 3);
        }

        splitLine(line_buf_);
        ColumnNames names;
        names.reserve(cells_.size());
        for (auto cell : cells_) {
            names.push_back(unquote(cell));
        }

        for (const auto& name : options_.listColumns) {
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                err_msg_ = "Error: List column '" + name + "' not found in CSV header";
                return false;
            }
        }

        std::vector<std::vector<std::string>> raw(names.size());
        while (readLogicalLine(input)) {
            if (line_buf_.empty()) {
                continue;
            }
            splitLine(line_buf_);
            if (cells_.size() != names.size()) {
                err_msg_ = "Error: CSV line " + std::to_string(file_line_) + " has " +
                           std::to_string(cells_.size()) + " cells, header has " + std::to_string(names.size());
                return false;
            }
            for (size_t i = 0; i < cells_.size(); ++i) {
                raw[i].push_back(unquote(cells_[i]));
            }
        }

        try {
            Table result;
            for (size_t col = 0; col < names.size(); ++col) {
                const bool isList = std::find(options_.listColumns.begin(), options_.listColumns.end(),
                                              names[col]) != options_.listColumns.end();
                detail::CellKind kind = detail::CellKind::NONE;

                if (isList) {
                    std::vector<std::vector<std::string>> split;
                    split.reserve(raw[col].size());
                    for (const auto& cell : raw[col]) {
                        split.push_back(detail::splitLabels(cell, options_.listSeparator));
                        for (const auto& label : split.back()) {
                            kind = detail::combine(kind, detail::classify(label));
                        }
                    }
                    std::vector<Labels> labels;
                    labels.reserve(split.size());
                    for (const auto& cellLabels : split) {
                        Labels row;
                        row.reserve(cellLabels.size());
                        for (const auto& label : cellLabels) {
                            row.push_back(detail::convert(label, kind));
                        }
                        labels.push_back(std::move(row));
                    }
                    result.addListColumn(names[col], std::move(labels));
                } else {
                    for (const auto& cell : raw[col]) {
                        kind = detail::combine(kind, detail::classify(cell));
                    }
                    std::vector<Value> values;
                    values.reserve(raw[col].size());
                    for (const auto& cell : raw[col]) {
                        values.push_back(detail::convert(cell, kind));
                    }
                    result.addColumn(names[col], std::move(values));
                }
            }
            table = std::move(result);
        } catch (const TableError& ex) {
            err_msg_ = std::string("Error: ") + ex.what();
            return false;
        }
        return true;
    }

    // ── Private helpers ─────────────────────────────────────────────────

    /// Read one CSV record, which spans several raw lines when a quoted field holds a newline.
    inline bool CsvTableReader::readLogicalLine(std::istream& input) {
        line_buf_.clear();
        bool inQuotes = false;
        bool any = false;

        std::string rawLine;
        while (std::getline(input, rawLine)) {
            any = true;
            ++file_line_;
            if (!rawLine.empty() && rawLine.back() == '\r') {
                rawLine.pop_back();
            }
            if (inQuotes) {
                line_buf_.push_back('\n');
            }
            line_buf_ += rawLine;

            for (char c : rawLine) {
                if (c == '"') inQuotes = !inQuotes;
            }
            if (!inQuotes) {
                return true;
            }
        }
        if (any && inQuotes) {
            err_msg_ = "Warning: Unterminated quoted field at end of input";
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
        }
        return any;
    }

    inline void CsvTableReader::splitLine(std::string_view line) {
        cells_.clear();
        const char* data = line.data();
        size_t len = line.size();
        size_t start = 0;
        bool inQuotes = false;

        for (size_t i = 0; i <= len; ++i) {
            if (i == len || (!inQuotes && data[i] == options_.delimiter)) {
                cells_.emplace_back(data + start, i - start);
                start = i + 1;
            } else if (data[i] == '"') {
                inQuotes = !inQuotes;
            }
        }
    }

    /// Unquote a CSV field: removes outer quotes and unescapes doubled quotes
    inline std::string CsvTableReader::unquote(std::string_view cell) {
        if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
            std::string result(cell.data() + 1, cell.size() - 2);
            size_t pos = 0;
            while ((pos = result.find("\"\"", pos)) != std::string::npos) {
                result.erase(pos, 1);
                pos += 1;
            }
            return result;
        }
        return std::string(cell);
    }

    // ── Free functions ──────────────────────────────────────────────────

    inline Table readCsv(const std::filesystem::path& filepath, const CsvOptions& options) {
        CsvTableReader reader(options);
        if (!reader.open(filepath)) {
            throw TableError(reader.getErrorMsg());
        }
        Table table;
        if (!reader.readTable(table)) {
            throw TableError(reader.getErrorMsg());
        }
        return table;
    }

    inline Table readCsv(std::istream& input, const CsvOptions& options) {
        CsvTableReader reader(options);
        Table table;
        if (!reader.readStream(input, table)) {
            throw TableError(reader.getErrorMsg());
        }
        return table;
    }

    inline void writeCsv(const Table& table, std::ostream& output, char delimiter, char listSeparator) {
        for (size_t col = 0; col < table.columnCount(); ++col) {
            if (col > 0) {
                output << delimiter;
            }
            detail::writeField(output, table.columnName(col), delimiter);
        }
        output << '\n';

        std::string cell;
        for (size_t row = 0; row < table.rowCount(); ++row) {
            for (size_t col = 0; col < table.columnCount(); ++col) {
                if (col > 0) {
                    output << delimiter;
                }
                if (table.isListColumn(col)) {
                    cell.clear();
                    const Labels& labels = table.labels(row, col);
                    for (size_t i = 0; i < labels.size(); ++i) {
                        if (i > 0) {
                            cell.push_back(listSeparator);
                        }
                        cell += toString(labels[i]);
                    }
                } else {
                    cell = toString(table.at(row, col));
                }
                detail::writeField(output, cell, delimiter);
            }
            output << '\n';
        }
    }

} // namespace copairs
