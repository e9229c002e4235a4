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
 * @file csv_table.h
 * @brief Load a Table from CSV text and write a Table back as CSV.
 *
 * Design:
 *   - State-machine line splitter (quoted fields, embedded delimiters, quoted newlines)
 *   - First line is the header; a UTF-8 BOM is stripped
 *   - Column types are inferred: int64, then double, then bool, else string
 *   - Empty cells and the tokens NA, NaN, nan, null, NULL, None, N/A are null
 *   - Columns listed in CsvOptions::listColumns hold labels split on listSeparator
 *
 * Usage:
 *     copairs::CsvTableReader reader;
 *     if (!reader.open("plates.csv")) {
 *         std::cerr << reader.getErrorMsg() << std::endl;
 *     }
 *     copairs::Table table;
 *     reader.readTable(table);
 *
 *     // or, throwing TableError on failure
 *     copairs::Table table = copairs::readCsv("plates.csv");
 */

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"
#include "table.h"

namespace copairs {

    struct CsvOptions {
        char        delimiter       = ',';
        ColumnNames listColumns;                // parsed as label lists
        char        listSeparator   = '|';
    };

    class CsvTableReader {
    public:
        using FilePath = std::filesystem::path;

    private:
        std::string                     err_msg_;       // last error message description
        FilePath                        file_path_;
        std::ifstream                   stream_;
        CsvOptions                      options_;
        size_t                          file_line_ = 0; // 1-based raw line counter

        std::string                     line_buf_;
        std::vector<std::string_view>   cells_;         // views into line_buf_

    public:
        explicit CsvTableReader(CsvOptions options = {});
        ~CsvTableReader();

        void                    close();
        const std::string&      getErrorMsg() const     { return err_msg_; }
        const FilePath&         filePath() const        { return file_path_; }
        bool                    isOpen() const          { return stream_.is_open(); }
        bool                    open(const FilePath& filepath);
        size_t                  fileLine() const        { return file_line_; }

        /// Read the whole file into @p table. Returns false and sets the error message on failure.
        bool                    readTable(Table& table);

        /// Same as readTable, from any input stream (header line included).
        bool                    readStream(std::istream& input, Table& table);

    private:
        bool                    readLogicalLine(std::istream& input);
        void                    splitLine(std::string_view line);
        static std::string      unquote(std::string_view cell);
    };

    /// @throws TableError when the file cannot be read or parsed.
    Table readCsv(const std::filesystem::path& filepath, const CsvOptions& options = {});
    Table readCsv(std::istream& input, const CsvOptions& options = {});

    /// List cells are joined with @p listSeparator; nulls are written as empty cells.
    void writeCsv(const Table& table, std::ostream& output, char delimiter = ',', char listSeparator = '|');

    // Cell parsing, exposed for reuse by the command-line tools
    bool  isNullToken(std::string_view cell);
    Value parseCell(std::string_view cell);

} // namespace copairs
