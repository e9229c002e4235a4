/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file copairsMatch.cpp
 * @brief CLI tool to enumerate or sample pairs of rows of a CSV file
 *
 * Reads a CSV file, builds a matcher over the columns named in the
 * constraints and writes the matching pairs as CSV (key columns, ix1, ix2).
 * With --null N it writes N sampled null pairs (ix1, ix2) instead.
 */

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <copairs/copairs.h>
#include "cli_common.h"

using copairs_cli::makeColumnSpec;
using copairs_cli::parseCount;
using copairs_cli::splitNames;

struct Config {
    std::string input_file;
    std::string output_file;                // empty: stdout
    copairs::ColumnNames sameby;
    copairs::ColumnNames sameby_any;
    copairs::ColumnNames diffby;
    copairs::ColumnNames diffby_any;
    std::string multilabel;
    uint64_t seed = 0;
    std::optional<size_t> max_size;
    size_t n_tries = copairs::DEFAULT_N_TRIES;
    size_t n_null = 0;                      // 0: enumerate all pairs
    char delimiter = ',';
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT_FILE\n\n";
    std::cout << "Enumerate pairs of rows sharing or differing in column values.\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  INPUT_FILE     Input CSV file path (first line is the header)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -s, --sameby COLS       Columns both rows must share (comma-separated)\n";
    std::cout << "  --sameby-any COLS       At least one of these columns must be shared\n";
    std::cout << "  -d, --diffby COLS       Columns both rows must differ in\n";
    std::cout << "  --diffby-any COLS       At least one of these columns must differ\n";
    std::cout << "  --multilabel COL        Column holding '|'-separated label lists\n";
    std::cout << "  --null N                Sample N null pairs satisfying diffby instead\n";
    std::cout << "  --seed N                Seed of the random source (default: 0)\n";
    std::cout << "  --max-size N            Cap the rows kept per value group\n";
    std::cout << "  --tries N               Attempts per null pair (default: " << copairs::DEFAULT_N_TRIES << ")\n";
    std::cout << "  -o, --output FILE       Output CSV file (default: stdout)\n";
    std::cout << "  --delimiter CHAR        Field delimiter (default: ',')\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -s compound -d plate plates.csv\n";
    std::cout << "  " << program_name << " -s compound,dose --diffby-any plate,well plates.csv\n";
    std::cout << "  " << program_name << " --null 1000 -d compound --seed 7 plates.csv\n";
    std::cout << "  " << program_name << " --multilabel targets -s targets -d compound plates.csv\n";
}

Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.help = true;
            return config;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if ((arg == "-s" || arg == "--sameby") && i + 1 < argc) {
            config.sameby = splitNames(argv[++i]);
        } else if (arg == "--sameby-any" && i + 1 < argc) {
            config.sameby_any = splitNames(argv[++i]);
        } else if ((arg == "-d" || arg == "--diffby") && i + 1 < argc) {
            config.diffby = splitNames(argv[++i]);
        } else if (arg == "--diffby-any" && i + 1 < argc) {
            config.diffby_any = splitNames(argv[++i]);
        } else if (arg == "--multilabel" && i + 1 < argc) {
            config.multilabel = argv[++i];
        } else if (arg == "--null" && i + 1 < argc) {
            config.n_null = parseCount(arg, argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            try {
                config.seed = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                throw std::runtime_error(std::string("Invalid seed: ") + argv[i]);
            }
        } else if (arg == "--max-size" && i + 1 < argc) {
            config.max_size = parseCount(arg, argv[++i]);
        } else if (arg == "--tries" && i + 1 < argc) {
            config.n_tries = parseCount(arg, argv[++i]);
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.output_file = argv[++i];
        } else if (arg == "--delimiter" && i + 1 < argc) {
            std::string delim = argv[++i];
            if (delim.length() != 1) {
                throw std::runtime_error("Delimiter must be a single character: " + delim);
            }
            config.delimiter = delim[0];
        } else if (arg.substr(0, 1) == "-") {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            if (config.input_file.empty()) {
                config.input_file = arg;
            } else {
                throw std::runtime_error("Too many arguments. Only one input file expected.");
            }
        }
    }

    if (config.input_file.empty()) {
        throw std::runtime_error("Input file is required");
    }
    return config;
}

/// Every column named by a constraint, first occurrence order.
copairs::ColumnNames queriedColumns(const Config& config) {
    copairs::ColumnNames columns;
    for (const auto* list : {&config.sameby, &config.sameby_any, &config.diffby, &config.diffby_any}) {
        for (const auto& name : *list) {
            if (std::find(columns.begin(), columns.end(), name) == columns.end()) {
                columns.push_back(name);
            }
        }
    }
    return columns;
}

copairs::Table nullPairTable(const std::vector<copairs::Pair>& pairs) {
    std::vector<int64_t> ix1;
    std::vector<int64_t> ix2;
    ix1.reserve(pairs.size());
    ix2.reserve(pairs.size());
    for (const auto& [a, b] : pairs) {
        ix1.push_back(static_cast<int64_t>(a));
        ix2.push_back(static_cast<int64_t>(b));
    }
    copairs::Table table;
    table.addColumn("ix1", ix1);
    table.addColumn("ix2", ix2);
    return table;
}

template<typename MatcherType>
copairs::Table runQuery(MatcherType& matcher, const Config& config) {
    const copairs::ColumnSpec diffby = makeColumnSpec(config.diffby, config.diffby_any);
    if (config.n_null > 0) {
        return nullPairTable(matcher.getNullPairs(diffby, config.n_null, config.n_tries));
    }

    const copairs::ColumnSpec sameby = makeColumnSpec(config.sameby, config.sameby_any);
    const copairs::PairCollection pairs = matcher.getAllPairs(sameby, diffby);
    if (config.verbose) {
        std::cerr << "Found " << copairs::totalPairs(pairs) << " pairs under "
                  << pairs.size() << " keys" << std::endl;
    }
    return copairs::flattenPairs(pairs, sameby);
}

int main(int argc, char* argv[]) {
    try {
        Config config = parseArgs(argc, argv);

        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }

        if (config.verbose) {
            std::cerr << "Reading: " << config.input_file << std::endl;
            std::cerr << "Seed: " << config.seed << std::endl;
            if (config.max_size) {
                std::cerr << "Max group size: " << *config.max_size << std::endl;
            }
        }

        copairs::CsvOptions options;
        options.delimiter = config.delimiter;
        if (!config.multilabel.empty()) {
            options.listColumns.push_back(config.multilabel);
        }
        const copairs::Table table = copairs::readCsv(config.input_file, options);

        if (config.verbose) {
            copairs_cli::printTableSummary("Input", table);
        }

        const copairs::ColumnNames columns = queriedColumns(config);
        copairs::Table result;
        if (config.multilabel.empty()) {
            copairs::Matcher matcher(table, columns, config.seed, config.max_size);
            result = runQuery(matcher, config);
        } else {
            copairs::MatcherMultilabel matcher(table, columns, config.multilabel, config.seed, config.max_size);
            result = runQuery(matcher, config);
        }

        if (config.output_file.empty()) {
            copairs::writeCsv(result, std::cout, config.delimiter);
        } else {
            std::ofstream out(config.output_file);
            if (!out.is_open()) {
                std::cerr << "Error: Cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            copairs::writeCsv(result, out, config.delimiter);
            if (config.verbose) {
                std::cerr << "Wrote " << result.rowCount() << " rows to " << config.output_file << std::endl;
            }
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
