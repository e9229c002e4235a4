/*
 * Copyright (c) 2026 The copairs authors
 *
 * This file is part of the copairs library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_matcher.cpp
 * @brief Micro-benchmarks for the copairs matchers using Google Benchmark
 *
 * Measures:
 * - Matcher construction (reverse indices + column ranking)
 * - getAllPairs with one sameby column and one diffby column
 * - getAllPairs with a composite sameby key
 * - getAllPairs with diffby only (cross product path)
 * - Null-pair sampling throughput
 * - MatcherMultilabel enumeration
 *
 * Usage:
 *   bench_matcher [Google Benchmark flags]
 *   bench_matcher --benchmark_format=json --benchmark_out=results.json
 */

#include <benchmark/benchmark.h>
#include <copairs/copairs.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace copairs;

// ============================================================================
// Dataset generation: plate layout with compounds replicated across plates
// ============================================================================

namespace {

/// @p rows wells over 16 plates, rows/8 compounds, 3 doses, shuffled with a fixed seed.
Table createPlateTable(size_t rows) {
    std::mt19937_64 gen(42);
    const size_t nCompounds = std::max<size_t>(rows / 8, 2);

    std::vector<std::string> compound(rows);
    std::vector<int64_t>     plate(rows);
    std::vector<int64_t>     dose(rows);
    std::vector<std::string> well(rows);
    std::vector<Labels>      targets(rows);

    for (size_t i = 0; i < rows; ++i) {
        compound[i] = "c" + std::to_string(gen() % nCompounds);
        plate[i]    = static_cast<int64_t>(gen() % 16);
        dose[i]     = static_cast<int64_t>(gen() % 3);
        well[i]     = "w" + std::to_string(i % 384);
        const size_t nLabels = 1 + gen() % 3;
        for (size_t k = 0; k < nLabels; ++k) {
            targets[i].push_back(Value{"t" + std::to_string(gen() % 50)});
        }
    }

    Table table;
    table.addColumn("compound", compound);
    table.addColumn("plate", plate);
    table.addColumn("dose", dose);
    table.addColumn("well", well);
    table.addListColumn("targets", std::move(targets));
    return table;
}

const ColumnNames SCALAR_COLUMNS = {"compound", "plate", "dose", "well"};

} // namespace

// ============================================================================
// BM_Matcher_Construct
// ============================================================================

static void BM_Matcher_Construct(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    const Table table = createPlateTable(N);

    for (auto _ : state) {
        Matcher matcher(table, SCALAR_COLUMNS, 0);
        benchmark::DoNotOptimize(matcher.rowCount());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_Matcher_Construct)->Arg(1000)->Arg(10000)->Arg(100000);

// ============================================================================
// BM_Matcher_SamebyDiffby: sameby compound, diffby plate
// ============================================================================

static void BM_Matcher_SamebyDiffby(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    const Matcher matcher(createPlateTable(N), SCALAR_COLUMNS, 0);

    size_t pairs = 0;
    for (auto _ : state) {
        const PairCollection result = matcher.getAllPairs("compound", "plate");
        pairs = totalPairs(result);
        benchmark::DoNotOptimize(pairs);
    }

    state.counters["pairs"] = static_cast<double>(pairs);
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_Matcher_SamebyDiffby)->Arg(1000)->Arg(10000)->Arg(100000);

// ============================================================================
// BM_Matcher_Composite: sameby {compound, dose}, diffby-any {plate, well}
// ============================================================================

static void BM_Matcher_Composite(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    const Matcher matcher(createPlateTable(N), SCALAR_COLUMNS, 0);

    size_t pairs = 0;
    for (auto _ : state) {
        const PairCollection result = matcher.getAllPairs(ColumnNames{"compound", "dose"},
                                                          ColumnGroup{{}, {"plate", "well"}});
        pairs = totalPairs(result);
        benchmark::DoNotOptimize(pairs);
    }

    state.counters["pairs"] = static_cast<double>(pairs);
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_Matcher_Composite)->Arg(1000)->Arg(10000)->Arg(100000);

// ============================================================================
// BM_Matcher_DiffbyOnly: diffby {plate, dose}, quadratic output
// ============================================================================

static void BM_Matcher_DiffbyOnly(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    const Matcher matcher(createPlateTable(N), SCALAR_COLUMNS, 0);

    size_t pairs = 0;
    for (auto _ : state) {
        const PairCollection result = matcher.getAllPairs(ColumnNames{}, ColumnNames{"plate", "dose"});
        pairs = totalPairs(result);
        benchmark::DoNotOptimize(pairs);
    }

    state.counters["pairs"] = static_cast<double>(pairs);
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(pairs));
}
BENCHMARK(BM_Matcher_DiffbyOnly)->Arg(500)->Arg(2000);

// ============================================================================
// BM_Matcher_NullPairs: 1000 null pairs, diffby {compound, plate}
// ============================================================================

static void BM_Matcher_NullPairs(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    Matcher matcher(createPlateTable(N), SCALAR_COLUMNS, 0);

    for (auto _ : state) {
        std::vector<Pair> pairs = matcher.getNullPairs(ColumnNames{"compound", "plate"}, 1000, 20);
        benchmark::DoNotOptimize(pairs.data());
    }

    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_Matcher_NullPairs)->Arg(1000)->Arg(10000)->Arg(100000);

// ============================================================================
// BM_Multilabel_SamebyTargets: sameby targets, diffby compound
// ============================================================================

static void BM_Multilabel_SamebyTargets(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    const MatcherMultilabel matcher(createPlateTable(N), {"compound", "plate"}, "targets", 0);

    size_t pairs = 0;
    for (auto _ : state) {
        const PairCollection result = matcher.getAllPairs("targets", "compound");
        pairs = totalPairs(result);
        benchmark::DoNotOptimize(pairs);
    }

    state.counters["pairs"] = static_cast<double>(pairs);
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_Multilabel_SamebyTargets)->Arg(1000)->Arg(5000);

BENCHMARK_MAIN();
