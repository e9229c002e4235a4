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
 * @file copairs.h
 * @brief copairs - Main Header with Declarations
 *
 * A C++20 header-only library that enumerates and samples pairs of rows of
 * a table under "same value" and "different value" column constraints.
 *
 * This header includes all copairs component declarations:
 * - Table: In-memory column store, scalar and multilabel columns
 * - ReverseIndex / ColumnPlanner: Value groups and column selectivity
 * - Matcher: Exhaustive enumeration and null-pair sampling
 * - MatcherMultilabel: Matching over a column with several labels per row
 * - flattenPairs: Pair collection to table
 * - CsvTableReader / writeCsv: CSV input and output
 */

#include <iostream>
#include <string>

// Core definitions first
#include "definitions.h"
#include "exceptions.h"
#include "value.h"

// Core component declarations
#include "column_planner.h"
#include "constraint_filter.h"
#include "constraint_spec.h"
#include "csv_table.h"
#include "matcher.h"
#include "matcher_multilabel.h"
#include "pair_key.h"
#include "pair_table.h"
#include "random_source.h"
#include "reverse_index.h"
#include "table.h"

// Include implementations
#include "column_planner.hpp"
#include "constraint_filter.hpp"
#include "constraint_spec.hpp"
#include "csv_table.hpp"
#include "matcher.hpp"
#include "matcher_multilabel.hpp"
#include "pair_key.hpp"
#include "pair_table.hpp"
#include "random_source.hpp"
#include "reverse_index.hpp"
#include "table.hpp"
