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
 * @file constraint_spec.h
 * @brief sameby / diffby specifications and their validation.
 *
 * A specification is given in one of three shapes:
 *   - a single column name             "compound"
 *   - a list of column names (= all)   ColumnNames{"compound", "dose"}
 *   - an explicit group                ColumnGroup{{"compound"}, {"plate", "well"}}
 * and normalized once into a Constraint{all, any}.
 */

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "definitions.h"

namespace copairs {

    struct ColumnGroup {
        ColumnNames all;
        ColumnNames any;
    };

    using ColumnSpec = std::variant<std::string, ColumnNames, ColumnGroup>;

    struct Constraint {
        ColumnNames all;    // every column must satisfy the condition
        ColumnNames any;    // at least one column must satisfy the condition

        bool empty() const { return all.empty() && any.empty(); }
        ColumnNames columns() const;
    };

    /**
     * @brief Normalize a specification into its canonical all/any form.
     *
     * An empty column name or empty list yields an empty constraint. Repeated
     * names inside one list are collapsed.
     * @param spec    The user specification.
     * @param family  "sameby" or "diffby", used in error messages.
     * @throws SpecificationError if the any group holds exactly one column.
     */
    Constraint normalizeSpec(const ColumnSpec& spec, std::string_view family);

    /**
     * @brief Validate a complete sameby/diffby query against the available columns.
     * @throws SpecificationError on overlapping columns, an empty query or
     *         columns missing from @p available.
     */
    void validateQuery(const Constraint& sameby, const Constraint& diffby, const ColumnNames& available);

    /// Validation for null sampling: diffby only, an empty constraint is allowed.
    void validateDiffby(const Constraint& diffby, const ColumnNames& available);

} // namespace copairs
