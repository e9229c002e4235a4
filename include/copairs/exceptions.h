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
 * @file exceptions.h
 * @brief Error kinds raised by the copairs library.
 *
 * - SpecificationError      bad sameby/diffby input, raised before any enumeration
 * - UnpairedError           one null-sampling attempt found no partner (retried internally)
 * - SamplingExhaustedError  every null-sampling attempt failed
 * - EmptyPairsError         flattening an empty pair collection
 * - TableError              malformed table or unreadable CSV input
 */

#include <stdexcept>
#include <string>

namespace copairs {

    class CopairsError : public std::runtime_error {
    public:
        explicit CopairsError(const std::string& message) : std::runtime_error(message) {}
    };

    class SpecificationError : public CopairsError {
    public:
        explicit SpecificationError(const std::string& message) : CopairsError(message) {}
    };

    class UnpairedError : public CopairsError {
    public:
        explicit UnpairedError(const std::string& message) : CopairsError(message) {}
    };

    class SamplingExhaustedError : public CopairsError {
    public:
        explicit SamplingExhaustedError(const std::string& message) : CopairsError(message) {}
    };

    class EmptyPairsError : public CopairsError {
    public:
        explicit EmptyPairsError(const std::string& message) : CopairsError(message) {}
    };

    class TableError : public CopairsError {
    public:
        explicit TableError(const std::string& message) : CopairsError(message) {}
    };

} // namespace copairs
