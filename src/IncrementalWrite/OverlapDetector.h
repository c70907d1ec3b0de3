/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

/**
 * @file OverlapDetector.h
 * @brief Longest suffix-of-existing / prefix-of-incoming overlap
 *
 * Both algorithms compute the same function: the largest k with
 * k <= min(|existing|, |incoming|) such that the last k bytes of existing equal
 * the first k bytes of incoming. Comparison is over raw bytes, so multi-byte
 * UTF-8 sequences are never split into code units.
 */

#pragma once

#include <cstddef>
#include <string_view>

namespace Inkwell::Core::IO {

// Signature shared by both algorithms; directOverlap ignores minHashLength
using OverlapFunction = size_t (*)(std::string_view existing, std::string_view incoming, size_t minHashLength);

/**
 * @brief Quadratic scan from the longest candidate downwards
 *
 * Suitable for windows up to a few KiB.
 */
size_t directOverlap(std::string_view existing, std::string_view incoming) noexcept;
size_t directOverlap(std::string_view existing, std::string_view incoming, size_t minHashLength) noexcept;

/**
 * @brief Rabin-Karp overlap with direct verification of every hash hit
 *
 * Prefix hashes of incoming and suffix hashes of existing are compared for each
 * candidate length from the longest down to minHashLength. A hash hit is only
 * accepted after the bytes are compared, so collisions cannot produce a wrong
 * answer. Lengths below minHashLength are resolved with directOverlap.
 */
size_t hashOverlap(std::string_view existing, std::string_view incoming, size_t minHashLength) noexcept;

// hashOverlap with the default minimum hash length of 4
size_t hashOverlap(std::string_view existing, std::string_view incoming) noexcept;

/**
 * @brief Chooses directOverlap for small windows, hashOverlap otherwise
 *
 * The tail reader calls the result with WriteConfig::minHashOverlap.
 * @param windowBytes Size of the existing-content window that will be compared
 * @param smallThreshold Windows of at most this many bytes use directOverlap
 */
OverlapFunction selectOverlapAlgorithm(size_t windowBytes, size_t smallThreshold) noexcept;

} // namespace Inkwell::Core::IO
