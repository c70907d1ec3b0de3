/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#include "OverlapDetector.h"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace Inkwell::Core::IO {

namespace {

constexpr uint64_t kHashBase = 256;
constexpr uint64_t kHashModulus = 1000000007ULL;
constexpr size_t kDefaultMinHashLength = 4;

inline uint64_t byteValue(char c) noexcept {
    return static_cast<unsigned char>(c);
}

} // namespace

size_t directOverlap(std::string_view existing, std::string_view incoming) noexcept {
    const size_t maxLen = std::min(existing.size(), incoming.size());
    for (size_t len = maxLen; len > 0; --len) {
        if (existing.substr(existing.size() - len) == incoming.substr(0, len)) {
            return len;
        }
    }
    return 0;
}

size_t directOverlap(std::string_view existing, std::string_view incoming, size_t) noexcept {
    return directOverlap(existing, incoming);
}

size_t hashOverlap(std::string_view existing, std::string_view incoming, size_t minHashLength) noexcept {
    const size_t maxLen = std::min(existing.size(), incoming.size());
    if (maxLen == 0) return 0;
    if (minHashLength == 0) minHashLength = 1;

    if (maxLen >= minHashLength) {
        // prefixHash[k] = hash of incoming[0, k)
        std::vector<uint64_t> prefixHash(maxLen + 1, 0);
        for (size_t k = 1; k <= maxLen; ++k) {
            prefixHash[k] = (prefixHash[k - 1] * kHashBase + byteValue(incoming[k - 1])) % kHashModulus;
        }

        // suffixHash[k] = hash of the last k bytes of existing, built back to front
        std::vector<uint64_t> suffixHash(maxLen + 1, 0);
        uint64_t power = 1;
        const size_t n = existing.size();
        for (size_t k = 1; k <= maxLen; ++k) {
            suffixHash[k] = (byteValue(existing[n - k]) * power + suffixHash[k - 1]) % kHashModulus;
            power = (power * kHashBase) % kHashModulus;
        }

        for (size_t len = maxLen; len >= minHashLength; --len) {
            if (prefixHash[len] == suffixHash[len] &&
                existing.substr(n - len) == incoming.substr(0, len)) {
                return len;
            }
        }
    }

    // Short overlaps: only the trailing/leading (minHashLength - 1) bytes can matter
    const size_t shortLen = std::min(maxLen, minHashLength - 1);
    return directOverlap(existing.substr(existing.size() - shortLen), incoming.substr(0, shortLen));
}

size_t hashOverlap(std::string_view existing, std::string_view incoming) noexcept {
    return hashOverlap(existing, incoming, kDefaultMinHashLength);
}

OverlapFunction selectOverlapAlgorithm(size_t windowBytes, size_t smallThreshold) noexcept {
    if (windowBytes <= smallThreshold) {
        return static_cast<OverlapFunction>(&directOverlap);
    }
    return static_cast<OverlapFunction>(&hashOverlap);
}

} // namespace Inkwell::Core::IO
