/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Core common utilities for Inkwell
 *
 * Environment access and the small text helpers shared by the write
 * subsystem (UTF-8 character counting, ASCII whitespace trimming).
 */

#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace Inkwell {
namespace Core {
    // Cross-platform safe environment variable getter that avoids returning raw pointers
    // and copies into std::string. Returns std::nullopt if the variable is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
#if defined(_WIN32)
        size_t required = 0;
        errno_t err = getenv_s(&required, nullptr, 0, name);
        if (err != 0 || required == 0) return std::nullopt;
        // required includes the null terminator
        std::string value;
        value.resize(required);
        size_t read = 0;
        err = getenv_s(&read, value.data(), value.size(), name);
        if (err != 0 || read == 0) return std::nullopt;
        if (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
#else
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
#endif
    }

    inline bool isAsciiWhitespace(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    // View of text without trailing ASCII whitespace
    inline std::string_view trimRight(std::string_view text) noexcept {
        size_t end = text.size();
        while (end > 0 && isAsciiWhitespace(text[end - 1])) --end;
        return text.substr(0, end);
    }

    /**
     * @brief Counts characters (code points) in UTF-8 text
     *
     * Continuation bytes (10xxxxxx) are not counted. Malformed sequences count
     * one character per lead or stray byte, so the result never exceeds size().
     */
    inline size_t countUtf8Characters(std::string_view text) noexcept {
        size_t count = 0;
        for (unsigned char c : text) {
            if ((c & 0xC0) != 0x80) ++count;
        }
        return count;
    }
} // namespace Core
} // namespace Inkwell
