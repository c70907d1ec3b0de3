/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Inkwell::Core::Logging {

/**
 * @brief Severity of a log entry, ordered from most to least verbose
 */
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

constexpr std::string_view toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:   return "trace";
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warn";
        case LogLevel::Error:   return "error";
        case LogLevel::Fatal:   return "fatal";
        case LogLevel::Off:     return "off";
    }
    return "info";
}

/**
 * @brief Parses a level name as accepted by INKWELL_LOG_LEVEL
 * @param name One of trace, debug, info, warn, warning, error, fatal, off (lowercase)
 * @return Parsed level, or nullopt for an unknown name
 */
std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

} // namespace Inkwell::Core::Logging
