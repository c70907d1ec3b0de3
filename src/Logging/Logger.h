/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

/**
 * @file Logger.h
 * @brief Named logger fanning entries out to sinks
 *
 * Components that make policy decisions (the write selector, the append engine,
 * the tail reader) take a Logger& at construction so that verbosity is a
 * per-instance setting. Logger::global() exists for examples and for the
 * INKWELL_LOG_* convenience macros.
 *
 * @code
 * Logger logger("writes");
 * logger.addSink(std::make_shared<ConsoleSink>());
 * logger.setMinLevel(LogLevel::Debug);
 * logger.debug("TailReader", "window grown to 2048 bytes");
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogLevel.h"

namespace Inkwell::Core::Logging {

class Logger {
public:
    explicit Logger(std::string name);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void addSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool isEnabled(LogLevel level) const noexcept { return level != LogLevel::Off && level >= minLevel(); }

    void log(LogLevel level, std::string_view category, std::string_view message);

    void trace(std::string_view category, std::string_view message) { log(LogLevel::Trace, category, message); }
    void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
    void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
    void warning(std::string_view category, std::string_view message) { log(LogLevel::Warning, category, message); }
    void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }
    void fatal(std::string_view category, std::string_view message) { log(LogLevel::Fatal, category, message); }

    void flush();

    const std::string& name() const noexcept { return _name; }

    /**
     * @brief Process-wide logger with a ConsoleSink attached
     *
     * Minimum level is read once from INKWELL_LOG_LEVEL (default info).
     */
    static Logger& global();

private:
    std::string _name;
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
    mutable std::mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

} // namespace Inkwell::Core::Logging

// Convenience macros routed to Logger::global(); category defaults to the calling function
#define INKWELL_LOG_TRACE(msg) ::Inkwell::Core::Logging::Logger::global().trace(__func__, (msg))
#define INKWELL_LOG_DEBUG(msg) ::Inkwell::Core::Logging::Logger::global().debug(__func__, (msg))
#define INKWELL_LOG_INFO(msg) ::Inkwell::Core::Logging::Logger::global().info(__func__, (msg))
#define INKWELL_LOG_WARNING(msg) ::Inkwell::Core::Logging::Logger::global().warning(__func__, (msg))
#define INKWELL_LOG_ERROR(msg) ::Inkwell::Core::Logging::Logger::global().error(__func__, (msg))
#define INKWELL_LOG_FATAL(msg) ::Inkwell::Core::Logging::Logger::global().fatal(__func__, (msg))

#define INKWELL_LOG_TRACE_CAT(cat, msg) ::Inkwell::Core::Logging::Logger::global().trace((cat), (msg))
#define INKWELL_LOG_DEBUG_CAT(cat, msg) ::Inkwell::Core::Logging::Logger::global().debug((cat), (msg))
#define INKWELL_LOG_INFO_CAT(cat, msg) ::Inkwell::Core::Logging::Logger::global().info((cat), (msg))
#define INKWELL_LOG_WARNING_CAT(cat, msg) ::Inkwell::Core::Logging::Logger::global().warning((cat), (msg))
#define INKWELL_LOG_ERROR_CAT(cat, msg) ::Inkwell::Core::Logging::Logger::global().error((cat), (msg))
#define INKWELL_LOG_FATAL_CAT(cat, msg) ::Inkwell::Core::Logging::Logger::global().fatal((cat), (msg))
