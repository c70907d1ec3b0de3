#include "Logger.h"

#include <chrono>
#include <thread>

#include "../CoreCommon.h"
#include "ConsoleSink.h"

namespace Inkwell::Core::Logging {

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

Logger::Logger(std::string name)
    : _name(std::move(name)) {
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.push_back(std::move(sink));
}

void Logger::clearSinks() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (!isEnabled(level)) return;

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.category = category.empty() ? _name : std::string(category);
    entry.message = std::string(message);
    entry.threadId = std::this_thread::get_id();

    // Copy sink list so sinks can log back into this logger without deadlocking
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        sinks = _sinks;
    }
    for (auto& sink : sinks) {
        if (sink->shouldLog(level)) {
            sink->write(entry);
        }
    }
}

void Logger::flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        sinks = _sinks;
    }
    for (auto& sink : sinks) sink->flush();
}

Logger& Logger::global() {
    static Logger instance("inkwell");
    static std::once_flag configured;
    std::call_once(configured, [] {
        instance.addSink(std::make_shared<ConsoleSink>());
        if (auto env = safeGetEnv("INKWELL_LOG_LEVEL")) {
            if (auto lvl = parseLogLevel(*env)) instance.setMinLevel(*lvl);
        }
    });
    return instance;
}

} // namespace Inkwell::Core::Logging
