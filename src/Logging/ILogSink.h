#pragma once

#include <atomic>

#include "LogEntry.h"

namespace Inkwell::Core::Logging {

/**
 * @brief Destination for log entries
 *
 * Sinks carry their own minimum level in addition to the owning Logger's.
 * write() may be called concurrently from several threads; implementations
 * serialize internally.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool shouldLog(LogLevel level) const noexcept { return level >= minLevel(); }

private:
    std::atomic<LogLevel> _minLevel{LogLevel::Trace};
};

} // namespace Inkwell::Core::Logging
