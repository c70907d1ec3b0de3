#pragma once

#include <cstdio>
#include <mutex>

#include "ILogSink.h"

namespace Inkwell::Core::Logging {

/**
 * @brief Writes formatted entries to stderr
 *
 * Output format: `[2025-01-31T12:00:00.000Z] [category] [level] message`.
 * stdout is never used so that a transport speaking a protocol over stdout
 * is not corrupted by diagnostics.
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::FILE* stream = stderr) : _stream(stream) {}

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::FILE* _stream;
    std::mutex _mutex;
};

} // namespace Inkwell::Core::Logging
