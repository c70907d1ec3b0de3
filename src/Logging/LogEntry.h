#pragma once

#include <chrono>
#include <string>
#include <thread>

#include "LogLevel.h"

namespace Inkwell::Core::Logging {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Info;
    std::string category;
    std::string message;
    std::thread::id threadId;
};

} // namespace Inkwell::Core::Logging
