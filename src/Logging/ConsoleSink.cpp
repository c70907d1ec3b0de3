#include "ConsoleSink.h"

#include <chrono>
#include <ctime>
#include <string>

namespace Inkwell::Core::Logging {

namespace {
    std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
        using namespace std::chrono;
        const auto secs = time_point_cast<seconds>(tp);
        const auto millis = duration_cast<milliseconds>(tp - secs).count();
        const std::time_t t = system_clock::to_time_t(secs);
        std::tm utc{};
#if defined(_WIN32)
        gmtime_s(&utc, &t);
#else
        gmtime_r(&t, &utc);
#endif
        char date[32];
        std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
        char out[48];
        std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(millis));
        return out;
    }
}

void ConsoleSink::write(const LogEntry& entry) {
    if (!shouldLog(entry.level)) return;

    const auto ts = formatTimestamp(entry.timestamp);
    const auto level = toString(entry.level);

    std::lock_guard<std::mutex> lock(_mutex);
    std::fprintf(_stream, "[%s] [%s] [%.*s] %s\n",
                 ts.c_str(),
                 entry.category.c_str(),
                 static_cast<int>(level.size()), level.data(),
                 entry.message.c_str());
    if (entry.level >= LogLevel::Error) {
        std::fflush(_stream);
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::fflush(_stream);
}

} // namespace Inkwell::Core::Logging
