#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "Inkwell.h"

namespace inkwell::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir() {
        namespace fs = std::filesystem;
        auto base = fs::temp_directory_path();
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto rnd = gen();
        std::ostringstream oss;
        oss << "InkwellVFS_Test_" << std::hex << now << "_" << rnd;
        _path = base / oss.str();
        std::error_code ec;
        fs::create_directories(_path, ec);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);  // best-effort cleanup
    }

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::filesystem::path join(const std::string& name) const {
        return _path / name;
    }

private:
    std::filesystem::path _path;
};

// Sink that keeps every entry for later inspection
class CapturingSink : public Inkwell::Core::Logging::ILogSink
{
public:
    void write(const Inkwell::Core::Logging::LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back(entry);
    }
    void flush() override {}

    std::vector<Inkwell::Core::Logging::LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }
    size_t count(Inkwell::Core::Logging::LogLevel level) const;
    bool contains(const std::string& needle) const;

private:
    mutable std::mutex _mutex;
    std::vector<Inkwell::Core::Logging::LogEntry> _entries;
};

// Logger with a CapturingSink attached and Trace enabled
class ScopedTestLogger
{
public:
    ScopedTestLogger()
        : _logger("test"),
          _sink(std::make_shared<CapturingSink>()) {
        _logger.setMinLevel(Inkwell::Core::Logging::LogLevel::Trace);
        _logger.addSink(_sink);
    }

    Inkwell::Core::Logging::Logger& logger() noexcept {
        return _logger;
    }
    CapturingSink& sink() noexcept {
        return *_sink;
    }

private:
    Inkwell::Core::Logging::Logger _logger;
    std::shared_ptr<CapturingSink> _sink;
};

/**
 * Backend that forwards to LocalFileSystemBackend but can be told to fail.
 *
 * - failWholeReads: reads without an explicit length fail with IOError
 * - failReadsAfter: every read after the first N fails with IOError (negative disables)
 * - failAppends / failOverwrites: writes fail with DiskFull before touching the file
 * - removeBeforeRead: the target is deleted just before each read is forwarded
 * All requested read windows are recorded.
 */
class FaultInjectingBackend : public Inkwell::Core::IO::IFileSystemBackend
{
public:
    bool failWholeReads = false;
    int failReadsAfter = -1;
    bool failAppends = false;
    bool failOverwrites = false;
    bool failMetadata = false;
    bool removeBeforeRead = false;

    Inkwell::Core::IO::FileOperationHandle readFile(const std::string& path, Inkwell::Core::IO::ReadOptions options = {}) override;
    Inkwell::Core::IO::FileOperationHandle writeFile(const std::string& path, std::span<const std::byte> data,
                                                    Inkwell::Core::IO::WriteOptions options = {}) override;
    Inkwell::Core::IO::FileOperationHandle getMetadata(const std::string& path) override;
    std::string getBackendType() const override {
        return "FaultInjecting";
    }

    const std::vector<Inkwell::Core::IO::ReadOptions>& reads() const noexcept {
        return _reads;
    }
    size_t writeCount() const noexcept {
        return _writes;
    }

private:
    Inkwell::Core::IO::LocalFileSystemBackend _inner;
    std::vector<Inkwell::Core::IO::ReadOptions> _reads;
    size_t _writes = 0;
};

std::string readAllBytes(const std::filesystem::path& p);
void writeAllBytes(const std::filesystem::path& p, const std::string& data);

}  // namespace inkwell::test_helpers
