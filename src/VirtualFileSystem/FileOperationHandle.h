#pragma once
#include <memory>
#include <vector>
#include <string>
#include <span>
#include <string_view>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <chrono>

namespace Inkwell::Core::IO {

enum class FileOpStatus { Pending, Complete, Partial, Failed };

/**
 * Public error taxonomy surfaced by file operations.
 * Mapping guidelines:
 * - FileNotFound: path does not exist when required (read/stat)
 * - AccessDenied: open/create denied by OS/permissions
 * - DiskFull: ENOSPC/EDQUOT or equivalent on write/flush
 * - InvalidPath: malformed path, name too long, parent missing, special file
 * - InvalidArgument: request rejected before any I/O (zero chunk size, relative path, bad offset)
 * - IOError: other local I/O failures (including fsync failures)
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    DiskFull,
    InvalidPath,
    InvalidArgument,
    IOError,
    Unknown
};

const char* toString(FileError code) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;
};

struct FileMetadata {
    std::string path;
    bool exists = false;
    bool isDirectory = false;
    bool isRegularFile = false;
    bool isSymlink = false;
    uintmax_t size = 0;
    std::optional<std::chrono::system_clock::time_point> lastModified;
    std::string permissions; // three octal digits, e.g. "644"
};

/**
 * @brief Result of a single file operation
 *
 * Operations run to completion before the handle is returned, so status() is
 * never Pending for a handle produced by a backend. The handle is cheap to copy;
 * copies share the same result state.
 */
class FileOperationHandle {
public:
    FileOperationHandle() = default;

    FileOpStatus status() const noexcept;
    bool succeeded() const noexcept {
        auto st = status();
        return st == FileOpStatus::Complete || st == FileOpStatus::Partial;
    }

    // Read results
    std::span<const std::byte> contentsBytes() const;
    std::string contentsText() const;

    // Write results
    uint64_t bytesWritten() const;

    // Metadata results
    const std::optional<FileMetadata>& metadata() const;

    // Error information - meaningful when status is Failed
    const FileErrorInfo& errorInfo() const;

    // Factories for results produced without touching a backend
    static FileOperationHandle immediate(FileOpStatus status);
    static FileOperationHandle failure(FileError code, std::string message, std::string path = {},
                                       std::optional<std::error_code> ec = std::nullopt);
    static FileOperationHandle written(uint64_t bytes);

private:
    struct OpState {
        FileOpStatus st = FileOpStatus::Pending;

        std::vector<std::byte> bytes;          // for reads
        uint64_t wrote = 0;                    // for writes
        FileErrorInfo error;                   // error details if failed
        std::optional<FileMetadata> metadata;  // for metadata queries

        void complete(FileOpStatus final) noexcept { st = final; }

        void setError(FileError code, const std::string& msg,
                      const std::string& path = "",
                      std::optional<std::error_code> ec = std::nullopt) {
            error.code = code;
            error.message = msg;
            error.path = path;
            error.systemError = ec;
        }

        // setError + complete(Failed)
        void fail(FileError code, const std::string& msg, const std::string& path,
                  std::optional<std::error_code> ec = std::nullopt) {
            bytes.clear();
            setError(code, msg, path, ec);
            complete(FileOpStatus::Failed);
        }
    };

    std::shared_ptr<OpState> _s;
    explicit FileOperationHandle(std::shared_ptr<OpState> s) : _s(std::move(s)) {}

    friend class LocalFileSystemBackend;
    friend class VirtualFileSystem;
};

// Byte view over text without copying
inline std::span<const std::byte> asBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

} // namespace Inkwell::Core::IO
