/**
 * @file VirtualFileSystem.h
 * @brief High-level facade for the file-access verbs over a pluggable backend
 *
 * VirtualFileSystem (VFS) owns the backend and the write subsystem, and exposes
 * the verbs a transport maps requests onto: write, append, smartAppend, read,
 * streamRead and stat. Paths arrive already validated against the sandbox; the
 * VFS only rejects empty and relative paths. See Examples/IncrementalWriteExample.cpp
 * for end-to-end usage.
 *
 * Every verb completes before returning. Writes to the same path from several
 * threads are not serialized.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "FileOperationHandle.h"
#include "IFileSystemBackend.h"
#include "IncrementalWrite/IncrementalAppendEngine.h"
#include "IncrementalWrite/WriteConfig.h"
#include "IncrementalWrite/WriteStrategySelector.h"

namespace Inkwell::Core::Logging { class Logger; }

namespace Inkwell::Core::IO {

class VirtualFileSystem {
public:
    struct Config {
        WriteConfig write;                  // write subsystem and read-verb tunables

        Config() = default;
    };

    /**
     * @brief Creates a VFS over the local filesystem
     * @param logger Receives decisions and failures from every component
     * @param cfg Tunables; copied
     */
    explicit VirtualFileSystem(Logging::Logger& logger, Config cfg = {});
    /**
     * @brief Creates a VFS over a caller-supplied backend
     */
    VirtualFileSystem(std::shared_ptr<IFileSystemBackend> backend, Logging::Logger& logger, Config cfg = {});
    ~VirtualFileSystem();

    VirtualFileSystem(const VirtualFileSystem&) = delete;
    VirtualFileSystem& operator=(const VirtualFileSystem&) = delete;

    // Write verbs
    /**
     * @brief Whole-file write; the selector may still choose a merge
     *
     * Requests Overwrite with fullRewrite set. Text without the completion marker
     * is merged instead, and the result says so.
     */
    WriteResult write(const std::string& path, std::string content, bool binary = false);
    /**
     * @brief Plain append request; subject to the same selection rules as write
     */
    WriteResult append(const std::string& path, std::string content);
    /**
     * @brief Forces IncrementalMerge
     * @param chunkSize Initial tail window; defaults to WriteConfig::initialChunkSize
     */
    WriteResult smartAppend(const std::string& path, std::string content, std::optional<int64_t> chunkSize = std::nullopt);
    /**
     * @brief Runs an arbitrary request through the selector
     */
    WriteResult submit(const WriteRequest& request);

    // Read verbs
    /**
     * @brief Reads a whole file, or only its head if it exceeds largeFileThreshold
     *
     * A truncated read completes as Partial and its text ends with a notice of
     * the form "[Warning: file too large (N KB), showing only the first M KB of N KB]".
     */
    FileOperationHandle read(const std::string& path);
    /**
     * @brief Reads [offset, offset + limit) in streamChunkSize pieces
     * @return InvalidArgument if offset is at or past the end of the file
     */
    FileOperationHandle streamRead(const std::string& path, uint64_t offset, std::optional<size_t> limit = std::nullopt);
    /**
     * @brief Size, modification time, type and octal permissions of a path
     * @return FileNotFound if the path does not exist
     */
    FileOperationHandle stat(const std::string& path);

    std::shared_ptr<IFileSystemBackend> getBackend() const { return _backend; }
    const Config& config() const noexcept { return _cfg; }

private:
    std::optional<FileOperationHandle> validatePath(const std::string& path) const;
    FileOperationHandle requireRegularFile(const std::string& path, FileMetadata& out);

    std::shared_ptr<IFileSystemBackend> _backend;
    Config _cfg;
    Logging::Logger& _logger;
    std::unique_ptr<IncrementalAppendEngine> _engine;
    std::unique_ptr<WriteStrategySelector> _selector;
};

} // namespace Inkwell::Core::IO
