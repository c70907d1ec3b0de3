/**
 * @file IFileSystemBackend.h
 * @brief Backend interface for the write subsystem and read verbs
 *
 * Implementations provide concrete file operations. The local filesystem backend
 * is the production implementation; tests substitute backends that inject faults.
 * Every operation completes before returning and reports failures through
 * FileOperationHandle::errorInfo() rather than by throwing.
 */
#pragma once
#include <string>
#include <span>
#include <optional>
#include <cstddef>
#include <cstdint>
#include "FileOperationHandle.h"

namespace Inkwell::Core::IO {

/**
 * @brief Byte range of a read
 *
 * The range is clamped to the file; without a length the read runs to EOF.
 */
struct ReadOptions {
    uint64_t offset = 0;
    std::optional<size_t> length;
};

/**
 * @brief How writeFile() lands bytes on disk
 * @param append Append to end of file; on failure the file is truncated back to its prior size
 * @param createIfMissing Create the file if it does not exist
 * @param atomicReplace Whole-file rewrite through a sibling temp file and rename (ignored if append=true)
 * @param createParentDirs Create missing parent directories
 * @param fsync Force data to disk before reporting success (POSIX only)
 */
struct WriteOptions {
    bool append = false;
    bool createIfMissing = true;
    bool atomicReplace = false;
    bool createParentDirs = false;
    bool fsync = false;
};

class IFileSystemBackend {
public:
    virtual ~IFileSystemBackend() = default;

    /**
     * @brief Returns the requested byte range of a regular file
     *
     * Status is Partial when a length was given and fewer bytes were available.
     * FIFOs, devices and sockets fail with FileError::InvalidPath.
     */
    virtual FileOperationHandle readFile(const std::string& path, ReadOptions options = {}) = 0;
    // bytesWritten() on success equals data.size(); a failed append leaves the file as it was
    virtual FileOperationHandle writeFile(const std::string& path, std::span<const std::byte> data, WriteOptions options = {}) = 0;
    /**
     * @brief Retrieves metadata for a path
     * @return Handle whose metadata() is populated; a missing path completes with exists=false
     */
    virtual FileOperationHandle getMetadata(const std::string& path) = 0;

    virtual std::string getBackendType() const = 0;
};

} // namespace Inkwell::Core::IO
