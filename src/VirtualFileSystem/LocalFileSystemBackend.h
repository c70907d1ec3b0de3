#pragma once
#include "IFileSystemBackend.h"

namespace Inkwell::Core::IO {

/**
 * @brief Backend over the host filesystem (std::filesystem + fstream)
 *
 * Appends are all-or-nothing from the caller's perspective: if a write fails
 * after some bytes reached the file, the file is truncated back to the size it
 * had before the call (or removed if the call created it). Whole-file rewrites
 * with WriteOptions::atomicReplace go through a sibling temp file and rename,
 * preserving the destination's permission bits.
 *
 * No per-path locking is performed; concurrent writers to one path race.
 */
class LocalFileSystemBackend : public IFileSystemBackend {
public:
    LocalFileSystemBackend() = default;
    ~LocalFileSystemBackend() override = default;

    FileOperationHandle readFile(const std::string& path, ReadOptions options = {}) override;
    FileOperationHandle writeFile(const std::string& path, std::span<const std::byte> data, WriteOptions options = {}) override;
    FileOperationHandle getMetadata(const std::string& path) override;

    std::string getBackendType() const override { return "LocalFileSystem"; }

private:
    using OpState = FileOperationHandle::OpState;

    void doReadFile(OpState& s, const std::string& p, const ReadOptions& options);
    void doWriteFile(OpState& s, const std::string& p, std::span<const std::byte> data, const WriteOptions& options);
    void doTruncatingWrite(OpState& s, const std::string& p, std::span<const std::byte> data, const WriteOptions& options);
    void doAppend(OpState& s, const std::string& p, std::span<const std::byte> data, const WriteOptions& options, bool existed);
    void doAtomicReplace(OpState& s, const std::string& p, std::span<const std::byte> data, const WriteOptions& options);
    void doGetMetadata(OpState& s, const std::string& p);
    // Classify a failed open for writing
    void setOpenForWriteError(OpState& s, const std::string& p, int savedErrno);
};

} // namespace Inkwell::Core::IO
