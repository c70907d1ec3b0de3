#include "VirtualFileSystem.h"
#include "LocalFileSystemBackend.h"
#include "Logging/Logger.h"
#include <algorithm>
#include <filesystem>
#include <format>

namespace Inkwell::Core::IO {

namespace {
    constexpr const char* kCategory = "VirtualFileSystem";

    // Kilobytes rounded to nearest, as shown to agents
    uint64_t roundedKiB(uint64_t bytes) {
        return (bytes + 512) / 1024;
    }
}

VirtualFileSystem::VirtualFileSystem(Logging::Logger& logger, Config cfg)
    : VirtualFileSystem(std::make_shared<LocalFileSystemBackend>(), logger, std::move(cfg)) {}

VirtualFileSystem::VirtualFileSystem(std::shared_ptr<IFileSystemBackend> backend, Logging::Logger& logger, Config cfg)
    : _backend(std::move(backend))
    , _cfg(std::move(cfg))
    , _logger(logger) {
    if (!_backend) {
        _backend = std::make_shared<LocalFileSystemBackend>();
    }
    _engine = std::make_unique<IncrementalAppendEngine>(*_backend, _cfg.write, _logger);
    _selector = std::make_unique<WriteStrategySelector>(*_backend, *_engine, _cfg.write, _logger);
    _logger.debug(kCategory, std::format("Using backend {}", _backend->getBackendType()));
}

VirtualFileSystem::~VirtualFileSystem() = default;

std::optional<FileOperationHandle> VirtualFileSystem::validatePath(const std::string& path) const {
    if (path.empty()) {
        return FileOperationHandle::failure(FileError::InvalidArgument, "Path must not be empty");
    }
    if (!std::filesystem::path(path).is_absolute()) {
        return FileOperationHandle::failure(FileError::InvalidArgument,
                                            std::format("Path must be absolute: {}", path), path);
    }
    return std::nullopt;
}

WriteResult VirtualFileSystem::write(const std::string& path, std::string content, bool binary) {
    WriteRequest req;
    req.path = path;
    req.content = std::move(content);
    req.binaryPayload = binary;
    req.requestedStrategy = WriteStrategy::Overwrite;
    req.fullRewrite = true;
    return submit(req);
}

WriteResult VirtualFileSystem::append(const std::string& path, std::string content) {
    WriteRequest req;
    req.path = path;
    req.content = std::move(content);
    req.requestedStrategy = WriteStrategy::Append;
    return submit(req);
}

WriteResult VirtualFileSystem::smartAppend(const std::string& path, std::string content, std::optional<int64_t> chunkSize) {
    WriteRequest req;
    req.path = path;
    req.content = std::move(content);
    req.requestedStrategy = WriteStrategy::IncrementalMerge;
    req.overrideStrategy = true;
    req.chunkSize = chunkSize;
    return submit(req);
}

WriteResult VirtualFileSystem::submit(const WriteRequest& request) {
    return _selector->apply(request);
}

FileOperationHandle VirtualFileSystem::requireRegularFile(const std::string& path, FileMetadata& out) {
    auto meta = _backend->getMetadata(path);
    if (meta.status() == FileOpStatus::Failed) {
        return meta;
    }
    if (!meta.metadata() || !meta.metadata()->exists) {
        return FileOperationHandle::failure(FileError::FileNotFound, "File not found", path);
    }
    if (meta.metadata()->isDirectory) {
        return FileOperationHandle::failure(FileError::InvalidPath, "Path is a directory", path);
    }
    out = *meta.metadata();
    return meta;
}

FileOperationHandle VirtualFileSystem::read(const std::string& path) {
    if (auto invalid = validatePath(path)) return *invalid;

    FileMetadata md;
    auto checked = requireRegularFile(path, md);
    if (checked.status() == FileOpStatus::Failed) return checked;

    const uint64_t limit = _cfg.write.largeFileThreshold;
    if (md.size <= limit) {
        return _backend->readFile(path);
    }

    _logger.info(kCategory, std::format("Large file ({} bytes), returning only the first {} bytes of {}",
                                        md.size, limit, path));
    ReadOptions ro;
    ro.length = static_cast<size_t>(limit);
    auto head = _backend->readFile(path, ro);
    if (head.status() == FileOpStatus::Failed) return head;

    const std::string notice = std::format(
        "\n\n[Warning: file too large ({} KB), showing only the first {} KB of {} KB]",
        roundedKiB(md.size), roundedKiB(limit), roundedKiB(md.size));

    auto state = std::make_shared<FileOperationHandle::OpState>();
    auto bytes = head.contentsBytes();
    state->bytes.assign(bytes.begin(), bytes.end());
    auto extra = asBytes(notice);
    state->bytes.insert(state->bytes.end(), extra.begin(), extra.end());
    state->complete(FileOpStatus::Partial);
    return FileOperationHandle(state);
}

FileOperationHandle VirtualFileSystem::streamRead(const std::string& path, uint64_t offset, std::optional<size_t> limit) {
    if (auto invalid = validatePath(path)) return *invalid;

    FileMetadata md;
    auto checked = requireRegularFile(path, md);
    if (checked.status() == FileOpStatus::Failed) return checked;

    if (offset >= md.size) {
        return FileOperationHandle::failure(FileError::InvalidArgument,
                                            std::format("Offset {} exceeds file size {}", offset, md.size), path);
    }

    const uint64_t remaining = md.size - offset;
    const uint64_t toRead = limit ? std::min<uint64_t>(*limit, remaining) : remaining;
    const size_t piece = std::max<size_t>(_cfg.write.streamChunkSize, 1);
    _logger.debug(kCategory, std::format("Stream reading {} bytes from offset {} in {}", toRead, offset, path));

    auto state = std::make_shared<FileOperationHandle::OpState>();
    state->bytes.reserve(static_cast<size_t>(toRead));
    uint64_t done = 0;
    while (done < toRead) {
        ReadOptions ro;
        ro.offset = offset + done;
        ro.length = static_cast<size_t>(std::min<uint64_t>(piece, toRead - done));
        auto chunk = _backend->readFile(path, ro);
        if (chunk.status() == FileOpStatus::Failed) return chunk;

        auto bytes = chunk.contentsBytes();
        if (bytes.empty()) break;   // file shrank underneath us
        state->bytes.insert(state->bytes.end(), bytes.begin(), bytes.end());
        done += bytes.size();
    }
    state->complete(done < toRead ? FileOpStatus::Partial : FileOpStatus::Complete);
    return FileOperationHandle(state);
}

FileOperationHandle VirtualFileSystem::stat(const std::string& path) {
    if (auto invalid = validatePath(path)) return *invalid;

    auto meta = _backend->getMetadata(path);
    if (meta.status() == FileOpStatus::Failed) return meta;
    if (!meta.metadata() || !meta.metadata()->exists) {
        return FileOperationHandle::failure(FileError::FileNotFound, "File not found", path);
    }
    return meta;
}

} // namespace Inkwell::Core::IO
