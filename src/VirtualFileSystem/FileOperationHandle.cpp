#include "FileOperationHandle.h"

namespace Inkwell::Core::IO {

const char* toString(FileError code) noexcept {
    switch (code) {
        case FileError::None: return "None";
        case FileError::FileNotFound: return "FileNotFound";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::DiskFull: return "DiskFull";
        case FileError::InvalidPath: return "InvalidPath";
        case FileError::InvalidArgument: return "InvalidArgument";
        case FileError::IOError: return "IOError";
        case FileError::Unknown: return "Unknown";
    }
    return "Unknown";
}

FileOpStatus FileOperationHandle::status() const noexcept {
    return _s ? _s->st : FileOpStatus::Pending;
}

std::span<const std::byte> FileOperationHandle::contentsBytes() const {
    if (!_s) return {};
    return std::span<const std::byte>(_s->bytes.data(), _s->bytes.size());
}

std::string FileOperationHandle::contentsText() const {
    if (!_s) return {};
    return std::string(reinterpret_cast<const char*>(_s->bytes.data()), _s->bytes.size());
}

uint64_t FileOperationHandle::bytesWritten() const {
    return _s ? _s->wrote : 0ULL;
}

const FileErrorInfo& FileOperationHandle::errorInfo() const {
    static const FileErrorInfo emptyError;
    if (!_s) return emptyError;
    return _s->error;
}

const std::optional<FileMetadata>& FileOperationHandle::metadata() const {
    static const std::optional<FileMetadata> empty;
    if (!_s) return empty;
    return _s->metadata;
}

FileOperationHandle FileOperationHandle::immediate(FileOpStatus status) {
    auto state = std::make_shared<OpState>();
    state->complete(status);
    return FileOperationHandle(state);
}

FileOperationHandle FileOperationHandle::failure(FileError code, std::string message, std::string path,
                                                 std::optional<std::error_code> ec) {
    auto state = std::make_shared<OpState>();
    state->fail(code, message, path, ec);
    return FileOperationHandle(state);
}

FileOperationHandle FileOperationHandle::written(uint64_t bytes) {
    auto state = std::make_shared<OpState>();
    state->wrote = bytes;
    state->complete(FileOpStatus::Complete);
    return FileOperationHandle(state);
}

} // namespace Inkwell::Core::IO
