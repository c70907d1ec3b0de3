#include "LocalFileSystemBackend.h"
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace Inkwell::Core::IO {

namespace fs = std::filesystem;

namespace {
    std::error_code errnoCode(int err) {
        return std::error_code(err, std::generic_category());
    }

    // errno -> public taxonomy
    FileError classifyErrno(int err) {
        switch (err) {
            case ENOSPC:
#if defined(__unix__) || defined(__APPLE__)
            case EDQUOT:
#endif
                return FileError::DiskFull;
            case EACCES:
            case EPERM:
            case EROFS:
                return FileError::AccessDenied;
            case ENOENT:
                return FileError::FileNotFound;
            case EINVAL:
            case ENAMETOOLONG:
            case EISDIR:
            case ENOTDIR:
                return FileError::InvalidPath;
            default:
                return FileError::IOError;
        }
    }

    const char* writeFailureMessage(FileError code) {
        return code == FileError::DiskFull ? "Disk full or quota exceeded" : "Write operation failed";
    }

    // FIFOs, devices and sockets can block or never end; they are refused outright
    bool isSpecialFile(const fs::path& p) {
        std::error_code ec;
        const auto st = fs::status(p, ec);
        if (ec) return false;
        return fs::is_block_file(st) || fs::is_character_file(st) ||
               fs::is_fifo(st) || fs::is_socket(st);
    }

    // Hidden sibling of the destination so the final rename stays on one filesystem
    fs::path makeSiblingTempPath(const fs::path& target) {
        const auto dir = target.parent_path();
        const std::string stem = "." + target.filename().string();
#if defined(__unix__) || defined(__APPLE__)
        std::string pattern = (dir / (stem + ".XXXXXX")).string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');
        const int fd = ::mkstemp(name.data());
        if (fd >= 0) {
            ::close(fd);
            return fs::path(name.data());
        }
#endif
        return dir / (stem + ".tmp" + std::to_string(std::random_device{}()));
    }

    std::string octalPermissions(fs::perms perms) {
        const auto bits = static_cast<unsigned>(perms) & 0777u;
        return {static_cast<char>('0' + ((bits >> 6) & 7u)),
                static_cast<char>('0' + ((bits >> 3) & 7u)),
                static_cast<char>('0' + (bits & 7u))};
    }

    std::chrono::system_clock::time_point toSystemTime(fs::file_time_type ft) {
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            ft - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    }

    // Writes everything and flushes; returns 0 or the errno observed on failure
    int writeAndFlush(std::ofstream& out, std::span<const std::byte> data) {
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (out.good()) return 0;
        return errno != 0 ? errno : EIO;
    }

    // Forces file data to stable storage; returns 0 or errno
    int flushToDisk(const std::string& p) {
#if defined(__unix__) || defined(__APPLE__)
        const int fd = ::open(p.c_str(), O_WRONLY);
        if (fd < 0) return errno;
#if defined(__APPLE__)
        const int rc = ::fcntl(fd, F_FULLFSYNC) == 0 ? 0 : errno;
#elif defined(__linux__)
        const int rc = ::fdatasync(fd) == 0 ? 0 : errno;
#else
        const int rc = ::fsync(fd) == 0 ? 0 : errno;
#endif
        ::close(fd);
        return rc;
#else
        (void)p;
        return 0;
#endif
    }
}

void LocalFileSystemBackend::setOpenForWriteError(OpState& s, const std::string& p, int savedErrno) {
    std::error_code ec;
    const auto parent = fs::path(p).parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        s.fail(FileError::InvalidPath, "Parent directory does not exist", p, ec);
        return;
    }
    std::error_code statEc;
    (void)fs::status(p, statEc);
    if (statEc && statEc != std::errc::no_such_file_or_directory) {
        s.fail(FileError::InvalidPath, "Invalid path or unsupported filename", p, statEc);
        return;
    }
    auto code = classifyErrno(savedErrno);
    if (code == FileError::FileNotFound || code == FileError::IOError) code = FileError::AccessDenied;
    s.fail(code, "Cannot open file for writing", p, errnoCode(savedErrno));
}

void LocalFileSystemBackend::doReadFile(OpState& s, const std::string& p, const ReadOptions& options) {
    if (isSpecialFile(p)) {
        s.fail(FileError::InvalidPath, "Cannot read special files (FIFO, device, socket)", p);
        return;
    }
    std::error_code ec;
    if (fs::is_directory(p, ec)) {
        s.fail(FileError::InvalidPath, "Path is a directory", p);
        return;
    }

    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) {
        const int openErrno = errno;
        std::error_code existsEc;
        const bool present = fs::exists(p, existsEc);
        if (existsEc) {
            s.fail(FileError::InvalidPath, "Invalid path or unsupported filename", p, existsEc);
        } else if (!present) {
            s.fail(FileError::FileNotFound, "File not found", p);
        } else {
            s.fail(classifyErrno(openErrno), "Cannot open file for reading", p, errnoCode(openErrno));
        }
        return;
    }

    const auto size = fs::file_size(p, ec);
    if (ec) {
        s.fail(FileError::IOError, "Cannot determine file size", p, ec);
        return;
    }

    // Clamp [offset, offset + length) to the file
    const uint64_t available = size > options.offset ? size - options.offset : 0;
    const size_t want = options.length
        ? static_cast<size_t>(std::min<uint64_t>(*options.length, available))
        : static_cast<size_t>(available);

    s.bytes.resize(want);
    if (want > 0) {
        in.seekg(static_cast<std::streamoff>(options.offset), std::ios::beg);
        in.read(reinterpret_cast<char*>(s.bytes.data()), static_cast<std::streamsize>(want));
        if (in.bad()) {
            const int readErrno = errno;
            s.fail(classifyErrno(readErrno), "Read operation failed", p, errnoCode(readErrno));
            return;
        }
        s.bytes.resize(static_cast<size_t>(in.gcount()));
    }

    const bool shortRead = options.length && s.bytes.size() < *options.length;
    s.complete(shortRead ? FileOpStatus::Partial : FileOpStatus::Complete);
}

void LocalFileSystemBackend::doWriteFile(OpState& s, const std::string& p, std::span<const std::byte> data, const WriteOptions& options) {
    if (isSpecialFile(p)) {
        s.fail(FileError::InvalidPath, "Cannot write special files (FIFO, device, socket)", p);
        return;
    }

    std::error_code ec;
    if (options.createParentDirs) {
        const auto parent = fs::path(p).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                s.fail(FileError::IOError, "Failed to create parent directories", p, ec);
                return;
            }
        }
    }

    const bool existed = fs::is_regular_file(p, ec);
    if (!existed && !options.createIfMissing) {
        s.fail(FileError::FileNotFound, "File not found", p);
        return;
    }

    if (options.append) {
        doAppend(s, p, data, options, existed);
    } else if (options.atomicReplace && existed) {
        doAtomicReplace(s, p, data, options);
    } else {
        doTruncatingWrite(s, p, data, options);
    }
}

void LocalFileSystemBackend::doTruncatingWrite(OpState& s, const std::string& p, std::span<const std::byte> data, const WriteOptions& options) {
    int err = 0;
    {
        std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            setOpenForWriteError(s, p, errno);
            return;
        }
        err = writeAndFlush(out, data);
    }
    if (err == 0 && options.fsync) {
        err = flushToDisk(p);
    }
    if (err != 0) {
        const auto code = classifyErrno(err);
        s.fail(code, writeFailureMessage(code), p, errnoCode(err));
        return;
    }
    s.wrote = data.size();
    s.complete(FileOpStatus::Complete);
}

void LocalFileSystemBackend::doAppend(OpState& s, const std::string& p, std::span<const std::byte> data, const WriteOptions& options, bool existed) {
    std::error_code ec;
    const uintmax_t priorSize = existed ? fs::file_size(p, ec) : 0;
    if (ec) {
        s.fail(FileError::IOError, "Cannot determine file size before append", p, ec);
        return;
    }

    int err = 0;
    {
        std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::app);
        if (!out) {
            setOpenForWriteError(s, p, errno);
            return;
        }
        err = writeAndFlush(out, data);
    }
    if (err == 0 && options.fsync) {
        err = flushToDisk(p);
    }
    if (err == 0) {
        s.wrote = data.size();
        s.complete(FileOpStatus::Complete);
        return;
    }

    // Undo whatever part of the append reached the file
    std::error_code undoEc;
    if (existed) {
        fs::resize_file(p, priorSize, undoEc);
    } else {
        fs::remove(p, undoEc);
    }
    const auto code = classifyErrno(err);
    std::string msg = writeFailureMessage(code);
    if (undoEc) msg += " (rollback failed: " + undoEc.message() + ")";
    s.fail(code, msg, p, errnoCode(err));
}

void LocalFileSystemBackend::doAtomicReplace(OpState& s, const std::string& p, std::span<const std::byte> data, const WriteOptions& options) {
    const fs::path target(p);
    const fs::path temp = makeSiblingTempPath(target);
    std::error_code cleanupEc;

    int err = 0;
    {
        std::ofstream out(temp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            const int openErrno = errno;
            fs::remove(temp, cleanupEc);
            s.fail(classifyErrno(openErrno), "Cannot create temp file for replace", p, errnoCode(openErrno));
            return;
        }
        err = writeAndFlush(out, data);
    }
    if (err == 0 && options.fsync) {
        err = flushToDisk(temp.string());
    }
    if (err != 0) {
        fs::remove(temp, cleanupEc);
        const auto code = classifyErrno(err);
        s.fail(code, code == FileError::DiskFull ? writeFailureMessage(code) : "Failed to write temp file for replace",
               p, errnoCode(err));
        return;
    }

#if defined(__unix__) || defined(__APPLE__)
    // Keep the destination's mode bits
    struct stat st;
    if (::stat(target.c_str(), &st) == 0) {
        ::chmod(temp.c_str(), st.st_mode & 07777);
    }
#endif

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, cleanupEc);
        s.fail(FileError::IOError, "Failed to replace file with temp file", p, ec);
        return;
    }
    s.wrote = data.size();
    s.complete(FileOpStatus::Complete);
}

void LocalFileSystemBackend::doGetMetadata(OpState& s, const std::string& p) {
    std::error_code ec;
    const auto st = fs::status(p, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        s.fail(classifyErrno(ec.value()), "Cannot stat path", p, ec);
        return;
    }

    FileMetadata md;
    md.path = p;
    md.exists = !ec && fs::exists(st);

    std::error_code linkEc;
    md.isSymlink = fs::is_symlink(fs::symlink_status(p, linkEc)) && !linkEc;

    if (md.exists) {
        md.isDirectory = fs::is_directory(st);
        md.isRegularFile = fs::is_regular_file(st);
        md.permissions = octalPermissions(st.permissions());
        if (md.isRegularFile) {
            md.size = fs::file_size(p, ec);
            if (ec) {
                s.fail(FileError::IOError, "Cannot determine file size", p, ec);
                return;
            }
        }
        const auto mtime = fs::last_write_time(p, ec);
        if (!ec) md.lastModified = toSystemTime(mtime);
    }

    s.metadata = std::move(md);
    s.complete(FileOpStatus::Complete);
}

FileOperationHandle LocalFileSystemBackend::readFile(const std::string& path, ReadOptions options) {
    auto s = std::make_shared<OpState>();
    doReadFile(*s, path, options);
    return FileOperationHandle(std::move(s));
}

FileOperationHandle LocalFileSystemBackend::writeFile(const std::string& path, std::span<const std::byte> data, WriteOptions options) {
    auto s = std::make_shared<OpState>();
    doWriteFile(*s, path, data, options);
    return FileOperationHandle(std::move(s));
}

FileOperationHandle LocalFileSystemBackend::getMetadata(const std::string& path) {
    auto s = std::make_shared<OpState>();
    doGetMetadata(*s, path);
    return FileOperationHandle(std::move(s));
}

} // namespace Inkwell::Core::IO
