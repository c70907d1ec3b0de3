/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#include "IncrementalAppendEngine.h"

#include <format>

#include "Logging/Logger.h"
#include "VirtualFileSystem/IFileSystemBackend.h"

namespace Inkwell::Core::IO {

namespace {
constexpr const char* kCategory = "IncrementalAppend";
}

IncrementalAppendEngine::IncrementalAppendEngine(IFileSystemBackend& backend, const WriteConfig& config,
                                                 Logging::Logger& logger)
    : _backend(backend)
    , _config(config)
    , _logger(logger)
    , _tailReader(backend, config, logger) {}

FileOperationHandle IncrementalAppendEngine::mergeAppend(const std::string& path, std::string_view content) {
    return mergeAppend(path, content, static_cast<int64_t>(_config.initialChunkSize));
}

FileOperationHandle IncrementalAppendEngine::mergeAppend(const std::string& path, std::string_view content,
                                                         int64_t initialChunkSize) {
    AppendPlan p;
    auto planned = plan(path, content, initialChunkSize, p);
    if (planned.status() == FileOpStatus::Failed) {
        return planned;
    }
    return execute(p);
}

FileOperationHandle IncrementalAppendEngine::plan(const std::string& path, std::string_view content,
                                                  int64_t initialChunkSize, AppendPlan& out) {
    out = AppendPlan{};
    out.path = path;

    if (initialChunkSize <= 0) {
        return FileOperationHandle::failure(FileError::InvalidArgument,
                                            std::format("Chunk size must be positive, got {}", initialChunkSize),
                                            path);
    }

    auto meta = _backend.getMetadata(path);
    if (meta.status() == FileOpStatus::Failed) {
        return meta;
    }
    const auto& md = meta.metadata();
    if (!md || !md->exists) {
        out.createFile = true;
        out.bytesToAppend = content;
        return FileOperationHandle::immediate(FileOpStatus::Complete);
    }
    if (md->isDirectory) {
        return FileOperationHandle::failure(FileError::InvalidPath, "Path is a directory", path);
    }

    auto scanned = _tailReader.scan(path, md->size, content, static_cast<size_t>(initialChunkSize), out.scan);
    if (scanned.status() == FileOpStatus::Failed) {
        if (scanned.errorInfo().code != FileError::FileNotFound) {
            return scanned;
        }
        // Removed after the stat; there is no existing content to merge with
        _logger.info(kCategory, std::format("{} disappeared before its tail was read; creating it", path));
        out.createFile = true;
        out.overlap = 0;
        out.bytesToAppend = content;
        return FileOperationHandle::immediate(FileOpStatus::Complete);
    }
    out.overlap = out.scan.overlap;
    out.bytesToAppend = content.substr(out.overlap);
    return FileOperationHandle::immediate(FileOpStatus::Complete);
}

FileOperationHandle IncrementalAppendEngine::execute(const AppendPlan& plan) {
    WriteOptions wo;
    wo.fsync = _config.fsync;
    wo.createParentDirs = _config.createParentDirs;

    if (plan.createFile) {
        _logger.info(kCategory, std::format("Creating {} with {} bytes", plan.path, plan.bytesToAppend.size()));
        wo.append = false;
        wo.createIfMissing = true;
        return _backend.writeFile(plan.path, asBytes(plan.bytesToAppend), wo);
    }

    if (plan.bytesToAppend.empty()) {
        _logger.info(kCategory, std::format("{} already ends with the submitted content ({} bytes overlap)",
                                            plan.path, plan.overlap));
        return FileOperationHandle::written(0);
    }

    _logger.info(kCategory, std::format("Appending {} bytes to {} (skipped {} overlapping)",
                                        plan.bytesToAppend.size(), plan.path, plan.overlap));
    wo.append = true;
    wo.createIfMissing = false;
    return _backend.writeFile(plan.path, asBytes(plan.bytesToAppend), wo);
}

} // namespace Inkwell::Core::IO
