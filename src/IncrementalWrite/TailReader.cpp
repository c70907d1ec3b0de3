/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#include "TailReader.h"

#include <algorithm>
#include <format>

#include "OverlapDetector.h"
#include "Logging/Logger.h"
#include "VirtualFileSystem/IFileSystemBackend.h"

namespace Inkwell::Core::IO {

namespace {
constexpr const char* kCategory = "TailReader";

size_t compareWindow(std::string_view window, std::string_view content, size_t smallThreshold,
                     size_t minHashLength) noexcept {
    const OverlapFunction overlap = selectOverlapAlgorithm(window.size(), smallThreshold);
    return overlap(window, content, minHashLength);
}
}

const char* toString(TailScanMode mode) noexcept {
    switch (mode) {
        case TailScanMode::WholeWindow: return "WholeWindow";
        case TailScanMode::Chunked: return "Chunked";
    }
    return "Unknown";
}

TailReader::TailReader(IFileSystemBackend& backend, const WriteConfig& config, Logging::Logger& logger)
    : _backend(backend), _config(config), _logger(logger) {}

FileOperationHandle TailReader::scan(const std::string& path, uint64_t fileSize, std::string_view content,
                                     size_t initialChunkSize, TailScanResult& out) {
    out = TailScanResult{};
    if (initialChunkSize == 0) {
        return FileOperationHandle::failure(FileError::InvalidArgument, "Chunk size must be positive", path);
    }
    if (fileSize == 0 || content.empty()) {
        out.mode = TailScanMode::WholeWindow;
        return FileOperationHandle::immediate(FileOpStatus::Complete);
    }

    const size_t smallThreshold = initialChunkSize * 4;
    if (fileSize <= _config.fullReadCeilingBytes || content.size() <= smallThreshold) {
        auto whole = scanWhole(path, fileSize, content, smallThreshold, out);
        if (whole.status() != FileOpStatus::Failed) {
            return whole;
        }
        const auto& err = whole.errorInfo();
        _logger.warning(kCategory, std::format("Whole-window read of {} failed ({}: {}); switching to chunked reads",
                                               path, toString(err.code), err.message));
        out = TailScanResult{};
        out.fellBack = true;
    }
    return scanChunked(path, fileSize, content, initialChunkSize, out);
}

FileOperationHandle TailReader::scanWhole(const std::string& path, uint64_t fileSize, std::string_view content,
                                          size_t smallThreshold, TailScanResult& out) {
    out.mode = TailScanMode::WholeWindow;

    ReadOptions ro;
    if (fileSize > _config.fullReadCeilingBytes) {
        // Overlap cannot exceed the content length, so the last |content| bytes suffice
        const uint64_t window = std::min<uint64_t>(content.size(), fileSize);
        ro.offset = fileSize - window;
        ro.length = static_cast<size_t>(window);
    }
    out.windows.push_back(ro.length ? *ro.length : static_cast<size_t>(fileSize));

    auto read = _backend.readFile(path, ro);
    if (read.status() == FileOpStatus::Failed) {
        return read;
    }
    const std::string existing = read.contentsText();
    out.overlap = compareWindow(existing, content, smallThreshold, _config.minHashOverlap);

    _logger.debug(kCategory, std::format("Whole-window scan of {} ({} bytes): overlap {}",
                                         path, existing.size(), out.overlap));
    return FileOperationHandle::immediate(FileOpStatus::Complete);
}

FileOperationHandle TailReader::scanChunked(const std::string& path, uint64_t fileSize, std::string_view content,
                                            size_t initialChunkSize, TailScanResult& out) {
    out.mode = TailScanMode::Chunked;

    const size_t maxWindow = std::max<size_t>(_config.maxChunkSize, 1);
    size_t window = std::min(initialChunkSize, maxWindow);
    size_t growth = 0;

    for (;;) {
        out.windows.push_back(window);

        const uint64_t covered = std::min<uint64_t>(window, fileSize);
        ReadOptions ro;
        ro.offset = fileSize - covered;
        ro.length = static_cast<size_t>(covered);
        auto read = _backend.readFile(path, ro);
        if (read.status() == FileOpStatus::Failed) {
            return read;
        }

        const std::string tail = read.contentsText();
        out.overlap = compareWindow(tail, content, initialChunkSize * 4, _config.minHashOverlap);

        _logger.debug(kCategory, std::format("Chunked scan of {}: window {} bytes, overlap {}",
                                             path, window, out.overlap));

        if (out.overlap > 0) break;
        if (window >= maxWindow) break;
        if (covered >= fileSize) break;
        if (growth >= _config.maxGrowthIterations) break;

        window = std::min(window * 2, maxWindow);
        ++growth;
    }

    if (out.overlap == 0) {
        _logger.debug(kCategory, std::format("No overlap found in the tail of {} after {} window(s)",
                                             path, out.windows.size()));
    }
    return FileOperationHandle::immediate(FileOpStatus::Complete);
}

} // namespace Inkwell::Core::IO
