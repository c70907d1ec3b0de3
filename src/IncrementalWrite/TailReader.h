/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

/**
 * @file TailReader.h
 * @brief Finds how much of incoming content is already at the end of a file
 *
 * The reader compares the file's tail against the content's head using the
 * overlap detector. Small files (and small payloads) are compared in one pass;
 * large files are compared through a window that starts small and doubles on a
 * miss, so the common case of a short resubmitted fragment costs a few KiB of I/O.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "WriteConfig.h"
#include "VirtualFileSystem/FileOperationHandle.h"

namespace Inkwell::Core::Logging { class Logger; }

namespace Inkwell::Core::IO {

class IFileSystemBackend;

enum class TailScanMode { WholeWindow, Chunked };

const char* toString(TailScanMode mode) noexcept;

struct TailScanResult {
    size_t overlap = 0;
    TailScanMode mode = TailScanMode::WholeWindow;
    std::vector<size_t> windows;   // every requested window size, in order
    bool fellBack = false;         // whole-window read failed and chunked mode was used
};

class TailReader {
public:
    TailReader(IFileSystemBackend& backend, const WriteConfig& config, Logging::Logger& logger);

    /**
     * @brief Computes the overlap between the end of path and the start of content
     * @param path Existing file
     * @param fileSize Size of the file as observed by the caller
     * @param content Incoming payload
     * @param initialChunkSize First window of chunked mode; must be non-zero
     * @param out Filled with the overlap and the windows that were read
     * @return Complete on success; a failed chunked read is returned unmodified
     */
    FileOperationHandle scan(const std::string& path, uint64_t fileSize, std::string_view content,
                             size_t initialChunkSize, TailScanResult& out);

private:
    FileOperationHandle scanWhole(const std::string& path, uint64_t fileSize, std::string_view content,
                                  size_t smallThreshold, TailScanResult& out);
    FileOperationHandle scanChunked(const std::string& path, uint64_t fileSize, std::string_view content,
                                    size_t initialChunkSize, TailScanResult& out);

    IFileSystemBackend& _backend;
    const WriteConfig& _config;
    Logging::Logger& _logger;
};

} // namespace Inkwell::Core::IO
