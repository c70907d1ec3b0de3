/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

/**
 * @file IncrementalAppendEngine.h
 * @brief Appends only the part of a payload the target does not already end with
 *
 * An agent resubmitting text after a cut-off usually repeats some of what it
 * already wrote. The engine looks for the longest suffix of the file that equals
 * a prefix of the payload and appends the remainder, so that
 *
 *     file' == file + content[overlap:]
 *
 * Submitting the same payload twice leaves the file unchanged the second time.
 *
 * @code
 * IncrementalAppendEngine engine(backend, config, logger);
 * auto h = engine.mergeAppend("/work/notes.md", "world peace", 1024);
 * if (h.succeeded()) std::cout << h.bytesWritten() << " bytes appended\n";
 * @endcode
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "TailReader.h"
#include "WriteConfig.h"
#include "VirtualFileSystem/FileOperationHandle.h"

namespace Inkwell::Core::Logging { class Logger; }

namespace Inkwell::Core::IO {

class IFileSystemBackend;

/**
 * @brief What a merge is going to write
 *
 * bytesToAppend views into the caller's content and is only valid while it is.
 */
struct AppendPlan {
    std::string path;
    std::string_view bytesToAppend;
    size_t overlap = 0;
    bool createFile = false;
    TailScanResult scan;
};

class IncrementalAppendEngine {
public:
    IncrementalAppendEngine(IFileSystemBackend& backend, const WriteConfig& config, Logging::Logger& logger);

    /**
     * @brief Merges content onto the end of path
     * @param path Absolute path of the target
     * @param content Payload bytes
     * @param initialChunkSize First tail window; zero or negative is rejected with InvalidArgument
     * @return Completed handle whose bytesWritten() is the number of bytes appended
     *
     * A missing target is created with the whole payload. A failed append leaves
     * the file at its previous size.
     */
    FileOperationHandle mergeAppend(const std::string& path, std::string_view content, int64_t initialChunkSize);

    // mergeAppend using the configured initial chunk size
    FileOperationHandle mergeAppend(const std::string& path, std::string_view content);

    /**
     * @brief Computes the append plan without writing
     */
    FileOperationHandle plan(const std::string& path, std::string_view content, int64_t initialChunkSize,
                             AppendPlan& out);

    // Performs the single write described by a plan
    FileOperationHandle execute(const AppendPlan& plan);

private:
    IFileSystemBackend& _backend;
    const WriteConfig& _config;
    Logging::Logger& _logger;
    TailReader _tailReader;
};

} // namespace Inkwell::Core::IO
