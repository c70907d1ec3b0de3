/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

/**
 * @file ContentClassifier.h
 * @brief Binary/text sniffing for write requests and existing targets
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "WriteConfig.h"
#include "VirtualFileSystem/FileOperationHandle.h"

namespace Inkwell::Core::IO {

class IFileSystemBackend;

/**
 * @brief Snapshot of the target taken once per request
 *
 * Never cached across requests; another writer may change the file at any time.
 */
struct FileState {
    bool exists = false;
    uint64_t size = 0;
    bool isLikelyBinary = false;
};

struct SampleStats {
    size_t sampled = 0;
    size_t nulls = 0;
    size_t nonPrintable = 0;
};

// Counts NUL and other control bytes in the first maxBytes of data. Tab, LF, CR,
// FF, VT and bytes >= 0x80 (UTF-8) are treated as printable.
SampleStats sampleBytes(std::string_view data, size_t maxBytes) noexcept;

// More than 1% NUL bytes or more than 5% non-printable bytes in the sample
bool looksBinary(std::string_view data, size_t maxBytes) noexcept;

// Case-insensitive match of the path's extension against the configured list
bool hasBinaryExtension(std::string_view path, const std::vector<std::string>& extensions);

/**
 * @brief Stats the target and sniffs its head
 *
 * A missing file yields exists=false with status Complete. Any other stat or
 * read failure is returned unmodified.
 */
FileOperationHandle probeFileState(IFileSystemBackend& backend, const std::string& path,
                                   const WriteConfig& config, FileState& out);

} // namespace Inkwell::Core::IO
