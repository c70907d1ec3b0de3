/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

/**
 * @file WriteConfig.h
 * @brief Tunables shared by the write subsystem and the VirtualFileSystem read verbs
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Inkwell::Core::IO {

/**
 * @brief Tunables for the write subsystem and the read verbs
 *
 * All fields may be overridden per VirtualFileSystem instance. Nothing here is
 * process-wide; two services with different configs can run side by side.
 */
struct WriteConfig {
    // Strategy selection
    size_t smartWriteThreshold;              // characters above which IncrementalMerge is forced
    std::vector<std::string> binaryExtensions; // lowercase, leading dot; force Overwrite
    std::string completionMarkerLiteral;     // sentinel marking non-truncated text
    size_t binarySampleBytes;                // bytes sniffed for binary detection

    // Tail reader
    size_t initialChunkSize;                 // first chunked window; x4 is the small-content threshold
    size_t maxChunkSize;                     // window cap
    size_t maxGrowthIterations;              // maximum number of window doublings
    uint64_t fullReadCeilingBytes;           // files at or below this size are compared whole
    size_t minHashOverlap;                   // rolling hash checks lengths >= this; shorter ones directly

    // Writes
    bool createParentDirs;
    bool fsync;

    // Read verbs
    uint64_t largeFileThreshold;             // read() returns only this many head bytes of larger files
    size_t streamChunkSize;                  // streamRead() piece size

    WriteConfig()
        : smartWriteThreshold(100000)
        , binaryExtensions{".bin", ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".zip", ".rar", ".7z", ".tar", ".gz"}
        , completionMarkerLiteral("// END_OF_CONTENT")
        , binarySampleBytes(1000)
        , initialChunkSize(1024)
        , maxChunkSize(1024 * 1024)
        , maxGrowthIterations(6)
        , fullReadCeilingBytes(10ull * 1024 * 1024)
        , minHashOverlap(4)
        , createParentDirs(false)
        , fsync(false)
        , largeFileThreshold(1024 * 1024)
        , streamChunkSize(512 * 1024) {}
};

} // namespace Inkwell::Core::IO
