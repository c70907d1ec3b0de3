/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

/**
 * @file WriteStrategySelector.h
 * @brief Decides how a write request touches the target and carries it out
 *
 * The selector is the entry point of the write subsystem. For each request it
 * probes the target, classifies the payload, picks one of three strategies and
 * executes it:
 *
 * - Overwrite: the whole file is replaced (temp file and rename when it exists)
 * - Append: the payload is appended as-is
 * - IncrementalMerge: only the part of the payload the file does not already
 *   end with is appended (see IncrementalAppendEngine)
 *
 * Requests for the same path are not serialized. Two concurrent writers to one
 * file can observe stale size or tail data; callers that need ordering must
 * serialize per path themselves.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "CompletionMarker.h"
#include "ContentClassifier.h"
#include "WriteConfig.h"
#include "VirtualFileSystem/FileOperationHandle.h"

namespace Inkwell::Core::Logging { class Logger; }

namespace Inkwell::Core::IO {

class IFileSystemBackend;
class IncrementalAppendEngine;

enum class WriteStrategy { Overwrite, Append, IncrementalMerge };

const char* toString(WriteStrategy strategy) noexcept;

struct WriteRequest {
    std::string path;                              // validated, absolute
    std::string content;                           // raw bytes
    bool binaryPayload = false;                    // caller delivered bytes rather than text
    std::optional<WriteStrategy> requestedStrategy;
    bool overrideStrategy = false;                 // requestedStrategy is used verbatim
    bool fullRewrite = false;                      // caller intends to replace the whole file
    std::optional<int64_t> chunkSize;              // initial tail window for merges
};

// Which rule produced a decision, in evaluation order
enum class DecisionReason {
    CallerOverride,
    BinaryContent,
    IncompleteContent,
    LargeContent,
    ExistingTarget,
    Default
};

const char* toString(DecisionReason reason) noexcept;

struct StrategyDecision {
    WriteStrategy strategy = WriteStrategy::Overwrite;
    DecisionReason reason = DecisionReason::Default;
    bool binary = false;
    bool incompleteContent = false;
};

struct WriteResult {
    FileOpStatus status = FileOpStatus::Pending;
    WriteStrategy usedStrategy = WriteStrategy::Overwrite;
    std::optional<WriteStrategy> requestedStrategy;
    uint64_t bytesAppended = 0;
    bool overridden = false;
    bool incompleteContent = false;
    std::string message;
    FileErrorInfo error;

    bool succeeded() const noexcept {
        return status == FileOpStatus::Complete || status == FileOpStatus::Partial;
    }
};

class WriteStrategySelector {
public:
    WriteStrategySelector(IFileSystemBackend& backend, IncrementalAppendEngine& engine,
                          const WriteConfig& config, Logging::Logger& logger);

    /**
     * @brief Applies the decision rules to a request and a probed file state
     *
     * Performs no I/O. The first matching rule wins:
     * 1. overrideStrategy with a requested strategy
     * 2. binary payload, extension, content sample or existing target: Overwrite
     * 3. text without the completion marker: IncrementalMerge
     * 4. more than smartWriteThreshold characters: IncrementalMerge
     * 5. existing target without fullRewrite: IncrementalMerge
     * 6. otherwise Overwrite
     */
    StrategyDecision select(const WriteRequest& request, const FileState& state) const;

    /**
     * @brief Probes the target, selects a strategy and executes it
     * @return Result describing the strategy used; failures carry the backend's error unmodified
     */
    WriteResult apply(const WriteRequest& request);

    const CompletionMarker& marker() const noexcept { return _marker; }

private:
    FileOperationHandle execute(WriteStrategy strategy, const WriteRequest& request, const std::string& content);
    WriteResult reject(const WriteRequest& request, FileError code, std::string message) const;

    IFileSystemBackend& _backend;
    IncrementalAppendEngine& _engine;
    const WriteConfig& _config;
    Logging::Logger& _logger;
    CompletionMarker _marker;
};

} // namespace Inkwell::Core::IO
