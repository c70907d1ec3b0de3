/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#include "WriteStrategySelector.h"

#include <filesystem>
#include <format>

#include "CoreCommon.h"
#include "IncrementalAppendEngine.h"
#include "Logging/Logger.h"
#include "VirtualFileSystem/IFileSystemBackend.h"

namespace Inkwell::Core::IO {

namespace {
constexpr const char* kCategory = "WriteStrategy";
}

const char* toString(WriteStrategy strategy) noexcept {
    switch (strategy) {
        case WriteStrategy::Overwrite: return "Overwrite";
        case WriteStrategy::Append: return "Append";
        case WriteStrategy::IncrementalMerge: return "IncrementalMerge";
    }
    return "Unknown";
}

const char* toString(DecisionReason reason) noexcept {
    switch (reason) {
        case DecisionReason::CallerOverride: return "caller override";
        case DecisionReason::BinaryContent: return "binary content";
        case DecisionReason::IncompleteContent: return "missing completion marker";
        case DecisionReason::LargeContent: return "large content";
        case DecisionReason::ExistingTarget: return "existing target";
        case DecisionReason::Default: return "default";
    }
    return "unknown";
}

WriteStrategySelector::WriteStrategySelector(IFileSystemBackend& backend, IncrementalAppendEngine& engine,
                                             const WriteConfig& config, Logging::Logger& logger)
    : _backend(backend)
    , _engine(engine)
    , _config(config)
    , _logger(logger)
    , _marker(config.completionMarkerLiteral) {}

StrategyDecision WriteStrategySelector::select(const WriteRequest& request, const FileState& state) const {
    StrategyDecision d;
    d.binary = request.binaryPayload
        || hasBinaryExtension(request.path, _config.binaryExtensions)
        || looksBinary(request.content, _config.binarySampleBytes)
        || (state.exists && state.isLikelyBinary);
    d.incompleteContent = !_marker.isComplete(request.content, d.binary);

    if (request.overrideStrategy && request.requestedStrategy) {
        d.strategy = *request.requestedStrategy;
        d.reason = DecisionReason::CallerOverride;
    } else if (d.binary) {
        d.strategy = WriteStrategy::Overwrite;
        d.reason = DecisionReason::BinaryContent;
    } else if (d.incompleteContent) {
        d.strategy = WriteStrategy::IncrementalMerge;
        d.reason = DecisionReason::IncompleteContent;
    } else if (countUtf8Characters(request.content) > _config.smartWriteThreshold) {
        d.strategy = WriteStrategy::IncrementalMerge;
        d.reason = DecisionReason::LargeContent;
    } else if (state.exists && !request.fullRewrite) {
        d.strategy = WriteStrategy::IncrementalMerge;
        d.reason = DecisionReason::ExistingTarget;
    } else {
        d.strategy = WriteStrategy::Overwrite;
        d.reason = DecisionReason::Default;
    }
    return d;
}

WriteResult WriteStrategySelector::reject(const WriteRequest& request, FileError code, std::string message) const {
    WriteResult r;
    r.status = FileOpStatus::Failed;
    r.requestedStrategy = request.requestedStrategy;
    r.error.code = code;
    r.error.path = request.path;
    r.error.message = std::move(message);
    r.message = r.error.message;
    return r;
}

WriteResult WriteStrategySelector::apply(const WriteRequest& request) {
    if (request.path.empty()) {
        return reject(request, FileError::InvalidArgument, "Path must not be empty");
    }
    if (!std::filesystem::path(request.path).is_absolute()) {
        return reject(request, FileError::InvalidArgument,
                      std::format("Path must be absolute: {}", request.path));
    }
    if (request.chunkSize && *request.chunkSize <= 0) {
        return reject(request, FileError::InvalidArgument,
                      std::format("Chunk size must be positive, got {}", *request.chunkSize));
    }

    FileState state;
    auto probe = probeFileState(_backend, request.path, _config, state);
    if (probe.status() == FileOpStatus::Failed) {
        const auto& err = probe.errorInfo();
        _logger.error(kCategory, std::format("Cannot inspect {}: {}", request.path, err.message));
        WriteResult r = reject(request, err.code, err.message);
        r.error = err;
        return r;
    }

    const StrategyDecision decision = select(request, state);
    _logger.debug(kCategory, std::format("{}: {} ({}; exists={}, size={}, binary={})",
                                         request.path, toString(decision.strategy), toString(decision.reason),
                                         state.exists, state.size, decision.binary));

    const std::string content = decision.binary ? request.content : _marker.strip(request.content);

    WriteResult r;
    r.usedStrategy = decision.strategy;
    r.requestedStrategy = request.requestedStrategy;
    r.incompleteContent = decision.incompleteContent;
    r.overridden = request.requestedStrategy.has_value() && *request.requestedStrategy != decision.strategy;

    auto h = execute(decision.strategy, request, content);
    r.status = h.status();
    if (h.status() == FileOpStatus::Failed) {
        r.error = h.errorInfo();
        r.message = r.error.message;
        _logger.error(kCategory, std::format("{} of {} failed: {} ({})", toString(decision.strategy),
                                             request.path, r.error.message, toString(r.error.code)));
        return r;
    }

    r.bytesAppended = h.bytesWritten();
    r.message = std::format("Successfully wrote to {}", request.path);
    if (r.overridden) {
        r.message += std::format(" (automatically used {})", toString(decision.strategy));
    }
    if (r.incompleteContent) {
        r.message += " (detected incomplete content)";
    }
    _logger.info(kCategory, std::format("{} {}: {} bytes", toString(decision.strategy), request.path,
                                        r.bytesAppended));
    return r;
}

FileOperationHandle WriteStrategySelector::execute(WriteStrategy strategy, const WriteRequest& request,
                                                   const std::string& content) {
    WriteOptions wo;
    wo.createParentDirs = _config.createParentDirs;
    wo.fsync = _config.fsync;

    switch (strategy) {
        case WriteStrategy::Overwrite:
            wo.atomicReplace = true;
            return _backend.writeFile(request.path, asBytes(content), wo);
        case WriteStrategy::Append:
            wo.append = true;
            return _backend.writeFile(request.path, asBytes(content), wo);
        case WriteStrategy::IncrementalMerge:
            return _engine.mergeAppend(request.path, content,
                                       request.chunkSize.value_or(static_cast<int64_t>(_config.initialChunkSize)));
    }
    return FileOperationHandle::failure(FileError::InvalidArgument, "Unknown write strategy", request.path);
}

} // namespace Inkwell::Core::IO
