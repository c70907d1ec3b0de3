/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#include "ContentClassifier.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "VirtualFileSystem/IFileSystemBackend.h"

namespace Inkwell::Core::IO {

namespace {

inline bool isPrintableByte(unsigned char c) noexcept {
    if (c >= 0x80) return true;
    if (c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') return true;
    return c >= 0x20 && c != 0x7F;
}

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

SampleStats sampleBytes(std::string_view data, size_t maxBytes) noexcept {
    SampleStats stats;
    stats.sampled = std::min(data.size(), maxBytes);
    for (size_t i = 0; i < stats.sampled; ++i) {
        const auto c = static_cast<unsigned char>(data[i]);
        if (c == 0) {
            ++stats.nulls;
        } else if (!isPrintableByte(c)) {
            ++stats.nonPrintable;
        }
    }
    return stats;
}

bool looksBinary(std::string_view data, size_t maxBytes) noexcept {
    const SampleStats stats = sampleBytes(data, maxBytes);
    if (stats.sampled == 0) return false;
    // nulls/sampled > 1%  <=>  nulls * 100 > sampled
    return stats.nulls * 100 > stats.sampled || stats.nonPrintable * 20 > stats.sampled;
}

bool hasBinaryExtension(std::string_view path, const std::vector<std::string>& extensions) {
    const std::string ext = toLowerAscii(std::filesystem::path(path).extension().string());
    if (ext.empty()) return false;
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const std::string& candidate) { return toLowerAscii(candidate) == ext; });
}

FileOperationHandle probeFileState(IFileSystemBackend& backend, const std::string& path,
                                   const WriteConfig& config, FileState& out) {
    out = FileState{};

    auto meta = backend.getMetadata(path);
    if (meta.status() == FileOpStatus::Failed) {
        return meta;
    }
    const auto& md = meta.metadata();
    if (!md || !md->exists) {
        return meta;
    }
    out.exists = true;
    out.size = md->size;

    if (out.size == 0 || config.binarySampleBytes == 0) {
        return meta;
    }

    ReadOptions head;
    head.offset = 0;
    head.length = config.binarySampleBytes;
    auto sample = backend.readFile(path, head);
    if (sample.status() == FileOpStatus::Failed) {
        return sample;
    }
    out.isLikelyBinary = looksBinary(sample.contentsText(), config.binarySampleBytes);
    return meta;
}

} // namespace Inkwell::Core::IO
