/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#include "CompletionMarker.h"

#include <utility>

#include "CoreCommon.h"

namespace Inkwell::Core::IO {

CompletionMarker::CompletionMarker(std::string literal)
    : _literal(std::move(literal)) {}

bool CompletionMarker::isComplete(std::string_view content, bool binary) const noexcept {
    if (binary) return true;
    if (_literal.empty()) return true;
    return trimRight(content).ends_with(_literal);
}

std::string CompletionMarker::strip(std::string_view content) const {
    if (_literal.empty()) return std::string(content);
    const std::string_view trimmed = trimRight(content);
    if (!trimmed.ends_with(_literal)) {
        return std::string(content);
    }
    return std::string(trimRight(trimmed.substr(0, trimmed.size() - _literal.size())));
}

} // namespace Inkwell::Core::IO
