/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

/**
 * @file CompletionMarker.h
 * @brief Detects and removes the end-of-content sentinel
 *
 * Agents producing long text often get cut off without noticing. They are asked
 * to finish every complete payload with a marker line; text arriving without it
 * is treated as possibly truncated and is merged instead of overwriting.
 */

#pragma once

#include <string>
#include <string_view>

namespace Inkwell::Core::IO {

class CompletionMarker {
public:
    explicit CompletionMarker(std::string literal);

    /**
     * @brief Whether content carries the marker at its end
     * @param content Payload to inspect
     * @param binary Binary payloads are always complete
     * @return true if binary, or if the right-trimmed text ends with the literal
     */
    bool isComplete(std::string_view content, bool binary = false) const noexcept;

    /**
     * @brief Removes a trailing marker and the whitespace directly before it
     *
     * Content that does not end with the marker (after trailing whitespace) is
     * returned unchanged.
     */
    std::string strip(std::string_view content) const;

    const std::string& literal() const noexcept { return _literal; }

private:
    std::string _literal;
};

} // namespace Inkwell::Core::IO
