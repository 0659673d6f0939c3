// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_UTIL_PATH_LIST_HPP
#define ENVSTACK_UTIL_PATH_LIST_HPP

#include <string>
#include <string_view>
#include <vector>

#include "envstack/core/error_handling.hpp"

namespace envstack::util
{
    enum class CleanupMode
    {
        /// Drop every repeated entry, keeping the first occurrence.
        duplicate,
        /// Drop the first entry matching any of the targets.
        remove,
        /// Drop all entries matching any of the targets.
        global,
    };

    [[nodiscard]] auto to_string(CleanupMode mode) -> std::string_view;

    /**
     * Clean a delimited list such as the content of ``PATH``.
     *
     * Empty entries, such as those a leading or trailing delimiter denotes, are never dropped
     * as duplicates, so that a leading or trailing delimiter in @p list is kept in the result.
     * With @p fuzzy, an entry matches a target when it contains it as a substring and the
     * whole entry is dropped.
     *
     * @return An error with ``malformed_argument`` code if targets are given in
     *         ``duplicate`` mode, or if none are given in the other modes.
     */
    [[nodiscard]] auto cleanup(
        std::string_view list,
        char delim,
        CleanupMode mode,
        const std::vector<std::string>& targets = {},
        bool fuzzy = false
    ) -> expected_t<std::string>;

    /** Split a delimited list into its entries, dropping empty ones. */
    [[nodiscard]] auto split_path_list(std::string_view list, char delim) -> std::vector<std::string>;
}
#endif
