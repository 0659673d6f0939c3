// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_UTIL_OS_HPP
#define ENVSTACK_UTIL_OS_HPP

#include <string>
#include <utility>

#include <tl/expected.hpp>

#include "envstack/fs/filesystem.hpp"

namespace envstack::util
{
    struct OSError
    {
        std::string message = {};
    };

    /** Kernel name and version, as reported by ``uname``. */
    [[nodiscard]] auto unix_name_version()
        -> tl::expected<std::pair<std::string, std::string>, OSError>;

    /**
     * Lower case identifier of the Linux distribution (``ubuntu``, ``debian``...).
     *
     * Read from the ``ID`` field of ``os-release``, which is looked up in the given
     * directory first and then in ``/usr/lib``.
     */
    [[nodiscard]] auto linux_distribution_id(const fs::u8path& etc_dir = "/etc")
        -> tl::expected<std::string, OSError>;

    [[nodiscard]] auto get_self_exe_path() -> fs::u8path;

    [[nodiscard]] auto parent_process_id() -> int;
}
#endif
