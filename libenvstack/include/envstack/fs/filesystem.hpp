// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_FS_FILESYSTEM_HPP
#define ENVSTACK_FS_FILESYSTEM_HPP

#include <filesystem>

namespace envstack::fs
{
    // Paths handled by envstack are always UTF-8 encoded std::string on the
    // platforms we target, so the standard path type is used directly.
    using namespace std::filesystem;

    using u8path = std::filesystem::path;
}

#endif
