// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "version.hpp"

namespace envstack_cli
{
    std::string version()
    {
        return fmt::format(
            "{}.{}.{}",
            ENVSTACK_CLI_VERSION_MAJOR,
            ENVSTACK_CLI_VERSION_MINOR,
            ENVSTACK_CLI_VERSION_PATCH
        );
    }
}
