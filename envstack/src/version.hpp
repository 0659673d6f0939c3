// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CLI_VERSION_HPP
#define ENVSTACK_CLI_VERSION_HPP

#include <string>

#define ENVSTACK_CLI_VERSION_MAJOR 0
#define ENVSTACK_CLI_VERSION_MINOR 1
#define ENVSTACK_CLI_VERSION_PATCH 0

namespace envstack_cli
{
    std::string version();
}

#endif
