// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <CLI/CLI.hpp>

#include "envstack/api/configuration.hpp"
#include "envstack/core/context.hpp"

#include "envstack.hpp"
#include "version.hpp"


using namespace envstack;  // NOLINT(build/namespaces)

int
main(int argc, char** argv)
{
    envstack::Context ctx{ {
        /* .enable_logging = */ true,
    } };
    envstack::Configuration config{ ctx };

    CLI::App app{ "Version: " + envstack_cli::version() + "\n" };
    set_envstack_command(&app, config);

    return run_envstack(app, argc, argv);
}
