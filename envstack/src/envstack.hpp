// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CLI_ENVSTACK_HPP
#define ENVSTACK_CLI_ENVSTACK_HPP

#include <CLI/CLI.hpp>

namespace envstack
{
    class Configuration;
}

void
set_activate_command(CLI::App* subcom, envstack::Configuration& config);

void
set_deactivate_command(CLI::App* subcom, envstack::Configuration& config);

void
set_reactivate_command(CLI::App* subcom, envstack::Configuration& config);

void
set_hook_command(CLI::App* subcom, envstack::Configuration& config);

void
set_checkenv_command(CLI::App* subcom, envstack::Configuration& config);

void
set_changeps1_command(CLI::App* subcom, envstack::Configuration& config);

void
set_cleanup_command(CLI::App* subcom);

void
set_whichshell_command(CLI::App* subcom);

void
set_config_command(CLI::App* subcom, envstack::Configuration& config);

void
set_envstack_command(CLI::App* com, envstack::Configuration& config);

/** Parse and run a command line, returning the process exit code. */
int
run_envstack(CLI::App& app, int argc, const char* const* argv);

#endif
