// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CLI_COMMON_OPTIONS_HPP
#define ENVSTACK_CLI_COMMON_OPTIONS_HPP

#include <string>

#include <CLI/CLI.hpp>

#include "envstack/api/configuration.hpp"
#include "envstack/core/context.hpp"
#include "envstack/core/shell_detection.hpp"


void
init_rc_options(CLI::App* subcom, envstack::Configuration& config);

void
init_general_options(CLI::App* subcom, envstack::Configuration& config);

void
init_shell_option(CLI::App* subcom, std::string& shell);

/** Load the configuration, the verbosity given on the command line wins over the log level. */
void
load_configuration(envstack::Configuration& config);

/** Shell named on the command line, or the detected one. Throws on unsupported shells. */
auto
consolidate_shell(const std::string& shell) -> envstack::ShellFlavor;

#endif
