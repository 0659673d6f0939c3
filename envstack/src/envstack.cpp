// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <iostream>

#include "envstack/api/configuration.hpp"
#include "envstack/core/logging.hpp"

#include "common_options.hpp"
#include "envstack.hpp"
#include "version.hpp"

using namespace envstack;  // NOLINT(build/namespaces)

void
set_envstack_command(CLI::App* com, Configuration& config)
{
    com->add_flag_function(
        "--version",
        [](std::int64_t /*count*/)
        {
            std::cout << envstack_cli::version() << std::endl;
            throw CLI::Success();
        },
        "Print the version and exit"
    );

    CLI::App* activate_subcom = com->add_subcommand("activate", "Activate an environment");
    set_activate_command(activate_subcom, config);

    CLI::App* deactivate_subcom = com->add_subcommand(
        "deactivate",
        "Deactivate the innermost active environment"
    );
    set_deactivate_command(deactivate_subcom, config);

    CLI::App* reactivate_subcom = com->add_subcommand(
        "reactivate",
        "Refresh the active environment after it changed"
    );
    set_reactivate_command(reactivate_subcom, config);

    CLI::App* hook_subcom = com->add_subcommand("hook", "Print the shell functions to evaluate");
    set_hook_command(hook_subcom, config);

    CLI::App* checkenv_subcom = com->add_subcommand("checkenv", "Check that an environment exists");
    set_checkenv_command(checkenv_subcom, config);

    CLI::App* changeps1_subcom = com->add_subcommand(
        "changeps1",
        "Print 1 if the prompt is decorated on activation, 0 otherwise"
    );
    set_changeps1_command(changeps1_subcom, config);

    CLI::App* cleanup_subcom = com->add_subcommand("cleanup", "Clean a delimited list such as PATH");
    set_cleanup_command(cleanup_subcom);

    CLI::App* whichshell_subcom = com->add_subcommand("whichshell", "Detect the calling shell");
    set_whichshell_command(whichshell_subcom);

    CLI::App* config_subcom = com->add_subcommand("config", "Print the effective configuration");
    set_config_command(config_subcom, config);

    com->require_subcommand(/* min */ 0, /* max */ 1);
}

int
run_envstack(CLI::App& app, int argc, const char* const* argv)
{
    try
    {
        app.parse(argc, argv);
        if (app.get_subcommands().empty())
        {
            std::cout << app.help();
        }
    }
    catch (const CLI::ParseError& e)
    {
        // Usage was already printed for errors raised by the commands.
        return (app.exit(e) == 0) ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        LOG_ERROR << e.what();
        return 1;
    }
    return 0;
}
