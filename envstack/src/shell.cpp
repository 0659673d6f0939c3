// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <string>

#include "envstack/api/configuration.hpp"
#include "envstack/api/shell.hpp"
#include "envstack/core/logging.hpp"
#include "envstack/util/environment.hpp"
#include "envstack/util/string.hpp"

#include "common_options.hpp"
#include "envstack.hpp"


using namespace envstack;  // NOLINT(build/namespaces)

namespace
{
    constexpr auto activate_usage = "Usage: source activate ENV\n"
                                    "\n"
                                    "Adds the 'bin' directory of the environment ENV to the front "
                                    "of PATH.\n"
                                    "ENV may either refer to just the name of the environment, or "
                                    "the full\n"
                                    "prefix path.\n";

    constexpr auto deactivate_usage = "Usage: source deactivate\n"
                                      "\n"
                                      "Removes the 'bin' directory of the environment activated "
                                      "with 'source\n"
                                      "activate' from PATH.\n";

    constexpr auto reactivate_usage = "Usage: source reactivate\n"
                                      "\n"
                                      "Deactivates and activates again the active environment.\n";

    struct ActivationOptions
    {
        std::string env_ref = {};
        std::string shell = {};
        bool stack = false;
        bool help = false;
    };

    /*****************
     *  CLI Options  *
     *****************/

    // Standard output is evaluated by the calling shell, usage goes to standard error.
    void init_usage_option(CLI::App* subcom, ActivationOptions& options)
    {
        subcom->set_help_flag();
        subcom->add_flag("-h,--help", options.help, "Print usage and exit");
        subcom->allow_extras();
    }

    /***************
     *  Utilities  *
     ***************/

    // Usage is printed on request or on unrecognized arguments, before any other work.
    void handle_usage(CLI::App* subcom, const ActivationOptions& options, std::string_view usage)
    {
        const auto extras = subcom->remaining();
        if (!extras.empty())
        {
            std::cerr << usage;
            LOG_ERROR << "Unrecognized arguments: " << util::join(" ", extras);
            throw CLI::RuntimeError(1);
        }
        if (options.help)
        {
            std::cerr << usage;
            throw CLI::RuntimeError(0);
        }
    }

    void print_shell_code(expected_t<std::string> code)
    {
        std::cout << extract(code);
    }
}

void
set_activate_command(CLI::App* subcom, Configuration& config)
{
    static ActivationOptions options;
    options = {};

    init_general_options(subcom, config);
    init_shell_option(subcom, options.shell);
    init_usage_option(subcom, options);
    subcom->add_option("env", options.env_ref, "Name or path of the environment, base by default");
    subcom->add_flag(
        "--stack",
        options.stack,
        "Activate the environment without first deactivating the current one"
    );

    subcom->callback(
        [subcom, &config]()
        {
            handle_usage(subcom, options, activate_usage);
            load_configuration(config);
            const auto flavor = consolidate_shell(options.shell);
            print_shell_code(shell_activate(
                config.context(),
                flavor,
                util::get_env_map(),
                options.env_ref,
                options.stack
            ));
        }
    );
}

void
set_deactivate_command(CLI::App* subcom, Configuration& config)
{
    static ActivationOptions options;
    options = {};

    init_general_options(subcom, config);
    init_shell_option(subcom, options.shell);
    init_usage_option(subcom, options);

    subcom->callback(
        [subcom, &config]()
        {
            handle_usage(subcom, options, deactivate_usage);
            load_configuration(config);
            const auto flavor = consolidate_shell(options.shell);
            print_shell_code(shell_deactivate(config.context(), flavor, util::get_env_map()));
        }
    );
}

void
set_reactivate_command(CLI::App* subcom, Configuration& config)
{
    static ActivationOptions options;
    options = {};

    init_general_options(subcom, config);
    init_shell_option(subcom, options.shell);
    init_usage_option(subcom, options);

    subcom->callback(
        [subcom, &config]()
        {
            handle_usage(subcom, options, reactivate_usage);
            load_configuration(config);
            const auto flavor = consolidate_shell(options.shell);
            print_shell_code(shell_reactivate(config.context(), flavor, util::get_env_map()));
        }
    );
}

void
set_hook_command(CLI::App* subcom, Configuration& config)
{
    static std::string shell;
    shell.clear();

    init_general_options(subcom, config);
    init_shell_option(subcom, shell);

    subcom->callback(
        [&config]()
        {
            load_configuration(config);
            auto hook = shell_hook(config.context(), consolidate_shell(shell));
            std::cout << extract(hook);
        }
    );
}

void
set_checkenv_command(CLI::App* subcom, Configuration& config)
{
    static std::string shell;
    static std::string env_ref;
    shell.clear();
    env_ref.clear();

    init_general_options(subcom, config);
    init_shell_option(subcom, shell);
    subcom->add_option("env", env_ref, "Name or path of the environment")->required();

    subcom->callback(
        [&config]()
        {
            load_configuration(config);
            // The flavor only changes the binary directory, default to a posix layout.
            const auto flavor = shell.empty() ? ShellFlavor::bash : consolidate_shell(shell);
            auto res = shell_checkenv(config.context(), flavor, env_ref);
            if (!res)
            {
                throw res.error();
            }
        }
    );
}

void
set_changeps1_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);

    subcom->callback(
        [&config]()
        {
            load_configuration(config);
            std::cout << (config.context().change_ps1 ? "1" : "0") << std::endl;
        }
    );
}
