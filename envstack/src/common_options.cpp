// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <set>

#include "envstack/api/shell.hpp"
#include "envstack/core/logging.hpp"

#include "common_options.hpp"


using namespace envstack;  // NOLINT(build/namespaces)

void
init_rc_options(CLI::App* subcom, Configuration& config)
{
    std::string cli_group = "Configuration options";

    subcom
        ->add_option_function<std::vector<std::string>>(
            "--rc-file",
            [&config](const std::vector<std::string>& files)
            {
                for (const auto& file : files)
                {
                    config.rc_files().push_back(file);
                }
            },
            "Paths to the configuration files to use, replacing the default search list"
        )
        ->option_text("FILE1 FILE2...")
        ->group(cli_group);

    auto& src_params = config.context().src_params;
    subcom->add_flag("--no-rc", src_params.no_rc, "Disable the use of configuration files")
        ->group(cli_group);
    subcom->add_flag("--no-env", src_params.no_env, "Disable the use of environment variables")
        ->group(cli_group);
}

void
init_general_options(CLI::App* subcom, Configuration& config)
{
    init_rc_options(subcom, config);

    std::string cli_group = "Global options";

    subcom
        ->add_flag_function(
            "-v,--verbose",
            [&config](std::int64_t count)
            { config.context().output_params.verbosity = static_cast<int>(count); },
            "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
        )
        ->group(cli_group);

    const std::set<std::string> level_names = {
        "critical", "error", "warning", "info", "debug", "trace", "off",
    };
    subcom
        ->add_option_function<std::string>(
            "--log-level",
            [&config](const std::string& level)
            { config.set_cli_value("log_level", YAML::Node(level)); },
            config.at("log_level").description()
        )
        ->transform(CLI::IsMember(level_names, CLI::ignore_case))
        ->group(cli_group);

    subcom
        ->add_option_function<std::string>(
            "-r,--root-prefix",
            [&config](const std::string& root)
            { config.set_cli_value("root_prefix", YAML::Node(root)); },
            config.at("root_prefix").description()
        )
        ->option_text("PATH")
        ->group(cli_group);
}

void
init_shell_option(CLI::App* subcom, std::string& shell)
{
    subcom
        ->add_option("-s,--shell", shell, "Shell type, detected from the parent process if omitted")
        ->option_text("SHELL");
}

void
load_configuration(Configuration& config)
{
    auto& context = config.context();
    config.load();
    if (context.output_params.verbosity > 0)
    {
        context.set_verbosity(context.output_params.verbosity);
    }
}

auto
consolidate_shell(const std::string& shell) -> ShellFlavor
{
    if (shell.empty())
    {
        LOG_DEBUG << "No shell type provided";
    }
    auto flavor = select_shell(shell);
    return extract(flavor);
}
