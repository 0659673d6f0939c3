// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <reproc++/run.hpp>

#include "envstack/core/hooks.hpp"
#include "envstack/core/logging.hpp"
#include "envstack/util/string.hpp"

namespace envstack
{
    namespace
    {
        const fs::u8path PREFIX_STATE_FILE = fs::u8path("conda-meta") / "state";
        const fs::u8path PACKAGE_ENV_VARS_DIR = fs::u8path("etc") / "conda" / "env_vars.d";

        auto filter_dir(const fs::u8path& dir, std::string_view suffix) -> std::vector<fs::u8path>
        {
            std::vector<fs::u8path> result;
            std::error_code ec;
            if (!fs::is_directory(dir, ec))
            {
                return result;
            }
            for (const auto& entry : fs::directory_iterator(dir, ec))
            {
                if (entry.is_regular_file(ec)
                    && (suffix.empty() || entry.path().extension().string() == suffix))
                {
                    result.push_back(entry.path());
                }
            }
            return result;
        }

        auto hooks_log(log_level level) -> logging::MessageLogger
        {
            return logging::MessageLogger(level, logging::log_source::hooks);
        }
    }

    auto hook_script_extension(ShellFlavor flavor) -> std::string_view
    {
        switch (flavor)
        {
            case ShellFlavor::csh:
            case ShellFlavor::tcsh:
                return ".csh";
            case ShellFlavor::cmd:
                return ".bat";
            case ShellFlavor::powershell:
                return ".ps1";
            default:
                return ".sh";
        }
    }

    auto find_activate_scripts(ShellFlavor flavor, const fs::u8path& prefix)
        -> std::vector<fs::u8path>
    {
        auto result = filter_dir(
            prefix / "etc" / "conda" / "activate.d",
            hook_script_extension(flavor)
        );
        std::sort(result.begin(), result.end());
        return result;
    }

    auto find_deactivate_scripts(ShellFlavor flavor, const fs::u8path& prefix)
        -> std::vector<fs::u8path>
    {
        auto result = filter_dir(
            prefix / "etc" / "conda" / "deactivate.d",
            hook_script_extension(flavor)
        );
        // reverse sort!
        std::sort(result.begin(), result.end(), std::greater<fs::u8path>());
        return result;
    }

    auto get_environment_vars(const fs::u8path& prefix)
        -> std::vector<std::pair<std::string, std::string>>
    {
        const fs::u8path env_vars_file = prefix / PREFIX_STATE_FILE;
        nlohmann::ordered_map<std::string, std::string> env_vars;

        // First get env vars from packages
        auto env_var_files = filter_dir(prefix / PACKAGE_ENV_VARS_DIR, "");
        std::sort(env_var_files.begin(), env_var_files.end());
        for (const auto& f : env_var_files)
        {
            std::ifstream fin(f);
            try
            {
                nlohmann::ordered_json j;
                fin >> j;
                for (auto it = j.begin(); it != j.end(); ++it)
                {
                    env_vars[util::to_upper(it.key())] = it.value().get<std::string>();
                }
            }
            catch (const nlohmann::json::exception& error)
            {
                LOG_WARNING << "Could not read JSON at " << f.string() << ": " << error.what();
            }
        }

        // Then get env vars from environment specification
        std::error_code ec;
        if (fs::exists(env_vars_file, ec))
        {
            std::ifstream fin(env_vars_file);
            try
            {
                nlohmann::ordered_json j;
                fin >> j;
                if (j.contains("env_vars"))
                {
                    const auto& prefix_state_env_vars = j["env_vars"];
                    for (auto it = prefix_state_env_vars.begin(); it != prefix_state_env_vars.end();
                         ++it)
                    {
                        const auto name = util::to_upper(it.key());
                        if (env_vars.find(name) != env_vars.end())
                        {
                            LOG_WARNING << "Duplicate env vars detected. Vars from the environment "
                                        << "will overwrite those from packages";
                            LOG_WARNING << "Variable " << name << " duplicated";
                        }
                        env_vars[name] = it.value().get<std::string>();
                    }
                }
            }
            catch (const nlohmann::json::exception& error)
            {
                LOG_WARNING << "Could not read JSON at " << env_vars_file.string() << ": "
                            << error.what();
            }
        }
        return { env_vars.begin(), env_vars.end() };
    }

    auto SubprocessHookRunner::command(ShellFlavor flavor, const fs::u8path& script)
        -> std::vector<std::string>
    {
        switch (flavor)
        {
            case ShellFlavor::csh:
            case ShellFlavor::tcsh:
                return { std::string(to_string(flavor)), "-f", script.string() };
            case ShellFlavor::cmd:
                return { "cmd.exe", "/d", "/c", script.string() };
            case ShellFlavor::powershell:
                return { "powershell", "-NoProfile", "-ExecutionPolicy", "Bypass", "-File",
                         script.string() };
            case ShellFlavor::xonsh:
            case ShellFlavor::unknown:
                return { "bash", script.string() };
            default:
                return { std::string(to_string(flavor)), script.string() };
        }
    }

    auto SubprocessHookRunner::run(
        ShellFlavor flavor,
        const fs::u8path& script,
        const util::environment_map& env
    ) -> expected_t<void>
    {
        const auto args = command(flavor, script);
        hooks_log(log_level::debug).stream() << "Running hook: " << util::join(" ", args);

        reproc::options options;
        options.env.behavior = reproc::env::empty;
        options.env.extra = env;

        std::string out, err;
        auto [status, ec] = reproc::run(
            args,
            options,
            reproc::sink::string(out),
            reproc::sink::string(err)
        );

        // Hook output must not reach the calling shell evaluated output.
        std::cerr << out << err;

        if (ec)
        {
            return make_unexpected(
                fmt::format("Could not run hook {}: {}", script.string(), ec.message()),
                envstack_error_code::hook_failure
            );
        }
        if (status != 0)
        {
            return make_unexpected(
                fmt::format("Hook {} exited with status {}", script.string(), status),
                envstack_error_code::hook_failure
            );
        }
        return {};
    }
}
