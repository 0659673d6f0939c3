// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

#include "envstack/core/environment_state.hpp"
#include "envstack/core/logging.hpp"
#include "envstack/util/string.hpp"

namespace envstack
{
    namespace env_var
    {
        auto stacked_prefix(int level) -> std::string
        {
            return fmt::format("CONDA_PREFIX_{}", level);
        }

        auto stacked_default_env(int level) -> std::string
        {
            return fmt::format("CONDA_DEFAULT_ENV_{}", level);
        }

        auto stacked_prompt_backup(int level) -> std::string
        {
            return fmt::format("CONDA_PS1_BACKUP_{}", level);
        }

        auto saved_value(int level, std::string_view name) -> std::string
        {
            return fmt::format("__CONDA_SHLVL_{}_{}", level, name);
        }
    }

    auto prompt_variable(ShellFlavor flavor) -> std::optional<std::string>
    {
        switch (flavor)
        {
            case ShellFlavor::bash:
            case ShellFlavor::zsh:
            case ShellFlavor::dash:
            case ShellFlavor::posh:
            case ShellFlavor::ksh:
                return "PS1";
            case ShellFlavor::csh:
            case ShellFlavor::tcsh:
                return "prompt";
            case ShellFlavor::cmd:
                return "PROMPT";
            case ShellFlavor::powershell:
            case ShellFlavor::xonsh:
            case ShellFlavor::unknown:
                return std::nullopt;
        }
        return std::nullopt;
    }

    namespace
    {
        auto take(util::environment_map& env, const std::string& name) -> std::optional<std::string>
        {
            if (auto it = env.find(name); it != env.end())
            {
                auto value = std::move(it->second);
                env.erase(it);
                return value;
            }
            return std::nullopt;
        }

        auto parse_depth(const std::optional<std::string>& value) -> int
        {
            if (!value)
            {
                return 0;
            }
            const auto str = util::strip(*value);
            int depth = 0;
            const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), depth);
            if (ec != std::errc() || ptr != str.data() + str.size() || depth < 0)
            {
                LOG_WARNING << fmt::format(
                    "Invalid {} value '{}', assuming no active environment",
                    env_var::stack_depth,
                    *value
                );
                return 0;
            }
            return depth;
        }
    }

    auto EnvironmentState::path() const -> std::string
    {
        return util::join(std::string(1, util::pathsep()), path_entries);
    }

    void EnvironmentState::set_path(std::string_view value)
    {
        path_defined = true;
        path_entries.clear();
        if (!value.empty())
        {
            path_entries = util::split(value, util::pathsep());
        }
    }

    auto EnvironmentState::from_env_map(const util::environment_map& env, ShellFlavor flavor)
        -> EnvironmentState
    {
        auto state = EnvironmentState{};
        auto rest = env;

        if (auto path = take(rest, env_var::path))
        {
            state.set_path(*path);
        }

        const auto prompt_var = prompt_variable(flavor);
        if (prompt_var)
        {
            state.prompt = take(rest, *prompt_var);
        }

        state.prefix = take(rest, env_var::prefix).value_or("");
        state.default_env = take(rest, env_var::default_env).value_or("");
        state.prompt_backup = take(rest, env_var::prompt_backup);
        if (auto path_backup = take(rest, env_var::path_backup))
        {
            state.path_backup = path_backup->empty()
                                    ? std::vector<std::string>{}
                                    : util::split(*path_backup, util::pathsep());
        }

        state.path_unset = take(rest, env_var::path_unset).has_value();

        int depth = parse_depth(take(rest, env_var::stack_depth));
        if (state.prefix.empty())
        {
            depth = 0;
        }
        else if (depth == 0)
        {
            // Activated by a tool which does not track the depth.
            depth = 1;
        }

        for (int level = 1; level < depth; ++level)
        {
            auto prefix = take(rest, env_var::stacked_prefix(level));
            if (!prefix)
            {
                LOG_WARNING << fmt::format(
                    "Missing {}, the activation stack is truncated to level {}",
                    env_var::stacked_prefix(level),
                    level
                );
                depth = level;
                break;
            }
            state.stacked.push_back(StackFrame{
                .prefix = std::move(*prefix),
                .default_env = take(rest, env_var::stacked_default_env(level)).value_or(""),
                .prompt_backup = take(rest, env_var::stacked_prompt_backup(level)),
            });
        }
        state.stack_depth = depth;

        state.variables = std::move(rest);
        return state;
    }

    auto EnvironmentState::to_env_map(ShellFlavor flavor) const -> util::environment_map
    {
        auto env = variables;

        if (path_defined || !path_entries.empty())
        {
            env[env_var::path] = path();
        }
        if (const auto prompt_var = prompt_variable(flavor); prompt_var && prompt)
        {
            env[*prompt_var] = *prompt;
        }
        if (is_active())
        {
            env[env_var::prefix] = prefix.string();
            env[env_var::default_env] = default_env;
        }
        if (prompt_backup)
        {
            env[env_var::prompt_backup] = *prompt_backup;
        }
        if (path_backup)
        {
            env[env_var::path_backup] = util::join(std::string(1, util::pathsep()), *path_backup);
        }
        if (path_unset)
        {
            env[env_var::path_unset] = "1";
        }
        env[env_var::stack_depth] = std::to_string(stack_depth);

        for (std::size_t i = 0; i < stacked.size(); ++i)
        {
            const auto level = static_cast<int>(i) + 1;
            const auto& frame = stacked[i];
            env[env_var::stacked_prefix(level)] = frame.prefix.string();
            env[env_var::stacked_default_env(level)] = frame.default_env;
            if (frame.prompt_backup)
            {
                env[env_var::stacked_prompt_backup(level)] = *frame.prompt_backup;
            }
        }
        return env;
    }

    auto EnvironmentTransform::empty() const -> bool
    {
        return !export_path && unset_vars.empty() && set_vars.empty() && export_vars.empty();
    }

    auto diff_environments(
        const util::environment_map& before,
        const util::environment_map& after,
        ShellFlavor flavor
    ) -> EnvironmentTransform
    {
        auto out = EnvironmentTransform{};
        const auto prompt_var = prompt_variable(flavor);

        for (const auto& [name, value] : after)
        {
            if (auto it = before.find(name); it != before.end() && it->second == value)
            {
                continue;
            }
            if (name == env_var::path)
            {
                out.export_path = value;
            }
            else if (prompt_var && name == *prompt_var)
            {
                out.set_vars.emplace_back(name, value);
            }
            else
            {
                out.export_vars.emplace_back(name, value);
            }
        }
        for (const auto& [name, value] : before)
        {
            if (after.find(name) == after.end())
            {
                out.unset_vars.push_back(name);
            }
        }

        std::sort(out.unset_vars.begin(), out.unset_vars.end());
        std::sort(out.set_vars.begin(), out.set_vars.end());
        std::sort(out.export_vars.begin(), out.export_vars.end());
        return out;
    }
}
