// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_ENVIRONMENT_STATE_HPP
#define ENVSTACK_CORE_ENVIRONMENT_STATE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "envstack/core/shell_detection.hpp"
#include "envstack/fs/filesystem.hpp"
#include "envstack/util/environment.hpp"

namespace envstack
{
    namespace env_var
    {
        inline constexpr auto path = "PATH";
        inline constexpr auto prefix = "CONDA_PREFIX";
        inline constexpr auto default_env = "CONDA_DEFAULT_ENV";
        inline constexpr auto prompt_backup = "CONDA_PS1_BACKUP";
        inline constexpr auto stack_depth = "CONDA_SHLVL";
        inline constexpr auto path_backup = "CONDA_PATH_BACKUP";
        inline constexpr auto path_unset = "CONDA_PATH_UNSET";

        /** Variable holding the prefix of the environment active at a given stack level. */
        [[nodiscard]] auto stacked_prefix(int level) -> std::string;
        [[nodiscard]] auto stacked_default_env(int level) -> std::string;
        [[nodiscard]] auto stacked_prompt_backup(int level) -> std::string;

        /** Variable saving the value of @p name clobbered at a given stack level. */
        [[nodiscard]] auto saved_value(int level, std::string_view name) -> std::string;
    }

    /** Name of the variable holding the prompt for the shell, if the shell has one. */
    [[nodiscard]] auto prompt_variable(ShellFlavor flavor) -> std::optional<std::string>;

    /** An environment saved when another one is stacked on top of it. */
    struct StackFrame
    {
        fs::u8path prefix = {};
        std::string default_env = {};
        std::optional<std::string> prompt_backup = {};

        auto operator==(const StackFrame& other) const -> bool = default;
    };

    /**
     * Activation state of a shell session.
     *
     * The state lives in the shell environment, it is loaded from and saved to an
     * environment variable map.
     */
    struct EnvironmentState
    {
        /** Root of the active environment, empty when none is active. */
        fs::u8path prefix = {};
        /** Display name of the active environment. */
        std::string default_env = {};

        /** Search path entries, empty entries included. */
        std::vector<std::string> path_entries = {};
        /** Whether the search path variable exists, even empty. */
        bool path_defined = false;
        /** Whether the search path variable was created by the first activation. */
        bool path_unset = false;

        /** Current prompt, if the shell has a prompt variable and it is set. */
        std::optional<std::string> prompt = {};
        std::optional<std::string> prompt_backup = {};
        /** Search path before the first activation, only kept by some shells. */
        std::optional<std::vector<std::string>> path_backup = {};

        int stack_depth = 0;
        /** Outer environments, ``stacked[i]`` was active at level ``i + 1``. */
        std::vector<StackFrame> stacked = {};

        /** Every other variable of the environment. */
        util::environment_map variables = {};

        [[nodiscard]] auto is_active() const -> bool
        {
            return stack_depth > 0;
        }

        [[nodiscard]] auto path() const -> std::string;
        void set_path(std::string_view value);

        [[nodiscard]] static auto
        from_env_map(const util::environment_map& env, ShellFlavor flavor) -> EnvironmentState;

        [[nodiscard]] auto to_env_map(ShellFlavor flavor) const -> util::environment_map;
    };

    /** Changes a shell must apply to its environment. */
    struct EnvironmentTransform
    {
        std::optional<std::string> export_path = {};
        std::vector<std::string> unset_vars = {};
        std::vector<std::pair<std::string, std::string>> set_vars = {};
        std::vector<std::pair<std::string, std::string>> export_vars = {};

        [[nodiscard]] auto empty() const -> bool;
    };

    /**
     * Compute the changes to go from one environment to another.
     *
     * The prompt variable is set as a shell variable, other variables are exported.
     * Variables are sorted by name.
     */
    [[nodiscard]] auto diff_environments(
        const util::environment_map& before,
        const util::environment_map& after,
        ShellFlavor flavor
    ) -> EnvironmentTransform;
}

#endif
