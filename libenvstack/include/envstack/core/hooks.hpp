// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_HOOKS_HPP
#define ENVSTACK_CORE_HOOKS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "envstack/core/error_handling.hpp"
#include "envstack/core/shell_detection.hpp"
#include "envstack/fs/filesystem.hpp"
#include "envstack/util/environment.hpp"

namespace envstack
{
    /** Value of a per-environment variable meaning the variable must be unset. */
    inline constexpr auto ENV_VAR_UNSET_VALUE = "***unset***";

    /** Extension of the hook scripts a shell can run. */
    [[nodiscard]] auto hook_script_extension(ShellFlavor flavor) -> std::string_view;

    /** Activation hooks of an environment, in lexical order. */
    [[nodiscard]] auto find_activate_scripts(ShellFlavor flavor, const fs::u8path& prefix)
        -> std::vector<fs::u8path>;

    /** Deactivation hooks of an environment, in reverse lexical order. */
    [[nodiscard]] auto find_deactivate_scripts(ShellFlavor flavor, const fs::u8path& prefix)
        -> std::vector<fs::u8path>;

    /**
     * Variables an environment defines for itself.
     *
     * Package files in ``etc/conda/env_vars.d`` are read first, in lexical order, then the
     * ``env_vars`` object of ``conda-meta/state`` which overrides them.
     * Names are upper-cased, unreadable files are skipped with a warning.
     */
    [[nodiscard]] auto get_environment_vars(const fs::u8path& prefix)
        -> std::vector<std::pair<std::string, std::string>>;

    /**
     * Runs hook scripts.
     */
    class HookRunner
    {
    public:

        virtual ~HookRunner() = default;

        /**
         * Run a script with the given environment.
         *
         * @returns An error with code ``hook_failure`` if the script could not be started
         *          or exited with a non-zero status.
         */
        [[nodiscard]] virtual auto
        run(ShellFlavor flavor, const fs::u8path& script, const util::environment_map& env)
            -> expected_t<void>
            = 0;
    };

    /**
     * Runs hook scripts in a child shell process and waits for them without timeout.
     *
     * The script output is forwarded to standard error, standard output is reserved for the
     * code evaluated by the calling shell.
     */
    class SubprocessHookRunner : public HookRunner
    {
    public:

        [[nodiscard]] auto
        run(ShellFlavor flavor, const fs::u8path& script, const util::environment_map& env)
            -> expected_t<void> override;

        /** Command line used to run a script in a given shell. */
        [[nodiscard]] static auto command(ShellFlavor flavor, const fs::u8path& script)
            -> std::vector<std::string>;
    };
}

#endif
