// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_API_SHELL_HPP
#define ENVSTACK_API_SHELL_HPP

#include <string>
#include <string_view>

#include "envstack/core/error_handling.hpp"
#include "envstack/core/shell_detection.hpp"
#include "envstack/util/environment.hpp"

namespace envstack
{
    class Context;

    /**
     * Shell flavor given by name, or detected from the parent process if @p name is empty.
     *
     * @returns An error with code ``unrecognized_shell`` if the shell is not supported.
     */
    [[nodiscard]] auto select_shell(std::string_view name) -> expected_t<ShellFlavor>;

    /** Code activating an environment in the shell holding @p env. */
    [[nodiscard]] auto shell_activate(
        const Context& context,
        ShellFlavor flavor,
        const util::environment_map& env,
        std::string_view env_ref,
        bool stack
    ) -> expected_t<std::string>;

    [[nodiscard]] auto
    shell_deactivate(const Context& context, ShellFlavor flavor, const util::environment_map& env)
        -> expected_t<std::string>;

    [[nodiscard]] auto
    shell_reactivate(const Context& context, ShellFlavor flavor, const util::environment_map& env)
        -> expected_t<std::string>;

    /** Shell functions to evaluate in the shell startup file. */
    [[nodiscard]] auto shell_hook(const Context& context, ShellFlavor flavor)
        -> expected_t<std::string>;

    /**
     * Check that an environment exists.
     *
     * @returns An error with code ``environment_not_found`` otherwise.
     */
    [[nodiscard]] auto
    shell_checkenv(const Context& context, ShellFlavor flavor, std::string_view env_ref)
        -> expected_t<void>;
}

#endif
