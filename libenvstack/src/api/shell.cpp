// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "envstack/api/shell.hpp"
#include "envstack/core/activation.hpp"
#include "envstack/core/context.hpp"
#include "envstack/core/environment_resolver.hpp"
#include "envstack/core/hooks.hpp"
#include "envstack/core/logging.hpp"
#include "envstack/util/os.hpp"

namespace envstack
{
    namespace
    {
        auto run_activator(
            const Context& context,
            ShellFlavor flavor,
            const util::environment_map& env,
            ActivationType type,
            std::string_view env_ref = {},
            bool stack = false
        ) -> expected_t<std::string>
        {
            const auto resolver = ContextResolver(context);
            auto hook_runner = SubprocessHookRunner();
            auto activator = make_activator(context, flavor, resolver, hook_runner);
            if (!activator)
            {
                return forward_error(activator);
            }
            return (*activator)->shell_code(env, type, env_ref, stack);
        }
    }

    auto select_shell(std::string_view name) -> expected_t<ShellFlavor>
    {
        if (!name.empty())
        {
            const auto flavor = shell_flavor_from_name(name);
            if (flavor == ShellFlavor::unknown)
            {
                return make_unexpected(
                    fmt::format("Unrecognized shell: {}", name),
                    envstack_error_code::unrecognized_shell
                );
            }
            return flavor;
        }

        auto detection = detect_shell();
        if (!detection)
        {
            return forward_error(detection);
        }
        LOG_DEBUG << fmt::format(
            "Detected shell {} ({}) from {}",
            to_string(detection->flavor),
            detection->process_name,
            detection->method
        );
        return detection->flavor;
    }

    auto shell_activate(
        const Context& context,
        ShellFlavor flavor,
        const util::environment_map& env,
        std::string_view env_ref,
        bool stack
    ) -> expected_t<std::string>
    {
        return run_activator(context, flavor, env, ActivationType::activate, env_ref, stack);
    }

    auto
    shell_deactivate(const Context& context, ShellFlavor flavor, const util::environment_map& env)
        -> expected_t<std::string>
    {
        return run_activator(context, flavor, env, ActivationType::deactivate);
    }

    auto
    shell_reactivate(const Context& context, ShellFlavor flavor, const util::environment_map& env)
        -> expected_t<std::string>
    {
        return run_activator(context, flavor, env, ActivationType::reactivate);
    }

    auto shell_hook(const Context& context, ShellFlavor flavor) -> expected_t<std::string>
    {
        const auto resolver = ContextResolver(context);
        auto hook_runner = SubprocessHookRunner();
        auto activator = make_activator(context, flavor, resolver, hook_runner);
        if (!activator)
        {
            return forward_error(activator);
        }
        return (*activator)->hook(util::get_self_exe_path());
    }

    auto shell_checkenv(const Context& context, ShellFlavor flavor, std::string_view env_ref)
        -> expected_t<void>
    {
        const auto resolver = ContextResolver(context);
        if (!resolver.check_env(flavor, env_ref))
        {
            return make_unexpected(
                fmt::format("Could not find environment: {}", env_ref),
                envstack_error_code::environment_not_found
            );
        }
        return {};
    }
}
