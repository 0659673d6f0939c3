// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_ACTIVATION_HPP
#define ENVSTACK_CORE_ACTIVATION_HPP

#include <memory>
#include <string>
#include <string_view>

#include "envstack/core/environment_state.hpp"
#include "envstack/core/error_handling.hpp"
#include "envstack/core/shell_detection.hpp"
#include "envstack/fs/filesystem.hpp"
#include "envstack/util/environment.hpp"

namespace envstack
{
    class Context;
    class EnvironmentResolver;
    class HookRunner;

    enum class ActivationType
    {
        activate,
        deactivate,
        reactivate,
    };

    /**
     * Activation state machine of a shell session and the code the shell evaluates to apply it.
     *
     * Each activation pushes the environment binary directory in front of the search path,
     * decorates the prompt and increments the stack depth. Each deactivation undoes exactly what
     * the matching activation did, so that balanced sequences restore the search path and the
     * prompt byte for byte.
     */
    class Activator
    {
    public:

        virtual ~Activator() = default;

        Activator(const Activator&) = delete;
        Activator& operator=(const Activator&) = delete;
        Activator(Activator&&) = delete;
        Activator& operator=(Activator&&) = delete;

        [[nodiscard]] auto flavor() const -> ShellFlavor;

        /**
         * Activate an environment given by name or path.
         *
         * The reference is checked before anything else, the state is left untouched on error.
         * An active environment is deactivated first, unless @p stack is set and the new
         * environment is a different one, in which case the active environment is kept on the
         * search path and saved in a stack frame.
         */
        [[nodiscard]] auto
        activate(EnvironmentState& state, std::string_view env_ref, bool stack = false)
            -> expected_t<void>;

        /** Deactivate the innermost environment, nothing is done when none is active. */
        [[nodiscard]] auto deactivate(EnvironmentState& state) -> expected_t<void>;

        /** Deactivate and activate again the active environment, keeping its display name. */
        [[nodiscard]] auto reactivate(EnvironmentState& state) -> expected_t<void>;

        /** Changes to apply to an environment variable map for the given action. */
        [[nodiscard]] auto build_transform(
            const util::environment_map& env,
            ActivationType type,
            std::string_view env_ref = {},
            bool stack = false
        ) -> expected_t<EnvironmentTransform>;

        /** Output for the calling shell, evaluating to nothing if the action changes nothing. */
        [[nodiscard]] auto shell_code(
            const util::environment_map& env,
            ActivationType type,
            std::string_view env_ref = {},
            bool stack = false
        ) -> expected_t<std::string>;

        /** Shell statements applying a transform. */
        [[nodiscard]] virtual auto script(const EnvironmentTransform& env_transform) const
            -> std::string
            = 0;

        /** Statement dropping the shell cache of executable locations. */
        [[nodiscard]] virtual auto rehash() const -> std::string;

        /** Shell functions wrapping the given executable. */
        [[nodiscard]] virtual auto hook(const fs::u8path& exe) const -> std::string = 0;

        /** What is printed for the calling shell, given the code to evaluate. */
        [[nodiscard]] virtual auto output(std::string code) const -> expected_t<std::string>;

    protected:

        Activator(
            const Context& context,
            ShellFlavor flavor,
            const EnvironmentResolver& resolver,
            HookRunner& hook_runner
        );

        const Context& m_context;

    private:

        ShellFlavor m_flavor;
        const EnvironmentResolver& m_resolver;
        HookRunner& m_hook_runner;

        [[nodiscard]] auto prompt_modifier(const EnvironmentState& state) const -> std::string;

        void push(
            EnvironmentState& state,
            const fs::u8path& prefix,
            const fs::u8path& bin,
            std::string default_env
        ) const;
        /** Binary directory pushed by the activation of the active environment. */
        [[nodiscard]] auto active_bin_dir(const EnvironmentState& state) const -> fs::u8path;
        void pop(EnvironmentState& state) const;

        void run_activate_hooks(const EnvironmentState& state) const;
        void run_deactivate_hooks(const EnvironmentState& state) const;
    };

    class PosixActivator : public Activator
    {
    public:

        PosixActivator(
            const Context& context,
            ShellFlavor flavor,
            const EnvironmentResolver& resolver,
            HookRunner& hook_runner
        );

        [[nodiscard]] auto script(const EnvironmentTransform& env_transform) const
            -> std::string override;
        [[nodiscard]] auto rehash() const -> std::string override;
        [[nodiscard]] auto hook(const fs::u8path& exe) const -> std::string override;
    };

    class CshActivator : public Activator
    {
    public:

        CshActivator(
            const Context& context,
            ShellFlavor flavor,
            const EnvironmentResolver& resolver,
            HookRunner& hook_runner
        );

        [[nodiscard]] auto script(const EnvironmentTransform& env_transform) const
            -> std::string override;
        [[nodiscard]] auto rehash() const -> std::string override;
        [[nodiscard]] auto hook(const fs::u8path& exe) const -> std::string override;
    };

    class CmdExeActivator : public Activator
    {
    public:

        CmdExeActivator(
            const Context& context,
            const EnvironmentResolver& resolver,
            HookRunner& hook_runner
        );

        [[nodiscard]] auto script(const EnvironmentTransform& env_transform) const
            -> std::string override;
        [[nodiscard]] auto hook(const fs::u8path& exe) const -> std::string override;

        /** Writes the code to a temporary batch file and returns its path. */
        [[nodiscard]] auto output(std::string code) const -> expected_t<std::string> override;
    };

    class PowerShellActivator : public Activator
    {
    public:

        PowerShellActivator(
            const Context& context,
            const EnvironmentResolver& resolver,
            HookRunner& hook_runner
        );

        [[nodiscard]] auto script(const EnvironmentTransform& env_transform) const
            -> std::string override;
        [[nodiscard]] auto hook(const fs::u8path& exe) const -> std::string override;
    };

    class XonshActivator : public Activator
    {
    public:

        XonshActivator(
            const Context& context,
            const EnvironmentResolver& resolver,
            HookRunner& hook_runner
        );

        [[nodiscard]] auto script(const EnvironmentTransform& env_transform) const
            -> std::string override;
        [[nodiscard]] auto hook(const fs::u8path& exe) const -> std::string override;
    };

    /**
     * Activator for a shell flavor.
     *
     * @returns An error with code ``unrecognized_shell`` for ShellFlavor::unknown.
     */
    [[nodiscard]] auto make_activator(
        const Context& context,
        ShellFlavor flavor,
        const EnvironmentResolver& resolver,
        HookRunner& hook_runner
    ) -> expected_t<std::unique_ptr<Activator>>;
}

#endif
