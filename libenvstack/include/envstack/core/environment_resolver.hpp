// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_ENVIRONMENT_RESOLVER_HPP
#define ENVSTACK_CORE_ENVIRONMENT_RESOLVER_HPP

#include <string_view>

#include "envstack/core/error_handling.hpp"
#include "envstack/core/shell_detection.hpp"
#include "envstack/fs/filesystem.hpp"

namespace envstack
{
    class Context;

    /** Directory of executables of an environment, as added to the search path. */
    [[nodiscard]] auto bin_dir(ShellFlavor flavor, const fs::u8path& prefix) -> fs::u8path;

    /** @returns ``true`` if the reference is a path rather than an environment name. */
    [[nodiscard]] auto is_path_reference(std::string_view env_ref) -> bool;

    /**
     * Maps environment references, names or paths, to environments on disk.
     */
    class EnvironmentResolver
    {
    public:

        virtual ~EnvironmentResolver() = default;

        /** @returns ``true`` if the reference names an existing environment. */
        [[nodiscard]] virtual auto check_env(ShellFlavor flavor, std::string_view env_ref) const
            -> bool;

        /** Absolute root of the referred environment. */
        [[nodiscard]] virtual auto
        resolve_prefix(ShellFlavor flavor, std::string_view env_ref) const
            -> expected_t<fs::u8path> = 0;

        /** Absolute directory to prepend to the search path for the referred environment. */
        [[nodiscard]] virtual auto
        resolve_bin_dir(ShellFlavor flavor, std::string_view env_ref) const
            -> expected_t<fs::u8path>;

        /** @returns Whether the prompt should be decorated with the environment name. */
        [[nodiscard]] virtual auto change_prompt() const -> bool = 0;
    };

    /**
     * Resolves references using the root prefix and environment directories of a `Context`.
     *
     * ``root``, ``base`` and the empty reference refer to the root prefix, references holding a
     * path separator are paths to an existing directory, anything else is looked up by name in
     * the environment directories.
     */
    class ContextResolver : public EnvironmentResolver
    {
    public:

        explicit ContextResolver(const Context& context);

        [[nodiscard]] auto resolve_prefix(ShellFlavor flavor, std::string_view env_ref) const
            -> expected_t<fs::u8path> override;

        [[nodiscard]] auto change_prompt() const -> bool override;

    private:

        const Context& m_context;
    };
}

#endif
