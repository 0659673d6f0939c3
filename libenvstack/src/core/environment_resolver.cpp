// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "envstack/core/context.hpp"
#include "envstack/core/environment_resolver.hpp"
#include "envstack/core/logging.hpp"
#include "envstack/util/environment.hpp"
#include "envstack/util/string.hpp"

namespace envstack
{
    auto bin_dir(ShellFlavor flavor, const fs::u8path& prefix) -> fs::u8path
    {
        if (flavor == ShellFlavor::cmd || flavor == ShellFlavor::powershell)
        {
            return prefix / "Scripts";
        }
        return prefix / "bin";
    }

    auto is_path_reference(std::string_view env_ref) -> bool
    {
        return util::contains(env_ref, '/') || util::contains(env_ref, '\\')
               || util::starts_with(env_ref, '~') || env_ref == "." || env_ref == "..";
    }

    auto EnvironmentResolver::check_env(ShellFlavor flavor, std::string_view env_ref) const -> bool
    {
        return resolve_prefix(flavor, env_ref).has_value();
    }

    auto EnvironmentResolver::resolve_bin_dir(ShellFlavor flavor, std::string_view env_ref) const
        -> expected_t<fs::u8path>
    {
        return resolve_prefix(flavor, env_ref)
            .map([flavor](const fs::u8path& prefix) { return bin_dir(flavor, prefix); });
    }

    ContextResolver::ContextResolver(const Context& context)
        : m_context(context)
    {
    }

    namespace
    {
        auto not_found(std::string_view env_ref) -> tl::unexpected<envstack_error>
        {
            return make_unexpected(
                fmt::format("Could not find environment: {}", env_ref),
                envstack_error_code::environment_not_found
            );
        }

        auto expand_home(std::string_view env_ref) -> fs::u8path
        {
            if (env_ref == "~" || util::starts_with(env_ref, "~/"))
            {
                return fs::u8path(util::user_home_dir()) / util::remove_prefix(env_ref, "~/");
            }
            return fs::u8path(env_ref);
        }
    }

    auto ContextResolver::resolve_prefix(ShellFlavor, std::string_view env_ref) const
        -> expected_t<fs::u8path>
    {
        if (env_ref.empty() || env_ref == ROOT_ENV_NAME || env_ref == BASE_ENV_NAME)
        {
            return m_context.prefix_params.root_prefix;
        }

        std::error_code ec;
        if (is_path_reference(env_ref))
        {
            const auto prefix = fs::absolute(expand_home(env_ref), ec).lexically_normal();
            if (!ec && fs::is_directory(prefix, ec))
            {
                // Drop the trailing separator left by lexically_normal on "dir/".
                return prefix.has_filename() ? prefix : prefix.parent_path();
            }
            return not_found(env_ref);
        }

        for (const auto& envs_dir : m_context.envs_dirs)
        {
            const auto candidate = envs_dir / env_ref;
            if (fs::is_directory(candidate, ec))
            {
                LOG_DEBUG << fmt::format("Environment '{}' found at {}", env_ref, candidate.string());
                return fs::absolute(candidate, ec).lexically_normal();
            }
        }
        return not_found(env_ref);
    }

    auto ContextResolver::change_prompt() const -> bool
    {
        return m_context.change_ps1;
    }
}
