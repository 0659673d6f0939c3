// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>

#include <fmt/format.h>

#include "envstack/core/activation.hpp"
#include "envstack/core/context.hpp"
#include "envstack/core/environment_resolver.hpp"
#include "envstack/core/hooks.hpp"
#include "envstack/core/logging.hpp"
#include "envstack/util/path_list.hpp"
#include "envstack/util/string.hpp"

extern const char data_envstack_sh[];
extern const char data_envstack_csh[];
extern const char data_envstack_bat[];
extern const char data_envstack_ps1[];
extern const char data_envstack_xsh[];

namespace envstack
{
    namespace
    {
        auto hooks_warning() -> logging::MessageLogger
        {
            return logging::MessageLogger(log_level::warn, logging::log_source::hooks);
        }

        auto hook_contents(std::string contents, const fs::u8path& exe, ShellFlavor flavor)
            -> std::string
        {
            util::replace_all(contents, "@ENVSTACK_EXE@", exe.string());
            util::replace_all(contents, "@ENVSTACK_SHELL@", to_string(flavor));
            return contents;
        }

        auto random_alphanumeric(std::size_t len) -> std::string
        {
            static constexpr std::string_view chars = "0123456789abcdefghijklmnopqrstuvwxyz";
            auto engine = std::mt19937(std::random_device{}());
            auto dist = std::uniform_int_distribution<std::size_t>(0, chars.size() - 1);
            auto out = std::string(len, '0');
            std::generate(out.begin(), out.end(), [&] { return chars[dist(engine)]; });
            return out;
        }
    }

    /*****************************
     * Activator implementation *
     *****************************/

    Activator::Activator(
        const Context& context,
        ShellFlavor flavor,
        const EnvironmentResolver& resolver,
        HookRunner& hook_runner
    )
        : m_context(context)
        , m_flavor(flavor)
        , m_resolver(resolver)
        , m_hook_runner(hook_runner)
    {
    }

    auto Activator::flavor() const -> ShellFlavor
    {
        return m_flavor;
    }

    auto Activator::rehash() const -> std::string
    {
        return {};
    }

    auto Activator::output(std::string code) const -> expected_t<std::string>
    {
        return code;
    }

    auto Activator::prompt_modifier(const EnvironmentState& state) const -> std::string
    {
        auto modifier = m_context.env_prompt;
        util::replace_all(modifier, "{default_env}", state.default_env);
        util::replace_all(modifier, "{prefix}", state.prefix.string());
        util::replace_all(modifier, "{name}", state.prefix.filename().string());
        return modifier;
    }

    void Activator::push(
        EnvironmentState& state,
        const fs::u8path& prefix,
        const fs::u8path& bin,
        std::string default_env
    ) const
    {
        const int old_depth = state.stack_depth;

        // The new decoration replaces the one of the active environment.
        auto undecorated_prompt = state.prompt;
        if (state.is_active() && undecorated_prompt)
        {
            const auto current = prompt_modifier(state);
            if (!current.empty() && util::starts_with(*undecorated_prompt, current))
            {
                undecorated_prompt->erase(0, current.size());
            }
        }
        if (state.is_active())
        {
            state.stacked.push_back(StackFrame{
                .prefix = state.prefix,
                .default_env = state.default_env,
                .prompt_backup = state.prompt_backup,
            });
        }
        else if (m_flavor == ShellFlavor::cmd)
        {
            state.path_backup = state.path_entries;
        }
        if (!state.is_active() && !state.path_defined)
        {
            state.path_unset = true;
        }

        state.path_entries.insert(state.path_entries.begin(), bin.string());
        state.path_defined = true;
        state.prefix = prefix;
        state.default_env = std::move(default_env);

        state.prompt_backup.reset();
        if (m_resolver.change_prompt() && state.prompt)
        {
            state.prompt_backup = state.prompt;
            state.prompt = prompt_modifier(state) + undecorated_prompt.value_or("");
        }

        std::vector<std::string> clobbered;
        for (const auto& [name, value] : get_environment_vars(prefix))
        {
            if (name == env_var::path)
            {
                LOG_WARNING << "Ignoring variable " << name << " of " << prefix.string();
                continue;
            }
            if (auto it = state.variables.find(name); it != state.variables.end())
            {
                clobbered.push_back(name);
                auto saved = it->second;
                state.variables[env_var::saved_value(old_depth, name)] = std::move(saved);
            }
            if (value == ENV_VAR_UNSET_VALUE)
            {
                state.variables.erase(name);
            }
            else
            {
                state.variables[name] = value;
            }
        }
        if (!clobbered.empty())
        {
            LOG_WARNING << "Overwriting variables: " << util::join(",", clobbered);
        }

        state.stack_depth = old_depth + 1;
    }

    auto Activator::active_bin_dir(const EnvironmentState& state) const -> fs::u8path
    {
        if (auto bin = m_resolver.resolve_bin_dir(m_flavor, state.prefix.string()))
        {
            return *bin;
        }
        // The environment may have been removed since its activation.
        return bin_dir(m_flavor, state.prefix);
    }

    void Activator::pop(EnvironmentState& state) const
    {
        const int new_depth = state.stack_depth - 1;

        if (state.prompt_backup)
        {
            state.prompt = std::move(state.prompt_backup);
            state.prompt_backup.reset();
        }

        const auto bin = active_bin_dir(state).string();
        auto path = util::cleanup(
            state.path(),
            util::pathsep(),
            util::CleanupMode::remove,
            { bin, bin + "/" }
        );
        if (path)
        {
            state.set_path(*path);
        }
        else
        {
            LOG_ERROR << "Could not remove " << bin << " from " << env_var::path << ": "
                      << path.error().what();
        }
        if (new_depth == 0 && state.path_backup)
        {
            state.path_entries = std::move(*state.path_backup);
            state.path_backup.reset();
        }
        if (new_depth == 0 && state.path_unset)
        {
            state.path_defined = !state.path_entries.empty();
            state.path_unset = false;
        }

        for (const auto& [name, value] : get_environment_vars(state.prefix))
        {
            if (name == env_var::path)
            {
                continue;
            }
            state.variables.erase(name);
            const auto save_var = env_var::saved_value(new_depth, name);
            if (auto it = state.variables.find(save_var); it != state.variables.end())
            {
                auto saved = std::move(it->second);
                state.variables.erase(it);
                state.variables[name] = std::move(saved);
            }
        }

        if (state.stacked.empty())
        {
            state.prefix.clear();
            state.default_env.clear();
        }
        else
        {
            auto frame = std::move(state.stacked.back());
            state.stacked.pop_back();
            state.prefix = std::move(frame.prefix);
            state.default_env = std::move(frame.default_env);
            state.prompt_backup = std::move(frame.prompt_backup);
        }
        state.stack_depth = new_depth;
    }

    void Activator::run_activate_hooks(const EnvironmentState& state) const
    {
        const auto env = state.to_env_map(m_flavor);
        for (const auto& script : find_activate_scripts(m_flavor, state.prefix))
        {
            if (auto res = m_hook_runner.run(m_flavor, script, env); !res)
            {
                hooks_warning().stream() << res.error().what();
            }
        }
    }

    void Activator::run_deactivate_hooks(const EnvironmentState& state) const
    {
        const auto env = state.to_env_map(m_flavor);
        for (const auto& script : find_deactivate_scripts(m_flavor, state.prefix))
        {
            if (auto res = m_hook_runner.run(m_flavor, script, env); !res)
            {
                hooks_warning().stream() << res.error().what();
            }
        }
    }

    auto Activator::activate(EnvironmentState& state, std::string_view env_ref, bool stack)
        -> expected_t<void>
    {
        if (!m_resolver.check_env(m_flavor, env_ref))
        {
            return make_unexpected(
                fmt::format("Could not find environment: {}", env_ref),
                envstack_error_code::environment_not_found
            );
        }
        auto prefix = m_resolver.resolve_prefix(m_flavor, env_ref);
        if (!prefix)
        {
            return forward_error(prefix);
        }
        auto bin = m_resolver.resolve_bin_dir(m_flavor, env_ref);
        if (!bin)
        {
            return forward_error(bin);
        }

        std::string default_env;
        if (env_ref.empty())
        {
            default_env = BASE_ENV_NAME;
        }
        else if (is_path_reference(env_ref))
        {
            default_env = prefix->string();
        }
        else
        {
            default_env = env_ref;
        }

        LOG_DEBUG << fmt::format(
            "Activating {} at {} (depth {}, stack {})",
            default_env,
            prefix->string(),
            state.stack_depth,
            stack
        );

        if (state.is_active() && !(stack && state.prefix != *prefix))
        {
            run_deactivate_hooks(state);
            pop(state);
        }
        push(state, *prefix, *bin, std::move(default_env));
        run_activate_hooks(state);
        return {};
    }

    auto Activator::deactivate(EnvironmentState& state) -> expected_t<void>
    {
        if (!state.is_active())
        {
            LOG_DEBUG << "No active environment to deactivate";
            return {};
        }
        LOG_DEBUG << fmt::format(
            "Deactivating {} (depth {})",
            state.prefix.string(),
            state.stack_depth
        );
        run_deactivate_hooks(state);
        pop(state);
        return {};
    }

    auto Activator::reactivate(EnvironmentState& state) -> expected_t<void>
    {
        if (!state.is_active())
        {
            LOG_DEBUG << "No active environment to reactivate";
            return {};
        }

        const auto prefix_ref = state.prefix.string();
        if (!m_resolver.check_env(m_flavor, prefix_ref))
        {
            return make_unexpected(
                fmt::format("Could not find environment: {}", prefix_ref),
                envstack_error_code::environment_not_found
            );
        }
        auto bin = m_resolver.resolve_bin_dir(m_flavor, prefix_ref);
        if (!bin)
        {
            return forward_error(bin);
        }

        const auto prefix = state.prefix;
        auto default_env = state.default_env;
        run_deactivate_hooks(state);
        pop(state);
        push(state, prefix, *bin, std::move(default_env));
        run_activate_hooks(state);
        return {};
    }

    auto Activator::build_transform(
        const util::environment_map& env,
        ActivationType type,
        std::string_view env_ref,
        bool stack
    ) -> expected_t<EnvironmentTransform>
    {
        auto state = EnvironmentState::from_env_map(env, m_flavor);
        const auto before = state.to_env_map(m_flavor);

        auto res = expected_t<void>();
        switch (type)
        {
            case ActivationType::activate:
                res = activate(state, env_ref, stack);
                break;
            case ActivationType::deactivate:
                res = deactivate(state);
                break;
            case ActivationType::reactivate:
                res = reactivate(state);
                break;
        }
        if (!res)
        {
            return forward_error(res);
        }
        return diff_environments(before, state.to_env_map(m_flavor), m_flavor);
    }

    auto Activator::shell_code(
        const util::environment_map& env,
        ActivationType type,
        std::string_view env_ref,
        bool stack
    ) -> expected_t<std::string>
    {
        auto transform = build_transform(env, type, env_ref, stack);
        if (!transform)
        {
            return forward_error(transform);
        }
        if (transform->empty())
        {
            return output(std::string());
        }
        return output(script(*transform) + rehash());
    }

    /*********************************
     * PosixActivator implementation *
     *********************************/

    namespace
    {
        auto posix_quote(std::string_view value) -> std::string
        {
            auto quoted = std::string(value);
            // End the quote, add an escaped quote and start a new quote.
            util::replace_all(quoted, "'", "'\"'\"'");
            return fmt::format("'{}'", quoted);
        }
    }

    PosixActivator::PosixActivator(
        const Context& context,
        ShellFlavor flavor,
        const EnvironmentResolver& resolver,
        HookRunner& hook_runner
    )
        : Activator(context, flavor, resolver, hook_runner)
    {
    }

    auto PosixActivator::script(const EnvironmentTransform& env_transform) const -> std::string
    {
        std::stringstream out;
        if (env_transform.export_path)
        {
            out << "export PATH=" << posix_quote(*env_transform.export_path) << "\n";
        }

        for (const std::string& uvar : env_transform.unset_vars)
        {
            out << "unset " << uvar << "\n";
        }

        for (const auto& [skey, svar] : env_transform.set_vars)
        {
            out << skey << "=" << posix_quote(svar) << "\n";
        }

        for (const auto& [ekey, evar] : env_transform.export_vars)
        {
            out << "export " << ekey << "=" << posix_quote(evar) << "\n";
        }

        return out.str();
    }

    auto PosixActivator::rehash() const -> std::string
    {
        if (flavor() == ShellFlavor::zsh)
        {
            return "rehash\n";
        }
        return "hash -r\n";
    }

    auto PosixActivator::hook(const fs::u8path& exe) const -> std::string
    {
        return hook_contents(data_envstack_sh, exe, flavor());
    }

    /*******************************
     * CshActivator implementation *
     *******************************/

    CshActivator::CshActivator(
        const Context& context,
        ShellFlavor flavor,
        const EnvironmentResolver& resolver,
        HookRunner& hook_runner
    )
        : Activator(context, flavor, resolver, hook_runner)
    {
    }

    auto CshActivator::script(const EnvironmentTransform& env_transform) const -> std::string
    {
        std::stringstream out;
        if (env_transform.export_path)
        {
            out << "setenv PATH " << posix_quote(*env_transform.export_path) << ";\n";
        }

        for (const std::string& uvar : env_transform.unset_vars)
        {
            if (uvar == "prompt")
            {
                out << "unset prompt;\n";
            }
            else
            {
                out << "unsetenv " << uvar << ";\n";
            }
        }

        for (const auto& [skey, svar] : env_transform.set_vars)
        {
            out << "set " << skey << "=" << posix_quote(svar) << ";\n";
        }

        for (const auto& [ekey, evar] : env_transform.export_vars)
        {
            out << "setenv " << ekey << " " << posix_quote(evar) << ";\n";
        }

        return out.str();
    }

    auto CshActivator::rehash() const -> std::string
    {
        return "rehash;\n";
    }

    auto CshActivator::hook(const fs::u8path& exe) const -> std::string
    {
        return hook_contents(data_envstack_csh, exe, flavor());
    }

    /**********************************
     * CmdExeActivator implementation *
     **********************************/

    CmdExeActivator::CmdExeActivator(
        const Context& context,
        const EnvironmentResolver& resolver,
        HookRunner& hook_runner
    )
        : Activator(context, ShellFlavor::cmd, resolver, hook_runner)
    {
    }

    auto CmdExeActivator::script(const EnvironmentTransform& env_transform) const -> std::string
    {
        std::stringstream out;

        if (env_transform.export_path)
        {
            out << "@SET \"PATH=" << *env_transform.export_path << "\"\n";
        }

        for (const std::string& uvar : env_transform.unset_vars)
        {
            out << "@SET " << uvar << "=\n";
        }

        for (const auto& [skey, svar] : env_transform.set_vars)
        {
            out << "@SET \"" << skey << "=" << svar << "\"\n";
        }

        for (const auto& [ekey, evar] : env_transform.export_vars)
        {
            out << "@SET \"" << ekey << "=" << evar << "\"\n";
        }

        return out.str();
    }

    auto CmdExeActivator::hook(const fs::u8path& exe) const -> std::string
    {
        return hook_contents(data_envstack_bat, exe, flavor());
    }

    auto CmdExeActivator::output(std::string code) const -> expected_t<std::string>
    {
        std::error_code ec;
        const auto tmp_dir = fs::temp_directory_path(ec);
        if (ec)
        {
            return make_unexpected(
                fmt::format("Could not find a temporary directory: {}", ec.message()),
                envstack_error_code::internal_failure
            );
        }
        const auto file = tmp_dir / fmt::format("envstack_act_{}.bat", random_alphanumeric(10));

        std::ofstream out_file(file);
        out_file << code;
        out_file.close();
        if (!out_file)
        {
            return make_unexpected(
                fmt::format("Could not write activation script {}", file.string()),
                envstack_error_code::internal_failure
            );
        }
        // The calling batch file runs and deletes the script.
        return file.string() + "\n";
    }

    /**************************************
     * PowerShellActivator implementation *
     **************************************/

    namespace
    {
        auto powershell_quote(std::string_view value) -> std::string
        {
            auto quoted = std::string(value);
            util::replace_all(quoted, "'", "''");
            return fmt::format("'{}'", quoted);
        }
    }

    PowerShellActivator::PowerShellActivator(
        const Context& context,
        const EnvironmentResolver& resolver,
        HookRunner& hook_runner
    )
        : Activator(context, ShellFlavor::powershell, resolver, hook_runner)
    {
    }

    auto PowerShellActivator::script(const EnvironmentTransform& env_transform) const
        -> std::string
    {
        std::stringstream out;

        if (env_transform.export_path)
        {
            out << "$Env:PATH = " << powershell_quote(*env_transform.export_path) << "\n";
        }

        for (const std::string& uvar : env_transform.unset_vars)
        {
            out << "Remove-Item -ErrorAction SilentlyContinue Env:/" << uvar << "\n";
        }

        for (const auto& [skey, svar] : env_transform.set_vars)
        {
            out << "$Env:" << skey << " = " << powershell_quote(svar) << "\n";
        }

        for (const auto& [ekey, evar] : env_transform.export_vars)
        {
            out << "$Env:" << ekey << " = " << powershell_quote(evar) << "\n";
        }

        return out.str();
    }

    auto PowerShellActivator::hook(const fs::u8path& exe) const -> std::string
    {
        std::stringstream contents;
        contents << "$Env:ENVSTACK_EXE = " << powershell_quote(exe.string()) << "\n";
        contents << fmt::format(
            "$EnvstackModuleArgs = @{{ChangePs1 = ${}}}\n",
            m_context.change_ps1 ? "True" : "False"
        );
        contents << data_envstack_ps1 << "\n";
        contents << "Remove-Variable EnvstackModuleArgs\n";
        return contents.str();
    }

    /*********************************
     * XonshActivator implementation *
     *********************************/

    namespace
    {
        auto python_quote(std::string_view value) -> std::string
        {
            auto quoted = std::string(value);
            util::replace_all(quoted, "\\", "\\\\");
            util::replace_all(quoted, "\"", "\\\"");
            return fmt::format("\"{}\"", quoted);
        }
    }

    XonshActivator::XonshActivator(
        const Context& context,
        const EnvironmentResolver& resolver,
        HookRunner& hook_runner
    )
        : Activator(context, ShellFlavor::xonsh, resolver, hook_runner)
    {
    }

    auto XonshActivator::script(const EnvironmentTransform& env_transform) const -> std::string
    {
        std::stringstream out;

        if (env_transform.export_path)
        {
            out << "$PATH = " << python_quote(*env_transform.export_path) << "\n";
        }

        for (const std::string& uvar : env_transform.unset_vars)
        {
            out << "del $" << uvar << "\n";
        }

        for (const auto& [skey, svar] : env_transform.set_vars)
        {
            out << "$" << skey << " = " << python_quote(svar) << "\n";
        }

        for (const auto& [ekey, evar] : env_transform.export_vars)
        {
            out << "$" << ekey << " = " << python_quote(evar) << "\n";
        }

        return out.str();
    }

    auto XonshActivator::hook(const fs::u8path& exe) const -> std::string
    {
        return hook_contents(data_envstack_xsh, exe, flavor());
    }

    auto make_activator(
        const Context& context,
        ShellFlavor flavor,
        const EnvironmentResolver& resolver,
        HookRunner& hook_runner
    ) -> expected_t<std::unique_ptr<Activator>>
    {
        switch (flavor)
        {
            case ShellFlavor::bash:
            case ShellFlavor::zsh:
            case ShellFlavor::dash:
            case ShellFlavor::posh:
            case ShellFlavor::ksh:
                return std::make_unique<PosixActivator>(context, flavor, resolver, hook_runner);
            case ShellFlavor::csh:
            case ShellFlavor::tcsh:
                return std::make_unique<CshActivator>(context, flavor, resolver, hook_runner);
            case ShellFlavor::cmd:
                return std::make_unique<CmdExeActivator>(context, resolver, hook_runner);
            case ShellFlavor::powershell:
                return std::make_unique<PowerShellActivator>(context, resolver, hook_runner);
            case ShellFlavor::xonsh:
                return std::make_unique<XonshActivator>(context, resolver, hook_runner);
            case ShellFlavor::unknown:
                break;
        }
        return make_unexpected(
            fmt::format("Shell type not handled: {}", to_string(flavor)),
            envstack_error_code::unrecognized_shell
        );
    }
}
