// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACKTESTS_HPP
#define ENVSTACKTESTS_HPP

#include <array>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "envstack/core/context.hpp"
#include "envstack/core/environment_resolver.hpp"
#include "envstack/core/hooks.hpp"
#include "envstack/core/shell_detection.hpp"
#include "envstack/fs/filesystem.hpp"
#include "envstack/util/environment.hpp"
#include "envstack/util/string.hpp"

namespace envstacktests
{
    // Provides the context object to use in all tests needing it.
    inline envstack::Context& context()
    {
        static envstack::Context ctx{ { /* .enable_logging = */ true } };
        return ctx;
    }

    class EnvironmentCleaner
    {
    public:

        EnvironmentCleaner();

        template <typename... Func>
        EnvironmentCleaner(Func&&... cleaner);

        ~EnvironmentCleaner();

    private:

        envstack::util::environment_map m_env;
    };

    class CleanCondaEnv
    {
    public:

        inline static constexpr auto prefixes = std::array<std::string_view, 4>{
            "CONDA",
            "_CONDA",
            "__CONDA",
            "ENVSTACK",
        };

        void operator()(const envstack::util::environment_map& env);
    };

    /** A directory removed with its content on destruction. */
    class TemporaryDirectory
    {
    public:

        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        [[nodiscard]] auto path() const -> const envstack::fs::u8path&;

    private:

        envstack::fs::u8path m_path;
    };

    /** Write a file, creating its parent directories. */
    void write_file(const envstack::fs::u8path& file, std::string_view content);

    /** Create an empty environment with its ``bin`` and ``conda-meta`` directories. */
    auto make_environment(const envstack::fs::u8path& prefix) -> envstack::fs::u8path;

    /** Process table holding a fixed set of processes. */
    class FakeProcessTable : public envstack::ProcessTable
    {
    public:

        void add(int pid, int ppid, std::string comm, std::vector<std::string> args = {});

        [[nodiscard]] auto lookup(int pid) const
            -> std::optional<envstack::ProcessInfo> override;

    private:

        std::map<int, envstack::ProcessInfo> m_processes;
    };

    /** Records the hooks it is asked to run and fails those listed in ``failing``. */
    class RecordingHookRunner : public envstack::HookRunner
    {
    public:

        struct Call
        {
            envstack::ShellFlavor flavor;
            envstack::fs::u8path script;
            envstack::util::environment_map env;
        };

        std::vector<Call> calls = {};
        std::vector<std::string> failing = {};

        [[nodiscard]] auto run(
            envstack::ShellFlavor flavor,
            const envstack::fs::u8path& script,
            const envstack::util::environment_map& env
        ) -> envstack::expected_t<void> override;

        [[nodiscard]] auto script_names() const -> std::vector<std::string>;
    };

    /** Resolves names from a fixed table, paths are used as-is. */
    class FakeResolver : public envstack::EnvironmentResolver
    {
    public:

        std::map<std::string, envstack::fs::u8path> environments = {};
        /** Binary directories by prefix, others use the default layout. */
        std::map<std::string, envstack::fs::u8path> bin_dirs = {};
        bool decorate_prompt = true;

        [[nodiscard]] auto
        resolve_prefix(envstack::ShellFlavor flavor, std::string_view env_ref) const
            -> envstack::expected_t<envstack::fs::u8path> override;

        [[nodiscard]] auto
        resolve_bin_dir(envstack::ShellFlavor flavor, std::string_view env_ref) const
            -> envstack::expected_t<envstack::fs::u8path> override;

        [[nodiscard]] auto change_prompt() const -> bool override;
    };

    /******************************************
     *  Implementation of EnvironmentCleaner  *
     ******************************************/

    inline EnvironmentCleaner::EnvironmentCleaner()
        : m_env(envstack::util::get_env_map())
    {
    }

    template <typename... Func>
    EnvironmentCleaner::EnvironmentCleaner(Func&&... cleaner)
        : EnvironmentCleaner()
    {
        ((cleaner(const_cast<const envstack::util::environment_map&>(m_env))), ...);
    }

    inline EnvironmentCleaner::~EnvironmentCleaner()
    {
        envstack::util::set_env_map(m_env);
    }

    /*************************************
     *  Implementation of CleanCondaEnv  *
     *************************************/

    inline void CleanCondaEnv::operator()(const envstack::util::environment_map& env)
    {
        for (const auto& [key, val] : env)
        {
            for (const auto prefix : prefixes)
            {
                if (envstack::util::starts_with(key, prefix))
                {
                    envstack::util::unset_env(key);
                    break;
                }
            }
        }
    }

    /******************************************
     *  Implementation of TemporaryDirectory  *
     ******************************************/

    inline TemporaryDirectory::TemporaryDirectory()
    {
        static constexpr std::string_view chars = "0123456789abcdefghijklmnopqrstuvwxyz";
        auto engine = std::mt19937(std::random_device{}());
        auto dist = std::uniform_int_distribution<std::size_t>(0, chars.size() - 1);
        auto name = std::string("envstack_test_");
        for (int i = 0; i < 12; ++i)
        {
            name += chars[dist(engine)];
        }
        // Canonical so that it compares equal to resolved paths.
        m_path = envstack::fs::canonical(envstack::fs::temp_directory_path()) / name;
        envstack::fs::create_directories(m_path);
    }

    inline TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        envstack::fs::remove_all(m_path, ec);
    }

    inline auto TemporaryDirectory::path() const -> const envstack::fs::u8path&
    {
        return m_path;
    }

    inline void write_file(const envstack::fs::u8path& file, std::string_view content)
    {
        envstack::fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    inline auto make_environment(const envstack::fs::u8path& prefix) -> envstack::fs::u8path
    {
        envstack::fs::create_directories(prefix / "bin");
        envstack::fs::create_directories(prefix / "conda-meta");
        return prefix;
    }

    /****************************************
     *  Implementation of FakeProcessTable  *
     ****************************************/

    inline void
    FakeProcessTable::add(int pid, int ppid, std::string comm, std::vector<std::string> args)
    {
        if (args.empty())
        {
            args.push_back(comm);
        }
        m_processes[pid] = envstack::ProcessInfo{
            .pid = pid,
            .ppid = ppid,
            .comm = std::move(comm),
            .args = std::move(args),
        };
    }

    inline auto FakeProcessTable::lookup(int pid) const -> std::optional<envstack::ProcessInfo>
    {
        if (auto it = m_processes.find(pid); it != m_processes.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    /*******************************************
     *  Implementation of RecordingHookRunner  *
     *******************************************/

    inline auto RecordingHookRunner::run(
        envstack::ShellFlavor flavor,
        const envstack::fs::u8path& script,
        const envstack::util::environment_map& env
    ) -> envstack::expected_t<void>
    {
        calls.push_back({ flavor, script, env });
        const auto name = script.filename().string();
        for (const auto& fail : failing)
        {
            if (name == fail)
            {
                return envstack::make_unexpected(
                    "Hook " + name + " failed",
                    envstack::envstack_error_code::hook_failure
                );
            }
        }
        return {};
    }

    inline auto RecordingHookRunner::script_names() const -> std::vector<std::string>
    {
        auto out = std::vector<std::string>();
        for (const auto& call : calls)
        {
            out.push_back(call.script.filename().string());
        }
        return out;
    }

    /************************************
     *  Implementation of FakeResolver  *
     ************************************/

    inline auto
    FakeResolver::resolve_prefix(envstack::ShellFlavor, std::string_view env_ref) const
        -> envstack::expected_t<envstack::fs::u8path>
    {
        if (auto it = environments.find(std::string(env_ref)); it != environments.end())
        {
            return it->second;
        }
        if (envstack::is_path_reference(env_ref))
        {
            const auto path = envstack::fs::u8path(env_ref);
            if (envstack::fs::is_directory(path))
            {
                return path;
            }
        }
        return envstack::make_unexpected(
            "Could not find environment: " + std::string(env_ref),
            envstack::envstack_error_code::environment_not_found
        );
    }

    inline auto
    FakeResolver::resolve_bin_dir(envstack::ShellFlavor flavor, std::string_view env_ref) const
        -> envstack::expected_t<envstack::fs::u8path>
    {
        return resolve_prefix(flavor, env_ref)
            .map(
                [&](const envstack::fs::u8path& prefix)
                {
                    if (auto it = bin_dirs.find(prefix.string()); it != bin_dirs.end())
                    {
                        return it->second;
                    }
                    return envstack::bin_dir(flavor, prefix);
                }
            );
    }

    inline auto FakeResolver::change_prompt() const -> bool
    {
        return decorate_prompt;
    }
}

#endif
