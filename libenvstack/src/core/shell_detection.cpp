// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <reproc++/run.hpp>

#include "envstack/core/logging.hpp"
#include "envstack/core/shell_detection.hpp"
#include "envstack/util/build.hpp"
#include "envstack/util/os.hpp"
#include "envstack/util/string.hpp"

namespace envstack
{
    namespace
    {
        constexpr auto flavor_names = std::array<std::pair<ShellFlavor, std::string_view>, 11>{ {
            { ShellFlavor::bash, "bash" },
            { ShellFlavor::zsh, "zsh" },
            { ShellFlavor::dash, "dash" },
            { ShellFlavor::posh, "posh" },
            { ShellFlavor::ksh, "ksh" },
            { ShellFlavor::csh, "csh" },
            { ShellFlavor::tcsh, "tcsh" },
            { ShellFlavor::cmd, "cmd.exe" },
            { ShellFlavor::powershell, "powershell" },
            { ShellFlavor::xonsh, "xonsh" },
            { ShellFlavor::unknown, "unknown" },
        } };

        // Environment variables only defined by a given shell, by priority.
        constexpr auto shell_markers = std::array<std::pair<std::string_view, ShellFlavor>, 5>{ {
            { "ZSH_VERSION", ShellFlavor::zsh },
            { "BASH_VERSION", ShellFlavor::bash },
            { "KSH_VERSION", ShellFlavor::ksh },
            { "POSH_VERSION", ShellFlavor::posh },
            { "XONSH_VERSION", ShellFlavor::xonsh },
        } };

        auto program_name(std::string_view arg) -> std::string
        {
            auto name = util::remove_prefix(arg, '-');
            if (const auto pos = name.find_last_of("/\\"); pos != std::string_view::npos)
            {
                name = name.substr(pos + 1);
            }
            return util::to_lower(util::remove_suffix(name, ".exe"));
        }

        auto is_login_flag(std::string_view arg) -> bool
        {
            return arg == "-l" || arg == "--login";
        }

        auto is_python(std::string_view name) -> bool
        {
            return util::starts_with(name, "python");
        }
    }

    auto to_string(ShellFlavor flavor) -> std::string_view
    {
        for (const auto& [f, name] : flavor_names)
        {
            if (f == flavor)
            {
                return name;
            }
        }
        return "unknown";
    }

    auto shell_flavor_from_name(std::string_view name) -> ShellFlavor
    {
        const auto prog = program_name(util::strip(name));
        if (prog == "bash")
        {
            return ShellFlavor::bash;
        }
        if (prog == "zsh")
        {
            return ShellFlavor::zsh;
        }
        if (prog == "dash")
        {
            return ShellFlavor::dash;
        }
        if (prog == "posh")
        {
            return ShellFlavor::posh;
        }
        if (prog == "ksh" || prog == "mksh" || prog == "pdksh" || prog == "ksh93")
        {
            return ShellFlavor::ksh;
        }
        if (prog == "csh")
        {
            return ShellFlavor::csh;
        }
        if (prog == "tcsh")
        {
            return ShellFlavor::tcsh;
        }
        if (prog == "cmd")
        {
            return ShellFlavor::cmd;
        }
        if (prog == "powershell" || prog == "pwsh" || prog == "pwsh-preview")
        {
            return ShellFlavor::powershell;
        }
        if (prog == "xonsh")
        {
            return ShellFlavor::xonsh;
        }
        return ShellFlavor::unknown;
    }

    auto all_shell_flavors() -> std::vector<ShellFlavor>
    {
        auto out = std::vector<ShellFlavor>();
        for (const auto& [f, name] : flavor_names)
        {
            if (f != ShellFlavor::unknown)
            {
                out.push_back(f);
            }
        }
        return out;
    }

    /**********************
     *  Process tables    *
     **********************/

    ProcFsProcessTable::ProcFsProcessTable(fs::u8path proc_root)
        : m_proc_root(std::move(proc_root))
    {
    }

    auto ProcFsProcessTable::lookup(int pid) const -> std::optional<ProcessInfo>
    {
        const auto dir = m_proc_root / std::to_string(pid);
        std::error_code ec;
        if (!fs::is_directory(dir, ec))
        {
            return std::nullopt;
        }

        auto info = ProcessInfo{ .pid = pid };

        if (auto comm = std::ifstream(dir / "comm"); comm.good())
        {
            std::getline(comm, info.comm);
        }

        if (auto cmdline = std::ifstream(dir / "cmdline", std::ios::binary); cmdline.good())
        {
            const auto content = std::string(
                std::istreambuf_iterator<char>(cmdline),
                std::istreambuf_iterator<char>()
            );
            for (auto& arg : util::split(content, '\0'))
            {
                if (!arg.empty())
                {
                    info.args.push_back(std::move(arg));
                }
            }
        }

        // The command name in stat is within parentheses and may hold spaces, fields are
        // counted from the last closing one: state then ppid.
        if (auto stat = std::ifstream(dir / "stat"); stat.good())
        {
            std::string line;
            std::getline(stat, line);
            if (const auto pos = line.rfind(')'); pos != std::string::npos)
            {
                auto fields = std::istringstream(line.substr(pos + 1));
                std::string state;
                fields >> state >> info.ppid;
            }
        }

        if (info.comm.empty() && info.args.empty())
        {
            return std::nullopt;
        }
        return info;
    }

    auto PsProcessTable::lookup(int pid) const -> std::optional<ProcessInfo>
    {
        const auto run_ps = [pid](std::string_view field) -> std::optional<std::string>
        {
            const auto args = std::array<std::string, 5>{
                "ps", "-o", fmt::format("{}=", field), "-p", std::to_string(pid)
            };
            auto out = std::string();
            auto err = std::string();
            auto [status, ec] = reproc::run(
                args,
                reproc::options{},
                reproc::sink::string(out),
                reproc::sink::string(err)
            );
            if (ec || status != 0)
            {
                LOG_DEBUG << fmt::format(
                    "Calling ps for process {} failed: {}",
                    pid,
                    ec ? ec.message() : std::string(util::strip(err))
                );
                return std::nullopt;
            }
            return std::string(util::strip(out));
        };

        auto comm = run_ps("comm");
        if (!comm)
        {
            return std::nullopt;
        }
        auto info = ProcessInfo{ .pid = pid, .comm = std::move(*comm) };
        if (auto args = run_ps("args"))
        {
            for (auto& arg : util::split(*args, ' '))
            {
                if (!arg.empty())
                {
                    info.args.push_back(std::move(arg));
                }
            }
        }
        if (auto ppid = run_ps("ppid"))
        {
            try
            {
                info.ppid = std::stoi(*ppid);
            }
            catch (const std::exception&)
            {
                LOG_DEBUG << "Unexpected ppid output from ps: " << *ppid;
            }
        }
        return info;
    }

    auto make_system_process_table() -> std::unique_ptr<ProcessTable>
    {
        if (util::on_linux)
        {
            return std::make_unique<ProcFsProcessTable>();
        }
        return std::make_unique<PsProcessTable>();
    }

    auto current_system_info() -> SystemInfo
    {
        auto info = SystemInfo{};
        if (auto name_version = util::unix_name_version())
        {
            info.sysname = name_version->first;
        }
        else
        {
            LOG_DEBUG << name_version.error().message;
        }

        if (util::on_linux)
        {
            if (auto distro = util::linux_distribution_id())
            {
                info.distribution = std::move(distro).value();
            }
            else
            {
                LOG_DEBUG << distro.error().message;
            }
        }

        std::error_code ec;
        if (fs::is_symlink("/bin/sh", ec))
        {
            auto target = fs::canonical("/bin/sh", ec);
            if (!ec)
            {
                info.bin_sh_target = std::move(target);
            }
        }

        info.login_shell = util::get_env("SHELL").value_or("");

        // The detector runs as a child process of the shell, one level deeper.
        if (auto level = util::get_env("SHLVL"))
        {
            try
            {
                info.shell_level = std::stoi(*level) - 1;
            }
            catch (const std::exception&)
            {
                info.shell_level = 0;
            }
        }
        return info;
    }

    /**********************
     *  ShellDetector     *
     **********************/

    ShellDetector::ShellDetector(const ProcessTable& table, SystemInfo info, util::environment_map env)
        : m_table(table)
        , m_info(std::move(info))
        , m_env(std::move(env))
    {
    }

    auto ShellDetector::from_markers() const -> std::optional<ShellDetection>
    {
        for (const auto& [marker, flavor] : shell_markers)
        {
            if (auto it = m_env.find(std::string(marker)); it != m_env.end() && !it->second.empty())
            {
                return ShellDetection{
                    .flavor = flavor,
                    .process_name = std::string(to_string(flavor)),
                    .login = false,
                    .method = fmt::format("environment marker {}", marker),
                };
            }
        }
        return std::nullopt;
    }

    auto ShellDetector::disambiguate_sh(bool login) const -> ShellDetection
    {
        auto out = ShellDetection{ .process_name = "sh", .login = login };

        // Login shells are reported as "-sh" on some systems whatever the real shell is.
        if (login && m_info.shell_level <= 1 && !m_info.login_shell.empty())
        {
            if (auto flavor = shell_flavor_from_name(m_info.login_shell);
                flavor != ShellFlavor::unknown)
            {
                out.flavor = flavor;
                out.method = "login shell";
                return out;
            }
        }
        if (m_info.bin_sh_target)
        {
            if (auto flavor = shell_flavor_from_name(m_info.bin_sh_target->filename().string());
                flavor != ShellFlavor::unknown)
            {
                out.flavor = flavor;
                out.method = "/bin/sh link";
                return out;
            }
        }
        if (m_info.sysname == "Darwin")
        {
            out.flavor = ShellFlavor::bash;
            out.method = "system";
            return out;
        }
        if (m_info.distribution == "ubuntu" || m_info.distribution == "debian")
        {
            out.flavor = ShellFlavor::dash;
            out.method = "distribution";
            return out;
        }
        if (m_info.sysname == "Linux")
        {
            out.flavor = ShellFlavor::bash;
            out.method = "system";
            return out;
        }
        // Other Unix systems ship a plain POSIX shell.
        out.flavor = ShellFlavor::dash;
        out.method = "system";
        return out;
    }

    auto ShellDetector::from_process(const ProcessInfo& process) const -> ShellDetection
    {
        const auto& arg0 = process.args.empty() ? process.comm : process.args.front();
        auto out = ShellDetection{
            .process_name = program_name(arg0),
            .login = util::starts_with(arg0, '-'),
            .method = "process",
        };
        // Truncated or renamed argv[0], fall back on the kernel command name.
        if (out.process_name.empty())
        {
            out.process_name = program_name(process.comm);
        }

        for (std::size_t i = 1; i < process.args.size(); ++i)
        {
            if (is_login_flag(process.args[i]))
            {
                out.login = true;
            }
        }

        if (is_python(out.process_name))
        {
            for (std::size_t i = 1; i < process.args.size(); ++i)
            {
                if (program_name(process.args[i]) == "xonsh")
                {
                    out.flavor = ShellFlavor::xonsh;
                    out.process_name = "xonsh";
                    return out;
                }
            }
            return out;
        }

        if (out.process_name == "sh")
        {
            return disambiguate_sh(out.login);
        }

        out.flavor = shell_flavor_from_name(out.process_name);
        if (out.flavor == ShellFlavor::unknown && !process.comm.empty())
        {
            out.flavor = shell_flavor_from_name(process.comm);
        }
        return out;
    }

    auto ShellDetector::detect(int pid) const -> expected_t<ShellDetection>
    {
        if (auto marked = from_markers())
        {
            LOG_DEBUG << fmt::format("Shell detected from {}", marked->method);
            return std::move(marked).value();
        }

        const auto process = m_table.lookup(pid);
        if (!process)
        {
            return make_unexpected(
                fmt::format("Could not inspect process {} to detect the shell", pid),
                envstack_error_code::unrecognized_shell
            );
        }

        auto detection = from_process(*process);
        if (detection.flavor == ShellFlavor::unknown)
        {
            return make_unexpected(
                fmt::format(
                    "Unrecognized shell '{}' (process {}), use --shell to select one",
                    detection.process_name,
                    pid
                ),
                envstack_error_code::unrecognized_shell
            );
        }
        LOG_DEBUG << fmt::format(
            "Shell '{}' detected from {} '{}'{}",
            to_string(detection.flavor),
            detection.method,
            detection.process_name,
            detection.login ? " (login)" : ""
        );
        return detection;
    }

    auto ShellDetector::detect() const -> expected_t<ShellDetection>
    {
        return detect(util::parent_process_id());
    }

    auto detect_shell() -> expected_t<ShellDetection>
    {
        const auto table = make_system_process_table();
        return ShellDetector(*table, current_system_info(), util::get_env_map()).detect();
    }
}
