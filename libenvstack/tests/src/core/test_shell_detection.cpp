// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <unistd.h>

#include <catch2/catch_all.hpp>

#include "envstack/core/shell_detection.hpp"
#include "envstack/util/build.hpp"
#include "envstack/util/os.hpp"

#include "envstacktests.hpp"

namespace envstack
{
    namespace
    {
        auto linux_info() -> SystemInfo
        {
            return SystemInfo{
                .sysname = "Linux",
                .distribution = "fedora",
                .bin_sh_target = std::nullopt,
                .login_shell = "/bin/bash",
                .shell_level = 1,
            };
        }

        TEST_CASE("ShellFlavor names")
        {
            CHECK(to_string(ShellFlavor::bash) == "bash");
            CHECK(to_string(ShellFlavor::cmd) == "cmd.exe");
            CHECK(to_string(ShellFlavor::powershell) == "powershell");
            CHECK(to_string(ShellFlavor::unknown) == "unknown");

            for (const auto flavor : all_shell_flavors())
            {
                CAPTURE(to_string(flavor));
                REQUIRE(shell_flavor_from_name(to_string(flavor)) == flavor);
            }
            REQUIRE(all_shell_flavors().size() == 10);
        }

        TEST_CASE("shell_flavor_from_name")
        {
            CHECK(shell_flavor_from_name("/bin/zsh") == ShellFlavor::zsh);
            CHECK(shell_flavor_from_name("-bash") == ShellFlavor::bash);
            CHECK(shell_flavor_from_name("-tcsh") == ShellFlavor::tcsh);
            CHECK(shell_flavor_from_name("mksh") == ShellFlavor::ksh);
            CHECK(shell_flavor_from_name("pwsh") == ShellFlavor::powershell);
            CHECK(shell_flavor_from_name("C:\\Windows\\System32\\cmd.exe") == ShellFlavor::cmd);
            CHECK(shell_flavor_from_name("CMD.EXE") == ShellFlavor::cmd);
            CHECK(shell_flavor_from_name(" dash ") == ShellFlavor::dash);
            CHECK(shell_flavor_from_name("sh") == ShellFlavor::unknown);
            CHECK(shell_flavor_from_name("fish") == ShellFlavor::unknown);
            CHECK(shell_flavor_from_name("") == ShellFlavor::unknown);
        }

        TEST_CASE("ShellDetector environment markers")
        {
            auto table = envstacktests::FakeProcessTable();
            table.add(100, 1, "bash");

            SECTION("Marker takes precedence over the process")
            {
                const auto detector = ShellDetector(table, linux_info(), { { "ZSH_VERSION", "5.9" } });
                const auto detection = detector.detect(100);
                REQUIRE(detection.has_value());
                REQUIRE(detection->flavor == ShellFlavor::zsh);
                REQUIRE(detection->method == "environment marker ZSH_VERSION");
            }

            SECTION("Empty marker is ignored")
            {
                const auto detector = ShellDetector(table, linux_info(), { { "ZSH_VERSION", "" } });
                REQUIRE(detector.detect(100)->flavor == ShellFlavor::bash);
            }
        }

        TEST_CASE("ShellDetector process names")
        {
            auto table = envstacktests::FakeProcessTable();
            const auto detector_for = [&](int pid, std::string comm, std::vector<std::string> args)
            {
                table.add(pid, 1, std::move(comm), std::move(args));
                return ShellDetector(table, linux_info(), {}).detect(pid);
            };

            SECTION("Plain name")
            {
                const auto detection = detector_for(10, "zsh", { "/usr/bin/zsh" });
                REQUIRE(detection.has_value());
                REQUIRE(detection->flavor == ShellFlavor::zsh);
                REQUIRE(detection->process_name == "zsh");
                REQUIRE_FALSE(detection->login);
                REQUIRE(detection->method == "process");
            }

            SECTION("Login marker")
            {
                const auto detection = detector_for(11, "bash", { "-bash" });
                REQUIRE(detection->flavor == ShellFlavor::bash);
                REQUIRE(detection->login);
            }

            SECTION("Login flags")
            {
                const auto detection = detector_for(12, "tcsh", { "tcsh", "-l" });
                REQUIRE(detection->flavor == ShellFlavor::tcsh);
                REQUIRE(detection->login);

                const auto detection2 = detector_for(13, "ksh", { "ksh", "--login" });
                REQUIRE(detection2->flavor == ShellFlavor::ksh);
                REQUIRE(detection2->login);

                const auto detection3 = detector_for(14, "bash", { "bash", "-i" });
                REQUIRE_FALSE(detection3->login);
            }

            SECTION("Renamed argv[0] falls back on the command name")
            {
                const auto detection = detector_for(15, "zsh", { "my-terminal-shell" });
                REQUIRE(detection->flavor == ShellFlavor::zsh);
            }

            SECTION("xonsh running in Python")
            {
                const auto detection = detector_for(16, "python3", { "/usr/bin/python3", "/usr/bin/xonsh" });
                REQUIRE(detection->flavor == ShellFlavor::xonsh);
                REQUIRE(detection->process_name == "xonsh");
            }

            SECTION("Plain Python is not a shell")
            {
                const auto detection = detector_for(17, "python3", { "python3", "script.py" });
                REQUIRE_FALSE(detection.has_value());
                REQUIRE(detection.error().error_code() == envstack_error_code::unrecognized_shell);
            }

            SECTION("Unsupported shell")
            {
                const auto detection = detector_for(18, "fish", { "fish" });
                REQUIRE_FALSE(detection.has_value());
                REQUIRE(detection.error().error_code() == envstack_error_code::unrecognized_shell);
            }

            SECTION("Missing process")
            {
                const auto detection = ShellDetector(table, linux_info(), {}).detect(4242);
                REQUIRE_FALSE(detection.has_value());
                REQUIRE(detection.error().error_code() == envstack_error_code::unrecognized_shell);
            }
        }

        TEST_CASE("ShellDetector sh disambiguation")
        {
            auto table = envstacktests::FakeProcessTable();
            table.add(20, 1, "sh", { "sh" });
            table.add(21, 1, "sh", { "-sh" });

            SECTION("/bin/sh link")
            {
                auto info = linux_info();
                info.bin_sh_target = "/usr/bin/dash";
                const auto detection = ShellDetector(table, info, {}).detect(20);
                REQUIRE(detection->flavor == ShellFlavor::dash);
                REQUIRE(detection->process_name == "sh");
                REQUIRE(detection->method == "/bin/sh link");
            }

            SECTION("Top level login shell")
            {
                auto info = linux_info();
                info.login_shell = "/bin/zsh";
                info.bin_sh_target = "/usr/bin/dash";
                const auto detection = ShellDetector(table, info, {}).detect(21);
                REQUIRE(detection->flavor == ShellFlavor::zsh);
                REQUIRE(detection->login);
                REQUIRE(detection->method == "login shell");
            }

            SECTION("Nested login shell uses the host")
            {
                auto info = linux_info();
                info.login_shell = "/bin/zsh";
                info.shell_level = 3;
                const auto detection = ShellDetector(table, info, {}).detect(21);
                REQUIRE(detection->flavor == ShellFlavor::bash);
                REQUIRE(detection->method == "system");
            }

            SECTION("Debian family")
            {
                auto info = linux_info();
                info.distribution = "ubuntu";
                REQUIRE(ShellDetector(table, info, {}).detect(20)->flavor == ShellFlavor::dash);
            }

            SECTION("macOS")
            {
                auto info = SystemInfo{ .sysname = "Darwin" };
                REQUIRE(ShellDetector(table, info, {}).detect(20)->flavor == ShellFlavor::bash);
            }

            SECTION("Other Unix")
            {
                auto info = SystemInfo{ .sysname = "FreeBSD" };
                REQUIRE(ShellDetector(table, info, {}).detect(20)->flavor == ShellFlavor::dash);
            }
        }

        TEST_CASE("ProcFsProcessTable")
        {
            const auto tmp_dir = envstacktests::TemporaryDirectory();
            const auto proc = tmp_dir.path();
            envstacktests::write_file(proc / "42" / "comm", "bash\n");
            envstacktests::write_file(proc / "42" / "cmdline", std::string("-bash\0--login\0", 14));
            envstacktests::write_file(proc / "42" / "stat", "42 (my (odd) name) S 7 42 42 0 -1\n");

            const auto table = ProcFsProcessTable(proc);

            SECTION("Existing process")
            {
                const auto info = table.lookup(42);
                REQUIRE(info.has_value());
                REQUIRE(info->pid == 42);
                REQUIRE(info->ppid == 7);
                REQUIRE(info->comm == "bash");
                REQUIRE(info->args == std::vector<std::string>{ "-bash", "--login" });
            }

            SECTION("Missing process")
            {
                REQUIRE_FALSE(table.lookup(43).has_value());
            }

            SECTION("Detection")
            {
                const auto detection = ShellDetector(table, linux_info(), {}).detect(42);
                REQUIRE(detection->flavor == ShellFlavor::bash);
                REQUIRE(detection->login);
            }
        }

        TEST_CASE("System process table")
        {
            if (!util::on_linux)
            {
                return;
            }
            const auto table = make_system_process_table();
            const auto self = table->lookup(static_cast<int>(::getpid()));
            REQUIRE(self.has_value());
            REQUIRE(self->ppid == util::parent_process_id());
            REQUIRE_FALSE(self->comm.empty());
        }
    }
}
