// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <optional>

#include <fmt/format.h>

#include "envstack/core/shell_detection.hpp"
#include "envstack/util/environment.hpp"
#include "envstack/util/os.hpp"

#include "envstack.hpp"


using namespace envstack;  // NOLINT(build/namespaces)

void
set_whichshell_command(CLI::App* subcom)
{
    static bool details = false;
    static std::optional<int> pid;
    details = false;
    pid.reset();

    subcom->add_flag("-v,--verbose", details, "Print the system information used for the detection");
    subcom->add_option("pid", pid, "Process to inspect, the parent process by default");

    subcom->callback(
        []()
        {
            const auto table = make_system_process_table();
            const auto info = current_system_info();
            const auto detector = ShellDetector(*table, info, util::get_env_map());

            auto detection = detector.detect(pid.value_or(util::parent_process_id()));
            const auto& result = extract(detection);

            if (!details)
            {
                std::cout << to_string(result.flavor) << std::endl;
                return;
            }
            std::cout << fmt::format("shell: {}\n", to_string(result.flavor))
                      << fmt::format("process: {}\n", result.process_name)
                      << fmt::format("login: {}\n", result.login ? "yes" : "no")
                      << fmt::format("method: {}\n", result.method)
                      << fmt::format("system: {}\n", info.sysname)
                      << fmt::format("distribution: {}\n", info.distribution)
                      << fmt::format("shell level: {}\n", info.shell_level);
        }
    );
}
