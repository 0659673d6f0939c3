// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "envstack/core/error_handling.hpp"
#include "envstack/util/path_list.hpp"

#include "envstack.hpp"


using namespace envstack;  // NOLINT(build/namespaces)

namespace
{
    struct CleanupOptions
    {
        std::int64_t duplicate = 0;
        std::int64_t remove = 0;
        std::int64_t global = 0;
        std::string delim = ":";
        bool fuzzy = false;
        std::vector<std::string> args = {};
    };

    auto consolidate_mode(const CleanupOptions& options) -> util::CleanupMode
    {
        const auto mode_count = options.duplicate + options.remove + options.global;
        if (mode_count > 1)
        {
            throw envstack_error(
                "Cannot set mode more than once",
                envstack_error_code::malformed_argument
            );
        }
        if (options.remove > 0)
        {
            return util::CleanupMode::remove;
        }
        if (options.global > 0)
        {
            return util::CleanupMode::global;
        }
        return util::CleanupMode::duplicate;
    }
}

void
set_cleanup_command(CLI::App* subcom)
{
    static CleanupOptions options;
    options = {};

    std::string cli_group = "Mode options";
    subcom->add_flag("-d", options.duplicate, "Remove duplicate entries (default)")->group(cli_group);
    subcom->add_flag("-r", options.remove, "Remove the first entry matching any target")
        ->group(cli_group);
    subcom->add_flag("-g", options.global, "Remove all entries matching any target")
        ->group(cli_group);

    subcom->add_option("--delim", options.delim, "Delimiter of the list entries")
        ->option_text("D")
        ->multi_option_policy(CLI::MultiOptionPolicy::Throw)
        ->capture_default_str();
    subcom->add_flag("-f", options.fuzzy, "Match targets as substrings of the entries");
    subcom->add_option("args", options.args, "Targets to remove, then the list to clean")
        ->option_text("STR... LIST");

    subcom->callback(
        []()
        {
            const auto mode = consolidate_mode(options);
            if (options.delim.size() != 1)
            {
                throw envstack_error(
                    fmt::format("Delimiter must be a single character, got '{}'", options.delim),
                    envstack_error_code::malformed_argument
                );
            }
            if (options.args.empty())
            {
                throw envstack_error("Missing list to clean", envstack_error_code::malformed_argument);
            }

            const auto targets = std::vector<std::string>(
                options.args.begin(),
                options.args.end() - 1
            );
            auto cleaned = util::cleanup(
                options.args.back(),
                options.delim.front(),
                mode,
                targets,
                options.fuzzy
            );
            std::cout << extract(cleaned) << std::endl;
        }
    );
}
