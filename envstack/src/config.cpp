// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>

#include "envstack/api/configuration.hpp"

#include "common_options.hpp"
#include "envstack.hpp"


using namespace envstack;  // NOLINT(build/namespaces)

void
set_config_command(CLI::App* subcom, Configuration& config)
{
    static bool show_sources = false;
    show_sources = false;

    init_general_options(subcom, config);
    subcom->add_flag("--sources", show_sources, "Show the source of each value");

    subcom->callback(
        [&config]()
        {
            load_configuration(config);
            if (show_sources)
            {
                std::cout << "# rc files read:";
                for (const auto& file : config.sources())
                {
                    std::cout << " " << file.string();
                }
                std::cout << "\n";
            }
            std::cout << config.dump(show_sources) << std::endl;
        }
    );
}
