// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <climits>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <sys/utsname.h>
#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#include "envstack/util/os.hpp"
#include "envstack/util/string.hpp"

namespace envstack::util
{
    auto unix_name_version() -> tl::expected<std::pair<std::string, std::string>, OSError>
    {
        struct ::utsname uname_result = {};
        const auto ret = ::uname(&uname_result);
        if (ret != 0)
        {
            return tl::make_unexpected(
                OSError{ fmt::format(
                    "Error calling uname: {}",
                    std::system_error(errno, std::generic_category()).what()
                ) }
            );
        }

        static const auto re = std::regex(R"r(([0-9]+\.[0-9]+\.[0-9]+)(?:-.*)?)r");
        if (auto m = std::cmatch(); std::regex_search(uname_result.release, m, re) && (m.size() == 2))
        {
            return { { uname_result.sysname, std::move(m)[1].str() } };
        }
        return tl::make_unexpected(
            OSError{ fmt::format(
                R"(Could not parse kernel version in uname output "{}")",
                uname_result.release
            ) }
        );
    }

    auto linux_distribution_id(const fs::u8path& etc_dir) -> tl::expected<std::string, OSError>
    {
        for (const auto& candidate : { etc_dir / "os-release", fs::u8path("/usr/lib/os-release") })
        {
            auto in = std::ifstream(candidate);
            if (!in.good())
            {
                continue;
            }
            std::string line;
            while (std::getline(in, line))
            {
                const auto [key, value] = split_once(strip(line), '=');
                if (key == "ID" && value.has_value())
                {
                    return to_lower(strip(strip(*value, '"'), '\''));
                }
            }
        }
        return tl::make_unexpected(
            OSError{ fmt::format("Could not find an os-release file in {}", etc_dir.string()) }
        );
    }

    auto get_self_exe_path() -> fs::u8path
    {
#if defined(__APPLE__)
        uint32_t size = PATH_MAX;
        std::vector<char> buffer(size);
        if (_NSGetExecutablePath(buffer.data(), &size) == -1)
        {
            buffer.resize(size);
            if (_NSGetExecutablePath(buffer.data(), &size) != 0)
            {
                throw std::runtime_error("Couldn't find location the envstack executable!");
            }
        }
        return fs::absolute(buffer.data());
#else
        return fs::read_symlink("/proc/self/exe");
#endif
    }

    auto parent_process_id() -> int
    {
        return static_cast<int>(::getppid());
    }
}
