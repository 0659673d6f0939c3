// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "envstack/util/build.hpp"
#include "envstack/util/os.hpp"

#include "envstacktests.hpp"

using namespace envstack;
using namespace envstack::util;

namespace
{
    TEST_CASE("unix_name_version", "[envstack::util]")
    {
        const auto maybe_name_version = unix_name_version();
        REQUIRE(maybe_name_version.has_value());
        const auto& [name, version] = maybe_name_version.value();
        if (on_linux)
        {
            REQUIRE(name == "Linux");
        }
        if (on_mac)
        {
            REQUIRE(name == "Darwin");
        }
        REQUIRE_FALSE(version.empty());
    }

    TEST_CASE("linux_distribution_id", "[envstack::util]")
    {
        const auto tmp_dir = envstacktests::TemporaryDirectory();

        SECTION("Quoted identifier")
        {
            envstacktests::write_file(
                tmp_dir.path() / "os-release",
                "NAME=\"Some Linux\"\nID=\"Ubuntu\"\nVERSION_ID=\"22.04\"\n"
            );
            REQUIRE(linux_distribution_id(tmp_dir.path()) == "ubuntu");
        }

        SECTION("Plain identifier")
        {
            envstacktests::write_file(tmp_dir.path() / "os-release", "ID=debian\n");
            REQUIRE(linux_distribution_id(tmp_dir.path()) == "debian");
        }
    }

    TEST_CASE("get_self_exe_path", "[envstack::util]")
    {
        const auto exe = get_self_exe_path();
        REQUIRE(exe.is_absolute());
        REQUIRE(fs::exists(exe));
    }

    TEST_CASE("parent_process_id", "[envstack::util]")
    {
        REQUIRE(parent_process_id() > 0);
    }
}
