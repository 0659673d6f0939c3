// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "cli_runner.hpp"

namespace
{
    using envstackclitests::run_cli;

    TEST_CASE("cleanup modes", "[envstack::cli]")
    {
        SECTION("Duplicates by default")
        {
            const auto res = run_cli({ "cleanup", "/a:/b:/a::/b" });
            REQUIRE(res.exit_code == 0);
            REQUIRE(res.out == "/a:/b:\n");
        }

        SECTION("Explicit duplicate mode")
        {
            const auto res = run_cli({ "cleanup", "-d", "/a:/b:/a" });
            REQUIRE(res.exit_code == 0);
            REQUIRE(res.out == "/a:/b\n");
        }

        SECTION("First match")
        {
            const auto res = run_cli({ "cleanup", "-r", "/a", "/a:/b:/a" });
            REQUIRE(res.exit_code == 0);
            REQUIRE(res.out == "/b:/a\n");
        }

        SECTION("All matches")
        {
            const auto res = run_cli({ "cleanup", "-g", "/a", "/a:/b:/a" });
            REQUIRE(res.exit_code == 0);
            REQUIRE(res.out == "/b\n");
        }

        SECTION("Several targets")
        {
            const auto res = run_cli({ "cleanup", "-g", "/a", "/c", "/a:/b:/c:/a" });
            REQUIRE(res.exit_code == 0);
            REQUIRE(res.out == "/b\n");
        }

        SECTION("Fuzzy matching")
        {
            const auto res = run_cli({ "cleanup", "-g", "-f", "env", "/env/bin:/usr/bin:/opt/env" });
            REQUIRE(res.exit_code == 0);
            REQUIRE(res.out == "/usr/bin\n");
        }

        SECTION("Custom delimiter")
        {
            const auto res = run_cli({ "cleanup", "--delim", ";", "-r", "b", "a;b;c" });
            REQUIRE(res.exit_code == 0);
            REQUIRE(res.out == "a;c\n");
        }

        SECTION("Leading and trailing delimiters are kept")
        {
            const auto res = run_cli({ "cleanup", "-r", "/a", ":/a:/b:" });
            REQUIRE(res.exit_code == 0);
            REQUIRE(res.out == ":/b:\n");
        }
    }

    TEST_CASE("cleanup errors", "[envstack::cli]")
    {
        SECTION("Several modes")
        {
            const auto res = run_cli({ "cleanup", "-r", "-g", "/a", "/a:/b" });
            REQUIRE(res.exit_code == 1);
            REQUIRE(res.out.empty());
            REQUIRE(res.logs == std::vector<std::string>{ "Cannot set mode more than once" });
        }

        SECTION("Missing list")
        {
            const auto res = run_cli({ "cleanup", "-d" });
            REQUIRE(res.exit_code == 1);
            REQUIRE(res.out.empty());
            REQUIRE(res.logs == std::vector<std::string>{ "Missing list to clean" });
        }

        SECTION("Missing target")
        {
            const auto res = run_cli({ "cleanup", "-r", "/a:/b" });
            REQUIRE(res.exit_code == 1);
            REQUIRE(res.out.empty());
        }

        SECTION("Target in duplicate mode")
        {
            const auto res = run_cli({ "cleanup", "-d", "/a", "/a:/b" });
            REQUIRE(res.exit_code == 1);
            REQUIRE(res.out.empty());
        }

        SECTION("Delimiter longer than a character")
        {
            const auto res = run_cli({ "cleanup", "--delim", "::", "/a::/b" });
            REQUIRE(res.exit_code == 1);
            REQUIRE(res.out.empty());
        }

        SECTION("Several delimiters")
        {
            const auto res = run_cli({ "cleanup", "--delim", ";", "--delim", ",", "a;b" });
            REQUIRE(res.exit_code == 1);
            REQUIRE(res.out.empty());
        }

        SECTION("Unknown flag")
        {
            const auto res = run_cli({ "cleanup", "--frobnicate", "/a:/b" });
            REQUIRE(res.exit_code == 1);
            REQUIRE(res.out.empty());
        }
    }
}
