// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch_all.hpp>

#include "envstack/util/string.hpp"

using namespace envstack::util;

namespace
{
    TEST_CASE("to_lower", "[envstack::util]")
    {
        REQUIRE(to_lower('A') == 'a');
        REQUIRE(to_lower('1') == '1');
        REQUIRE(to_lower("ThisIsATest") == "thisisatest");
    }

    TEST_CASE("to_upper", "[envstack::util]")
    {
        REQUIRE(to_upper('a') == 'A');
        REQUIRE(to_upper("my_var") == "MY_VAR");
    }

    TEST_CASE("starts_with", "[envstack::util]")
    {
        CHECK(starts_with("", ""));
        CHECK_FALSE(starts_with("", ":"));
        CHECK(starts_with("(base) $ ", "(base) "));
        CHECK_FALSE(starts_with("(base) $ ", "(other) "));
        CHECK(starts_with(":/usr/bin", ':'));
    }

    TEST_CASE("ends_with", "[envstack::util]")
    {
        CHECK(ends_with("/prefix/bin/", '/'));
        CHECK(ends_with("/prefix/bin", "bin"));
        CHECK_FALSE(ends_with("bin", "/prefix/bin"));
    }

    TEST_CASE("contains", "[envstack::util]")
    {
        CHECK(contains("/opt/myenv-backup/bin", "/opt/myenv"));
        CHECK_FALSE(contains("/usr/bin", "/opt"));
        CHECK(contains("a/b", '/'));
    }

    TEST_CASE("remove_prefix", "[envstack::util]")
    {
        REQUIRE(remove_prefix("(env) $ ", "(env) ") == "$ ");
        REQUIRE(remove_prefix("$ ", "(env) ") == "$ ");
        REQUIRE(remove_prefix("-bash", '-') == "bash");
    }

    TEST_CASE("remove_suffix", "[envstack::util]")
    {
        REQUIRE(remove_suffix("/prefix/bin/", '/') == "/prefix/bin");
        REQUIRE(remove_suffix("activate.sh", ".sh") == "activate");
        REQUIRE(remove_suffix("activate", ".sh") == "activate");
    }

    TEST_CASE("strip", "[envstack::util]")
    {
        REQUIRE(strip("  hello \t\n") == "hello");
        REQUIRE(lstrip("  hello ") == "hello ");
        REQUIRE(rstrip("  hello ") == "  hello");
        REQUIRE(strip("::a:b::", ':') == "a:b");
        REQUIRE(strip(":::", ':') == "");
        REQUIRE(strip("", ':') == "");
    }

    TEST_CASE("split_once", "[envstack::util]")
    {
        const auto [key, value] = split_once("ID=ubuntu", '=');
        REQUIRE(key == "ID");
        REQUIRE(value == "ubuntu");

        const auto [key2, value2] = split_once("no_separator", '=');
        REQUIRE(key2 == "no_separator");
        REQUIRE_FALSE(value2.has_value());
    }

    TEST_CASE("split", "[envstack::util]")
    {
        using Strings = std::vector<std::string>;

        REQUIRE(split("/a:/b:/c", ':') == Strings{ "/a", "/b", "/c" });
        REQUIRE(split(":/a:", ':') == Strings{ "", "/a", "" });
        REQUIRE(split("", ':') == Strings{ "" });
        REQUIRE(split("a::b", "::") == Strings{ "a", "b" });
        REQUIRE(split("a:b:c", ':', 1) == Strings{ "a", "b:c" });
        REQUIRE_THROWS_AS(split("a", std::string_view()), std::invalid_argument);
    }

    TEST_CASE("join", "[envstack::util]")
    {
        REQUIRE(join(":", std::vector<std::string>{ "/a", "", "/b" }) == "/a::/b");
        REQUIRE(join(",", std::vector<std::string>{}) == "");
        REQUIRE(join(std::string(1, ';'), std::vector<std::string>{ "C:\\a" }) == "C:\\a");
    }

    TEST_CASE("replace_all", "[envstack::util]")
    {
        auto str = std::string("({default_env}) {default_env}");
        replace_all(str, "{default_env}", "base");
        REQUIRE(str == "(base) base");

        SECTION("Replacement containing the pattern")
        {
            auto quoted = std::string("it's");
            replace_all(quoted, "'", "'\"'\"'");
            REQUIRE(quoted == "it'\"'\"'s");
        }

        SECTION("Empty pattern")
        {
            auto same = std::string("abc");
            replace_all(same, "", "x");
            REQUIRE(same == "abc");
        }
    }
}
