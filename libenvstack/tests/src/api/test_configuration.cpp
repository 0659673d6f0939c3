// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "envstack/api/configuration.hpp"
#include "envstack/core/context.hpp"
#include "envstack/core/logging_tools.hpp"
#include "envstack/util/environment.hpp"
#include "envstack/util/string.hpp"

#include "envstacktests.hpp"

namespace envstack
{
    namespace testing
    {
        class ConfigurationTest
        {
        protected:

            void load_test_config(const std::string& rc)
            {
                const auto file = tmp_dir.path() / "envstackrc";
                envstacktests::write_file(file, rc);
                config.rc_files() = { file };
                config.load();
            }

            auto rc_path() const -> fs::u8path
            {
                return tmp_dir.path() / "envstackrc";
            }

            envstacktests::EnvironmentCleaner restore = { envstacktests::CleanCondaEnv() };
            envstacktests::TemporaryDirectory tmp_dir;
            Context ctx;
            Configuration config{ ctx };
        };

        TEST_CASE_METHOD(ConfigurationTest, "Default values")
        {
            REQUIRE(
                config.names()
                == std::vector<std::string>{ "root_prefix", "envs_dirs", "changeps1", "env_prompt", "log_level" }
            );
            for (const auto& name : config.names())
            {
                CAPTURE(name);
                REQUIRE_FALSE(config.at(name).configured());
                REQUIRE(config.at(name).source() == "default");
            }
            REQUIRE(config.at("changeps1").value<bool>());
            REQUIRE(config.at("env_prompt").value<std::string>() == "({default_env}) ");
            REQUIRE(config.at("log_level").value<std::string>() == "warning");

            REQUIRE_THROWS_AS(config.at("not_a_key"), envstack_error);
        }

        TEST_CASE_METHOD(ConfigurationTest, "Load rc file")
        {
            const auto root = envstacktests::make_environment(tmp_dir.path() / "root");
            const auto envs = tmp_dir.path() / "my_envs";

            load_test_config(
                "root_prefix: " + root.string() + "\n" + "envs_dirs:\n" + "  - " + envs.string() + "\n"
                + "changeps1: false\n" + "env_prompt: '[{name}] '\n"
            );

            REQUIRE(config.sources() == std::vector<fs::u8path>{ rc_path() });
            REQUIRE(config.at("changeps1").configured());
            REQUIRE(config.at("changeps1").source() == rc_path().string());
            REQUIRE(config.at("changeps1").source_kind() == ConfigurationSource::rc_file);

            REQUIRE(ctx.prefix_params.root_prefix == root);
            REQUIRE(ctx.envs_dirs == std::vector<fs::u8path>{ envs });
            REQUIRE_FALSE(ctx.change_ps1);
            REQUIRE(ctx.env_prompt == "[{name}] ");
        }

        TEST_CASE_METHOD(ConfigurationTest, "Environment directories default to the root prefix")
        {
            const auto root = tmp_dir.path() / "root";
            load_test_config("root_prefix: " + root.string() + "\n");
            REQUIRE_FALSE(config.at("envs_dirs").configured());
            REQUIRE(ctx.envs_dirs == std::vector<fs::u8path>{ root / "envs" });
        }

        TEST_CASE_METHOD(ConfigurationTest, "Unknown key")
        {
            auto history = logging::LogHandler_History();
            const auto scoped = logging::ScopedLogHandler(&history);

            load_test_config("changeps1: false\nnot_a_key: 1\n");

            REQUIRE_FALSE(ctx.change_ps1);
            const auto records = history.capture_history();
            REQUIRE(records.size() == 1);
            REQUIRE(util::starts_with(records.front().message, "Unknown configuration key 'not_a_key'"));
        }

        TEST_CASE_METHOD(ConfigurationTest, "Misformatted rc file")
        {
            auto history = logging::LogHandler_History();
            const auto scoped = logging::ScopedLogHandler(&history);

            SECTION("Not a map")
            {
                load_test_config("- a\n- b\n");
            }

            SECTION("Invalid YAML")
            {
                load_test_config("changeps1: [false\n");
            }

            REQUIRE(config.sources().empty());
            REQUIRE_FALSE(config.at("changeps1").configured());
            REQUIRE(ctx.change_ps1);
            REQUIRE(history.capture_history().size() == 1);
        }

        TEST_CASE_METHOD(ConfigurationTest, "Empty rc file")
        {
            load_test_config("");
            REQUIRE(config.sources().empty());
        }

        TEST_CASE_METHOD(ConfigurationTest, "Precedence")
        {
            SECTION("Environment variables override rc files")
            {
                util::set_env("ENVSTACK_CHANGEPS1", "yes");
                util::set_env("ENVSTACK_ENV_PROMPT", "env> ");
                load_test_config("changeps1: false\nenv_prompt: 'rc> '\n");

                REQUIRE(ctx.change_ps1);
                REQUIRE(ctx.env_prompt == "env> ");
                REQUIRE(config.at("changeps1").source() == "ENVSTACK_CHANGEPS1");
                REQUIRE(config.at("changeps1").source_kind() == ConfigurationSource::env_var);
            }

            SECTION("Command line overrides environment variables")
            {
                util::set_env("ENVSTACK_ENV_PROMPT", "env> ");
                config.set_cli_value("env_prompt", YAML::Node("cli> "));
                load_test_config("env_prompt: 'rc> '\n");

                REQUIRE(ctx.env_prompt == "cli> ");
                REQUIRE(config.at("env_prompt").source() == "cli");
            }

            SECTION("Environment variables are ignored on request")
            {
                util::set_env("ENVSTACK_ENV_PROMPT", "env> ");
                ctx.src_params.no_env = true;
                load_test_config("env_prompt: 'rc> '\n");

                REQUIRE(ctx.env_prompt == "rc> ");
            }

            SECTION("rc files are ignored on request")
            {
                ctx.src_params.no_rc = true;
                load_test_config("env_prompt: 'rc> '\n");

                REQUIRE(config.sources().empty());
                REQUIRE(ctx.env_prompt == "({default_env}) ");
            }
        }

        TEST_CASE_METHOD(ConfigurationTest, "Environment directories from the environment")
        {
            const auto a = tmp_dir.path() / "a";
            const auto b = tmp_dir.path() / "b";
            util::set_env("ENVSTACK_ENVS_DIRS", a.string() + util::pathsep() + b.string());
            load_test_config("");

            REQUIRE(config.at("envs_dirs").source() == "ENVSTACK_ENVS_DIRS");
            REQUIRE(ctx.envs_dirs == std::vector<fs::u8path>{ a, b });
        }

        TEST_CASE_METHOD(ConfigurationTest, "rc file from the environment")
        {
            const auto file = tmp_dir.path() / "custom_rc";
            envstacktests::write_file(file, "env_prompt: 'custom> '\n");
            util::set_env("ENVSTACK_RC_FILE", file.string());

            config.load();

            REQUIRE(config.sources() == std::vector<fs::u8path>{ file });
            REQUIRE(ctx.env_prompt == "custom> ");
        }

        TEST_CASE_METHOD(ConfigurationTest, "Invalid values")
        {
            SECTION("Boolean")
            {
                const auto file = tmp_dir.path() / "envstackrc";
                envstacktests::write_file(file, "changeps1: maybe\n");
                config.rc_files() = { file };
                REQUIRE_THROWS_AS(config.load(), envstack_error);
                try
                {
                    config.load();
                }
                catch (const envstack_error& e)
                {
                    REQUIRE(e.error_code() == envstack_error_code::configurable_bad_cast);
                }
            }

            SECTION("Log level")
            {
                util::set_env("ENVSTACK_LOG_LEVEL", "loud");
                REQUIRE_THROWS_AS(load_test_config(""), envstack_error);
            }
        }

        TEST_CASE_METHOD(ConfigurationTest, "Log level")
        {
            auto history = logging::LogHandler_History();
            const auto scoped = logging::ScopedLogHandler(&history);

            load_test_config("log_level: debug\n");
            REQUIRE(ctx.output_params.logging_level == log_level::debug);
            REQUIRE(logging::get_log_level() == log_level::debug);
        }

        TEST_CASE_METHOD(ConfigurationTest, "default_rc_paths")
        {
            util::set_env("HOME", tmp_dir.path().string());
            util::unset_env("XDG_CONFIG_HOME");
            const auto root = fs::u8path("/opt/envstack");

            const auto paths = Configuration::default_rc_paths(root);
            REQUIRE(
                paths
                == std::vector<fs::u8path>{
                    "/etc/envstack/envstackrc",
                    root / ".envstackrc",
                    tmp_dir.path() / ".envstackrc",
                    tmp_dir.path() / ".config" / "envstack" / "envstackrc",
                }
            );

            SECTION("Without home directory")
            {
                util::unset_env("HOME");
                REQUIRE(
                    Configuration::default_rc_paths(root)
                    == std::vector<fs::u8path>{ "/etc/envstack/envstackrc", root / ".envstackrc" }
                );
            }
        }

        TEST_CASE_METHOD(ConfigurationTest, "dump")
        {
            load_test_config("changeps1: false\n");

            const auto out = config.dump();
            REQUIRE(util::contains(out, "changeps1: false"));
            REQUIRE(util::contains(out, "envs_dirs:"));
            REQUIRE_FALSE(util::contains(out, "'default'"));

            const auto with_sources = config.dump(true);
            REQUIRE(util::contains(with_sources, "'" + rc_path().string() + "'"));
            REQUIRE(util::contains(with_sources, "'default'"));
        }
    }
}
