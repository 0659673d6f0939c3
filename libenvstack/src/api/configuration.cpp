// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include "envstack/api/configuration.hpp"
#include "envstack/core/logging.hpp"
#include "envstack/util/environment.hpp"
#include "envstack/util/path_list.hpp"
#include "envstack/util/string.hpp"

namespace envstack
{
    namespace detail
    {
        auto parse_bool(const YAML::Node& value) -> bool
        {
            const auto str = util::to_lower(util::strip(value.as<std::string>()));
            if (str == "1" || str == "true" || str == "yes" || str == "on")
            {
                return true;
            }
            if (str == "0" || str == "false" || str == "no" || str == "off")
            {
                return false;
            }
            throw YAML::BadConversion(value.Mark());
        }

        auto expand_home(const std::string& path) -> fs::u8path
        {
            if (path == "~" || util::starts_with(path, "~/"))
            {
                return fs::u8path(util::user_home_dir()) / util::remove_prefix(path, "~/");
            }
            return path;
        }

        auto is_config_file(const fs::u8path& path) -> bool
        {
            return fs::exists(path) && !fs::is_directory(path);
        }

        auto source_name(ConfigurationSource kind) -> const char*
        {
            switch (kind)
            {
                case ConfigurationSource::default_value:
                    return "default";
                case ConfigurationSource::rc_file:
                    return "rc file";
                case ConfigurationSource::env_var:
                    return "environment";
                case ConfigurationSource::cli:
                    return "cli";
            }
            return "";
        }
    }

    /********************************
     *  Configurable implementation *
     ********************************/

    Configurable::Configurable(
        std::string name,
        YAML::Node default_value,
        std::vector<std::string> env_var_names,
        std::string description
    )
        : m_name(std::move(name))
        , m_description(std::move(description))
        , m_env_var_names(std::move(env_var_names))
        , m_value(std::move(default_value))
    {
    }

    auto Configurable::name() const -> const std::string&
    {
        return m_name;
    }

    auto Configurable::description() const -> const std::string&
    {
        return m_description;
    }

    auto Configurable::env_var_names() const -> const std::vector<std::string>&
    {
        return m_env_var_names;
    }

    auto Configurable::yaml_value() const -> const YAML::Node&
    {
        return m_value;
    }

    auto Configurable::source() const -> const std::string&
    {
        return m_source;
    }

    auto Configurable::source_kind() const -> ConfigurationSource
    {
        return m_source_kind;
    }

    auto Configurable::configured() const -> bool
    {
        return m_source_kind != ConfigurationSource::default_value;
    }

    auto
    Configurable::set_yaml_value(YAML::Node value, ConfigurationSource kind, std::string source)
        -> Configurable&
    {
        if (kind >= m_source_kind)
        {
            LOG_TRACE << fmt::format(
                "Configurable '{}' set from {} '{}'",
                m_name,
                detail::source_name(kind),
                source
            );
            m_value = std::move(value);
            m_source_kind = kind;
            m_source = std::move(source);
        }
        return *this;
    }

    /*********************************
     *  Configuration implementation *
     *********************************/

    Configuration::Configuration(Context& ctx)
        : m_context(ctx)
    {
        auto envs_dirs = YAML::Node(YAML::NodeType::Sequence);
        for (const auto& dir : ctx.envs_dirs)
        {
            envs_dirs.push_back(dir.string());
        }

        insert(Configurable(
            "root_prefix",
            YAML::Node(ctx.prefix_params.root_prefix.string()),
            { "ENVSTACK_ROOT_PREFIX" },
            "Path to the root prefix, the base environment."
        ));
        insert(Configurable(
            "envs_dirs",
            envs_dirs,
            { "ENVSTACK_ENVS_DIRS" },
            "Directories searched for environments referred to by name."
        ));
        insert(Configurable(
            "changeps1",
            YAML::Node(ctx.change_ps1),
            { "ENVSTACK_CHANGEPS1" },
            "Add the active environment name to the shell prompt."
        ));
        insert(Configurable(
            "env_prompt",
            YAML::Node(ctx.env_prompt),
            { "ENVSTACK_ENV_PROMPT" },
            "Prompt modifier, {default_env} and {prefix} are substituted."
        ));
        insert(Configurable(
            "log_level",
            YAML::Node(std::string(name_of(ctx.output_params.logging_level))),
            { "ENVSTACK_LOG_LEVEL" },
            "Minimum level of the messages printed on the standard error."
        ));
    }

    auto Configuration::insert(Configurable configurable) -> void
    {
        m_order.push_back(configurable.name());
        m_config.emplace(configurable.name(), std::move(configurable));
    }

    auto Configuration::context() -> Context&
    {
        return m_context;
    }

    auto Configuration::at(const std::string& name) -> Configurable&
    {
        try
        {
            return m_config.at(name);
        }
        catch (const std::out_of_range&)
        {
            throw envstack_error(
                fmt::format("Configurable '{}' does not exist", name),
                envstack_error_code::incorrect_usage
            );
        }
    }

    auto Configuration::at(const std::string& name) const -> const Configurable&
    {
        return const_cast<Configuration*>(this)->at(name);
    }

    auto Configuration::names() const -> std::vector<std::string>
    {
        return m_order;
    }

    auto Configuration::set_cli_value(const std::string& name, YAML::Node value) -> void
    {
        at(name).set_yaml_value(std::move(value), ConfigurationSource::cli, "cli");
    }

    auto Configuration::rc_files() -> std::vector<fs::u8path>&
    {
        return m_rc_files;
    }

    auto Configuration::sources() const -> const std::vector<fs::u8path>&
    {
        return m_sources;
    }

    auto Configuration::default_rc_paths(const fs::u8path& root_prefix) -> std::vector<fs::u8path>
    {
        auto paths = std::vector<fs::u8path>{
            "/etc/envstack/envstackrc",
            root_prefix / ".envstackrc",
        };
        // HOME may legitimately be missing, in containers for instance.
        if (auto home = util::get_env("HOME"); home && !home->empty())
        {
            paths.push_back(fs::u8path(*home) / ".envstackrc");
            paths.push_back(fs::u8path(util::user_config_dir()) / "envstack" / "envstackrc");
        }
        else if (auto xdg = util::get_env("XDG_CONFIG_HOME"); xdg && !xdg->empty())
        {
            paths.push_back(fs::u8path(*xdg) / "envstack" / "envstackrc");
        }
        return paths;
    }

    auto Configuration::load_rc_file(const fs::u8path& file) -> YAML::Node
    {
        YAML::Node config;
        try
        {
            std::ifstream in_file(file);
            std::stringstream str_stream;
            str_stream << in_file.rdbuf();
            config = YAML::Load(str_stream.str());
            if (!config.IsMap())
            {
                if (!config.IsNull())
                {
                    LOG_WARNING << fmt::format(
                        "The configuration file at {} is misformatted or corrupted. Skipping file.",
                        file.string()
                    );
                }
                return YAML::Node();
            }
        }
        catch (const YAML::Exception& ex)
        {
            LOG_ERROR << fmt::format("Error in file {}, skipping: {}", file.string(), ex.what());
            return YAML::Node();
        }
        return config;
    }

    auto Configuration::set_rc_values(const std::vector<fs::u8path>& possible_rc_paths) -> void
    {
        m_sources.clear();
        for (const auto& path : possible_rc_paths)
        {
            const auto expanded = detail::expand_home(path.string());
            if (!detail::is_config_file(expanded))
            {
                LOG_TRACE << "Configuration not found at '" << expanded.string() << "'";
                continue;
            }
            LOG_TRACE << "Configuration found at '" << expanded.string() << "'";

            auto node = load_rc_file(expanded);
            if (node.IsNull())
            {
                continue;
            }
            m_sources.push_back(expanded);

            for (const auto& entry : node)
            {
                const auto key = entry.first.as<std::string>();
                if (auto it = m_config.find(key); it != m_config.end())
                {
                    it->second.set_yaml_value(
                        entry.second,
                        ConfigurationSource::rc_file,
                        expanded.string()
                    );
                }
                else
                {
                    LOG_WARNING << fmt::format(
                        "Unknown configuration key '{}' in file {}",
                        key,
                        expanded.string()
                    );
                }
            }
        }
    }

    auto Configuration::set_env_values() -> void
    {
        for (auto& [name, configurable] : m_config)
        {
            for (const auto& var : configurable.env_var_names())
            {
                auto val = util::get_env(var);
                if (!val)
                {
                    continue;
                }
                if (configurable.yaml_value().IsSequence())
                {
                    auto seq = YAML::Node(YAML::NodeType::Sequence);
                    for (const auto& item : util::split_path_list(*val, util::pathsep()))
                    {
                        seq.push_back(item);
                    }
                    configurable.set_yaml_value(seq, ConfigurationSource::env_var, var);
                }
                else
                {
                    configurable.set_yaml_value(YAML::Node(*val), ConfigurationSource::env_var, var);
                }
            }
        }
    }

    auto Configuration::load() -> void
    {
        // The root prefix drives the rc search list, resolve it before reading rc files.
        if (!m_context.src_params.no_env)
        {
            if (auto root = util::get_env("ENVSTACK_ROOT_PREFIX"); root && !root->empty())
            {
                at("root_prefix")
                    .set_yaml_value(YAML::Node(*root), ConfigurationSource::env_var, "ENVSTACK_ROOT_PREFIX");
            }
        }
        const auto root_prefix = detail::expand_home(at("root_prefix").value<std::string>());

        if (!m_context.src_params.no_rc)
        {
            auto rc_paths = m_rc_files;
            if (rc_paths.empty() && !m_context.src_params.no_env)
            {
                if (auto rc_file = util::get_env("ENVSTACK_RC_FILE"); rc_file && !rc_file->empty())
                {
                    rc_paths.push_back(*rc_file);
                }
            }
            if (rc_paths.empty())
            {
                rc_paths = default_rc_paths(root_prefix);
            }
            set_rc_values(rc_paths);
        }

        if (!m_context.src_params.no_env)
        {
            set_env_values();
        }

        apply_to_context();
    }

    auto Configuration::apply_to_context() -> void
    {
        m_context.prefix_params.root_prefix = fs::absolute(
            detail::expand_home(at("root_prefix").value<std::string>())
        );

        const auto& envs_dirs = at("envs_dirs");
        m_context.envs_dirs.clear();
        if (envs_dirs.configured())
        {
            for (const auto& dir : envs_dirs.value<std::vector<std::string>>())
            {
                m_context.envs_dirs.push_back(detail::expand_home(dir));
            }
        }
        else
        {
            m_context.envs_dirs.push_back(m_context.prefix_params.root_prefix / "envs");
        }

        m_context.change_ps1 = at("changeps1").value<bool>();
        m_context.env_prompt = at("env_prompt").value<std::string>();

        const auto& level_config = at("log_level");
        if (level_config.configured())
        {
            const auto level_name = level_config.value<std::string>();
            if (auto level = log_level_from_name(level_name))
            {
                m_context.set_log_level(*level);
            }
            else
            {
                throw envstack_error(
                    fmt::format("Unknown log level '{}' from '{}'", level_name, level_config.source()),
                    envstack_error_code::configurable_bad_cast
                );
            }
        }
    }

    namespace
    {
        void print_node(YAML::Emitter& out, const Configurable& config, bool show_source)
        {
            const auto& value = config.yaml_value();
            if (value.IsSequence())
            {
                out << YAML::BeginSeq;
                for (const auto& item : value)
                {
                    out << item;
                }
                out << YAML::EndSeq;
            }
            else
            {
                out << value;
            }
            if (show_source)
            {
                out << YAML::Comment("'" + config.source() + "'");
            }
        }
    }

    auto Configuration::dump(bool show_sources) const -> std::string
    {
        YAML::Emitter out;
        out << YAML::BeginMap;
        for (const auto& name : m_order)
        {
            out << YAML::Key << name;
            out << YAML::Value;
            print_node(out, m_config.at(name), show_sources);
        }
        out << YAML::EndMap;
        return out.c_str();
    }
}
