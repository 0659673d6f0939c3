// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_API_CONFIGURATION_HPP
#define ENVSTACK_API_CONFIGURATION_HPP

#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "envstack/core/context.hpp"
#include "envstack/core/error_handling.hpp"
#include "envstack/fs/filesystem.hpp"

namespace envstack
{
    /** Where the current value of a `Configurable` comes from, by increasing precedence. */
    enum class ConfigurationSource
    {
        default_value,
        rc_file,
        env_var,
        cli,
    };

    /** A single configuration entry, holding its value as a YAML node. */
    class Configurable
    {
    public:

        Configurable(
            std::string name,
            YAML::Node default_value,
            std::vector<std::string> env_var_names,
            std::string description
        );

        auto name() const -> const std::string&;
        auto description() const -> const std::string&;
        auto env_var_names() const -> const std::vector<std::string>&;

        auto yaml_value() const -> const YAML::Node&;

        /** Source of the value, ``default``, an rc file path, an environment variable name or
            ``cli``.
        */
        auto source() const -> const std::string&;
        auto source_kind() const -> ConfigurationSource;

        /** @returns ``true`` if the value was set from anything but its default. */
        auto configured() const -> bool;

        /** Set the value if @p kind has at least the precedence of the current source. */
        auto set_yaml_value(YAML::Node value, ConfigurationSource kind, std::string source)
            -> Configurable&;

        /** Convert the value, throws an `envstack_error` with ``configurable_bad_cast`` code on
            failure.
        */
        template <class T>
        auto value() const -> T;

    private:

        std::string m_name;
        std::string m_description;
        std::vector<std::string> m_env_var_names;
        YAML::Node m_value;
        std::string m_source = "default";
        ConfigurationSource m_source_kind = ConfigurationSource::default_value;
    };

    /** Loads the configuration from rc files, environment variables and command line values,
        and applies it to a `Context`.

        Precedence, from lowest to highest: defaults, rc files (in search order), environment
        variables, command line.
    */
    class Configuration
    {
    public:

        explicit Configuration(Context& ctx);

        auto context() -> Context&;

        auto at(const std::string& name) -> Configurable&;
        auto at(const std::string& name) const -> const Configurable&;

        auto names() const -> std::vector<std::string>;

        /** Set a value from the command line. */
        auto set_cli_value(const std::string& name, YAML::Node value) -> void;

        /** Explicit rc files, replacing the default search list when not empty. */
        auto rc_files() -> std::vector<fs::u8path>&;

        /** Load every source and apply the result to the context. */
        auto load() -> void;

        /** rc files which were actually read by the last call to `load`. */
        auto sources() const -> const std::vector<fs::u8path>&;

        auto dump(bool show_sources = false) const -> std::string;

        /** Default rc file search list, by increasing precedence. */
        static auto default_rc_paths(const fs::u8path& root_prefix) -> std::vector<fs::u8path>;

        /** @returns The content of the rc file, or a null node if it is unusable. */
        static auto load_rc_file(const fs::u8path& file) -> YAML::Node;

    private:

        Context& m_context;
        std::map<std::string, Configurable> m_config;
        std::vector<std::string> m_order;
        std::vector<fs::u8path> m_rc_files;
        std::vector<fs::u8path> m_sources;

        auto insert(Configurable configurable) -> void;
        auto set_env_values() -> void;
        auto set_rc_values(const std::vector<fs::u8path>& possible_rc_paths) -> void;
        auto apply_to_context() -> void;
    };

    /********************************
     *  Configurable implementation *
     ********************************/

    namespace detail
    {
        auto parse_bool(const YAML::Node& value) -> bool;
    }

    template <class T>
    auto Configurable::value() const -> T
    {
        try
        {
            if constexpr (std::is_same_v<T, bool>)
            {
                return detail::parse_bool(m_value);
            }
            else
            {
                return m_value.as<T>();
            }
        }
        catch (const YAML::Exception& ex)
        {
            throw envstack_error(
                "Bad conversion of configurable '" + m_name + "' from source '" + m_source
                    + "': " + ex.what(),
                envstack_error_code::configurable_bad_cast
            );
        }
    }
}

#endif
