// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_UTIL_ENVIRONMENT_HPP
#define ENVSTACK_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>
#include <unordered_map>

#include "envstack/util/build.hpp"

namespace envstack::util
{
    /**
     * Get an environment variable encoded in UTF8.
     */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    /**
     * Set an environment variable encoded in UTF8.
     */
    void set_env(const std::string& key, const std::string& value);

    /**
     * Unset an environment variable encoded in UTF8.
     */
    void unset_env(const std::string& key);

    using environment_map = std::unordered_map<std::string, std::string>;

    /**
     * Return a map of all environment variables encoded in UTF8.
     */
    [[nodiscard]] auto get_env_map() -> environment_map;

    /**
     * Equivalent to calling set_env in a loop.
     *
     * This leaves environment variables not referred to in the map unmodified.
     */
    void update_env_map(const environment_map& env);

    /**
     * Set the environment to be exactly the map given.
     *
     * This unsets all environment variables not referred to in the map unmodified.
     */
    void set_env_map(const environment_map& env);

    /*
     * Return the current user home directory.
     */
    [[nodiscard]] auto user_home_dir() -> std::string;

    /**
     * Return the current user config directory.
     *
     * The XDG_CONFIG_HOME environment variables is honored, otherwise the XDG default is used.
     */
    [[nodiscard]] auto user_config_dir() -> std::string;

    /**
     * Return the character use to separate paths.
     */
    [[nodiscard]] constexpr auto pathsep() -> char;

    /********************
     *  Implementation  *
     ********************/

    constexpr auto pathsep() -> char
    {
        if (on_win)
        {
            return ';';
        }
        else
        {
            return ':';
        }
    }
}
#endif
