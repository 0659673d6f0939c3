// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>

#include "envstack/core/error_handling.hpp"

namespace envstack
{
    auto name_of(envstack_error_code ec) noexcept -> const char*
    {
        static constexpr std::array names{
            "unknown",
            "unrecognized_shell",
            "environment_not_found",
            "hook_failure",
            "malformed_argument",
            "incorrect_usage",
            "configurable_bad_cast",
            "internal_failure",
        };
        return names[static_cast<std::size_t>(ec)];
    }

    envstack_error::envstack_error(const std::string& msg, envstack_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    envstack_error::envstack_error(const char* msg, envstack_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    envstack_error::envstack_error(const std::string& msg, envstack_error_code ec, std::any&& data)
        : base_type(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
    }

    envstack_error_code envstack_error::error_code() const noexcept
    {
        return m_error_code;
    }

    const std::any& envstack_error::data() const noexcept
    {
        return m_data;
    }

    tl::unexpected<envstack_error> make_unexpected(const char* msg, envstack_error_code ec)
    {
        return tl::make_unexpected(envstack_error(msg, ec));
    }

    tl::unexpected<envstack_error> make_unexpected(const std::string& msg, envstack_error_code ec)
    {
        return tl::make_unexpected(envstack_error(msg, ec));
    }
}
