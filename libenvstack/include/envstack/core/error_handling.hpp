// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_ERROR_HANDLING_HPP
#define ENVSTACK_CORE_ERROR_HANDLING_HPP

#include <any>
#include <stdexcept>
#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace envstack
{

    /***********************
     * envstack exceptions *
     ***********************/

    enum class envstack_error_code
    {
        unknown,
        unrecognized_shell,
        environment_not_found,
        hook_failure,
        malformed_argument,
        incorrect_usage,
        configurable_bad_cast,
        internal_failure,
    };

    auto name_of(envstack_error_code ec) noexcept -> const char*;

    class envstack_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        envstack_error(const std::string& msg, envstack_error_code ec);
        envstack_error(const char* msg, envstack_error_code ec);
        envstack_error(const std::string& msg, envstack_error_code ec, std::any&& data);

        envstack_error_code error_code() const noexcept;
        const std::any& data() const noexcept;

    private:

        envstack_error_code m_error_code;
        std::any m_data;
    };

    /********************************
     * wrappers around tl::expected *
     ********************************/

    template <class T, class E = envstack_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<envstack_error> make_unexpected(const char* msg, envstack_error_code ec);

    tl::unexpected<envstack_error> make_unexpected(const std::string& msg, envstack_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }
}

#endif
