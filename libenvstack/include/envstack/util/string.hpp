// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_UTIL_STRING_HPP
#define ENVSTACK_UTIL_STRING_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace envstack::util
{
    [[nodiscard]] auto is_space(char c) -> bool;

    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;
    [[nodiscard]] auto to_upper(char c) -> char;
    [[nodiscard]] auto to_upper(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto starts_with(std::string_view str, std::string_view::value_type c) -> bool;

    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, std::string_view::value_type c) -> bool;

    [[nodiscard]] auto contains(std::string_view str, std::string_view sub_str) -> bool;
    [[nodiscard]] auto contains(std::string_view str, char c) -> bool;

    /**
     * Return a view to the input without the prefix if present.
     */
    [[nodiscard]] auto remove_prefix(std::string_view str, std::string_view prefix)
        -> std::string_view;
    [[nodiscard]] auto remove_prefix(std::string_view str, std::string_view::value_type c)
        -> std::string_view;

    /**
     * Return a view to the input without the suffix if present.
     */
    [[nodiscard]] auto remove_suffix(std::string_view str, std::string_view suffix)
        -> std::string_view;
    [[nodiscard]] auto remove_suffix(std::string_view str, std::string_view::value_type c)
        -> std::string_view;

    [[nodiscard]] auto lstrip(std::string_view input, char c) -> std::string_view;
    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, char c) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input, char c) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Split the input on the first occurrence of the separator.
     *
     * The second element is empty if the separator was not found.
     */
    [[nodiscard]] auto split_once(std::string_view str, char sep)
        -> std::pair<std::string_view, std::optional<std::string_view>>;

    [[nodiscard]] auto split(std::string_view input, char sep, std::size_t max_split = SIZE_MAX)
        -> std::vector<std::string>;
    [[nodiscard]] auto
    split(std::string_view input, std::string_view sep, std::size_t max_split = SIZE_MAX)
        -> std::vector<std::string>;

    void replace_all(std::string& data, std::string_view search, std::string_view replace);

    /**
     * Concatenate the elements of the container @p container by interleaving a separator.
     */
    template <class Range, class Value>
    auto join(const Value& sep, const Range& container) -> std::string;

    /********************************
     *  Implementation of join      *
     ********************************/

    template <class Range, class Value>
    auto join(const Value& sep, const Range& container) -> std::string
    {
        std::string out = {};
        bool first = true;
        for (const auto& elem : container)
        {
            if (!first)
            {
                out += sep;
            }
            out += elem;
            first = false;
        }
        return out;
    }
}

#endif
