// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

#include "envstack/util/string.hpp"

namespace envstack::util
{
    /****************************************
     *  Implementation of cctype functions  *
     ****************************************/

    auto is_space(char c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string();
        out.reserve(str.size());
        std::transform(
            str.cbegin(),
            str.cend(),
            std::back_inserter(out),
            [](char c) { return to_lower(c); }
        );
        return out;
    }

    auto to_upper(char c) -> char
    {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    auto to_upper(std::string_view str) -> std::string
    {
        auto out = std::string();
        out.reserve(str.size());
        std::transform(
            str.cbegin(),
            str.cend(),
            std::back_inserter(out),
            [](char c) { return to_upper(c); }
        );
        return out;
    }

    /********************************************
     *  Implementation of start/end/contains    *
     ********************************************/

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.starts_with(prefix);
    }

    auto starts_with(std::string_view str, std::string_view::value_type c) -> bool
    {
        return str.starts_with(c);
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return str.ends_with(suffix);
    }

    auto ends_with(std::string_view str, std::string_view::value_type c) -> bool
    {
        return str.ends_with(c);
    }

    auto contains(std::string_view str, std::string_view sub_str) -> bool
    {
        return str.find(sub_str) != std::string::npos;
    }

    auto contains(std::string_view str, char c) -> bool
    {
        return str.find(c) != std::string::npos;
    }

    auto remove_prefix(std::string_view str, std::string_view prefix) -> std::string_view
    {
        if (starts_with(str, prefix))
        {
            return str.substr(prefix.size());
        }
        return str;
    }

    auto remove_prefix(std::string_view str, std::string_view::value_type c) -> std::string_view
    {
        if (starts_with(str, c))
        {
            return str.substr(1);
        }
        return str;
    }

    auto remove_suffix(std::string_view str, std::string_view suffix) -> std::string_view
    {
        if (ends_with(str, suffix))
        {
            return str.substr(0, str.size() - suffix.size());
        }
        return str;
    }

    auto remove_suffix(std::string_view str, std::string_view::value_type c) -> std::string_view
    {
        if (ends_with(str, c))
        {
            return str.substr(0, str.size() - 1);
        }
        return str;
    }

    /*************************************
     *  Implementation of strip functions *
     *************************************/

    namespace
    {
        template <typename UnaryFunc>
        auto lstrip_if(std::string_view input, UnaryFunc should_strip) -> std::string_view
        {
            const auto start = std::find_if_not(input.cbegin(), input.cend(), should_strip);
            return input.substr(static_cast<std::size_t>(start - input.cbegin()));
        }

        template <typename UnaryFunc>
        auto rstrip_if(std::string_view input, UnaryFunc should_strip) -> std::string_view
        {
            const auto rstart = std::find_if_not(input.crbegin(), input.crend(), should_strip);
            return input.substr(0, static_cast<std::size_t>(input.crend() - rstart));
        }
    }

    auto lstrip(std::string_view input, char c) -> std::string_view
    {
        return lstrip_if(input, [c](char x) { return x == c; });
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        return lstrip_if(input, [](char x) { return is_space(x); });
    }

    auto rstrip(std::string_view input, char c) -> std::string_view
    {
        return rstrip_if(input, [c](char x) { return x == c; });
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        return rstrip_if(input, [](char x) { return is_space(x); });
    }

    auto strip(std::string_view input, char c) -> std::string_view
    {
        return rstrip(lstrip(input, c), c);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return rstrip(lstrip(input));
    }

    /*************************************
     *  Implementation of split functions *
     *************************************/

    auto split_once(std::string_view str, char sep)
        -> std::pair<std::string_view, std::optional<std::string_view>>
    {
        if (const auto pos = str.find(sep); pos != std::string_view::npos)
        {
            return { str.substr(0, pos), str.substr(pos + 1) };
        }
        return { str, std::nullopt };
    }

    auto split(std::string_view input, std::string_view sep, std::size_t max_split)
        -> std::vector<std::string>
    {
        if (sep.size() < 1)
        {
            throw std::invalid_argument("Separator must have size greater than 0");
        }

        std::vector<std::string> result;

        const std::size_t len = input.size();
        const std::size_t n = sep.size();
        std::size_t i = 0;
        std::size_t j = 0;

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                {
                    break;
                }
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    auto split(std::string_view input, char sep, std::size_t max_split) -> std::vector<std::string>
    {
        return split(input, std::string_view(&sep, 1), max_split);
    }

    void replace_all(std::string& data, std::string_view search, std::string_view replace)
    {
        if (search.empty())
        {
            return;
        }
        std::size_t pos = data.find(search);
        while (pos != std::string::npos)
        {
            data.replace(pos, search.size(), replace);
            pos += replace.size();
            pos = data.find(search, pos);
        }
    }
}
