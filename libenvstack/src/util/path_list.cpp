// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <unordered_set>

#include <fmt/format.h>

#include "envstack/util/path_list.hpp"
#include "envstack/util/string.hpp"

namespace envstack::util
{
    auto to_string(CleanupMode mode) -> std::string_view
    {
        switch (mode)
        {
            case CleanupMode::duplicate:
                return "duplicate";
            case CleanupMode::remove:
                return "remove";
            case CleanupMode::global:
                return "global";
        }
        return "";
    }

    namespace
    {
        auto matches(std::string_view entry, const std::vector<std::string>& targets, bool fuzzy)
            -> bool
        {
            return std::any_of(
                targets.cbegin(),
                targets.cend(),
                [&](const std::string& target)
                { return fuzzy ? contains(entry, target) : (entry == target); }
            );
        }

        auto drop_duplicates(std::vector<std::string> entries) -> std::vector<std::string>
        {
            // A trailing delimiter is kept even when an empty entry was already seen.
            const bool trailing_delim = entries.size() > 1 && entries.back().empty();

            auto seen = std::unordered_set<std::string>();
            auto out = std::vector<std::string>();
            out.reserve(entries.size());
            for (auto& entry : entries)
            {
                if (seen.insert(entry).second)
                {
                    out.push_back(std::move(entry));
                }
            }
            if (trailing_delim && !out.back().empty())
            {
                out.emplace_back();
            }
            return out;
        }
    }

    auto cleanup(
        std::string_view list,
        char delim,
        CleanupMode mode,
        const std::vector<std::string>& targets,
        bool fuzzy
    ) -> expected_t<std::string>
    {
        if ((mode == CleanupMode::duplicate) && !targets.empty())
        {
            return make_unexpected(
                fmt::format("Cannot use targets in {} mode", to_string(mode)),
                envstack_error_code::malformed_argument
            );
        }
        if ((mode != CleanupMode::duplicate) && targets.empty())
        {
            return make_unexpected(
                fmt::format("Mode {} requires at least one target", to_string(mode)),
                envstack_error_code::malformed_argument
            );
        }

        if (list.empty())
        {
            return std::string();
        }

        if (strip(list, delim).empty())
        {
            // Only made of delimiters, there is no entry to process.
            return std::string(list);
        }

        // Leading and trailing delimiters denote empty entries.
        auto entries = split(list, delim);
        switch (mode)
        {
            case CleanupMode::duplicate:
            {
                entries = drop_duplicates(std::move(entries));
                break;
            }
            case CleanupMode::remove:
            {
                auto it = std::find_if(
                    entries.begin(),
                    entries.end(),
                    [&](const std::string& e) { return matches(e, targets, fuzzy); }
                );
                if (it != entries.end())
                {
                    entries.erase(it);
                }
                break;
            }
            case CleanupMode::global:
            {
                std::erase_if(
                    entries,
                    [&](const std::string& e) { return matches(e, targets, fuzzy); }
                );
                break;
            }
        }

        return join(std::string(1, delim), entries);
    }

    auto split_path_list(std::string_view list, char delim) -> std::vector<std::string>
    {
        auto out = std::vector<std::string>();
        if (list.empty())
        {
            return out;
        }
        for (auto& entry : split(list, delim))
        {
            if (!entry.empty())
            {
                out.push_back(std::move(entry));
            }
        }
        return out;
    }
}
