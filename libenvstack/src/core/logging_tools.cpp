// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cassert>

#include "envstack/core/logging_tools.hpp"

namespace envstack::logging
{
    LogHandler_History::LogHandler_History(Options options_)
        : pimpl(std::make_unique<Impl>())
        , options(std::move(options_))
    {
    }

    auto LogHandler_History::start_log_handling(LoggingParams params, const std::vector<log_source>&)
        -> void
    {
        assert(pimpl);
        pimpl->current_log_level = params.logging_level;
        pimpl->is_started = true;
    }

    auto LogHandler_History::stop_log_handling(stop_reason) -> void
    {
        if (not pimpl)
        {
            return;
        }
        if (options.clear_on_stop)
        {
            clear_history();
        }
        pimpl->is_started = false;
    }

    auto LogHandler_History::set_log_level(log_level new_level) -> void
    {
        pimpl->current_log_level = new_level;
    }

    auto LogHandler_History::set_params(LoggingParams new_params) -> void
    {
        pimpl->current_log_level = new_params.logging_level;
    }

    auto LogHandler_History::log(LogRecord record) -> void
    {
        auto lock = std::scoped_lock{ pimpl->mutex };
        pimpl->history.push_back(std::move(record));
        if (options.max_records_count > 0 and pimpl->history.size() > options.max_records_count)
        {
            pimpl->history.pop_front();
        }
    }

    auto LogHandler_History::flush(std::optional<log_source>) -> void
    {
        // nothing to do, records are kept in memory
    }

    auto LogHandler_History::capture_history() const -> std::vector<LogRecord>
    {
        if (not pimpl)
        {
            return {};
        }
        auto lock = std::scoped_lock{ pimpl->mutex };
        return { pimpl->history.begin(), pimpl->history.end() };
    }

    auto LogHandler_History::clear_history() -> void
    {
        auto lock = std::scoped_lock{ pimpl->mutex };
        pimpl->history.clear();
    }

    auto LogHandler_History::is_started() const -> bool
    {
        return pimpl and pimpl->is_started;
    }

    ScopedLogHandler::ScopedLogHandler(AnyLogHandler handler, std::optional<LoggingParams> params)
        : m_previous_params(get_logging_params())
    {
        m_previous_handler = set_log_handler(std::move(handler), std::move(params));
    }

    ScopedLogHandler::~ScopedLogHandler()
    {
        set_log_handler(std::move(m_previous_handler), m_previous_params);
    }
}
