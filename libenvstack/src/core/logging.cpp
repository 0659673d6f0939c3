// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "envstack/core/logging.hpp"
#include "envstack/util/string.hpp"

namespace envstack
{
    auto log_level_from_name(std::string_view name) -> std::optional<log_level>
    {
        const auto lower = util::to_lower(util::strip(name));
        for (auto level : { log_level::trace,
                            log_level::debug,
                            log_level::info,
                            log_level::warn,
                            log_level::err,
                            log_level::critical,
                            log_level::off })
        {
            if (lower == name_of(level))
            {
                return level;
            }
        }
        // Short names used by spdlog.
        if (lower == "warn")
        {
            return log_level::warn;
        }
        if (lower == "err")
        {
            return log_level::err;
        }
        return std::nullopt;
    }
}

namespace envstack::logging
{
    namespace
    {
        std::mutex params_mutex;
        LoggingParams logging_params = {};
        AnyLogHandler current_log_handler = {};
    }

    AnyLogHandler::~AnyLogHandler()
    {
        // When the program exits without unregistering the handler, we still need to stop it.
        if (has_value() and this == &current_log_handler)
        {
            try
            {
                m_storage->stop_log_handling(stop_reason::program_exit);
            }
            catch (const std::exception& ex)
            {
                // No logging implementation is usable anymore at this point.
                std::cerr << fmt::format(
                    "envstack::logging termination failure: call to `stop_log_handling()` ended with an error: {}",
                    ex.what()
                ) << std::endl;
            }
        }
    }

    auto AnyLogHandler::start_log_handling(LoggingParams params, std::vector<log_source> sources)
        -> void
    {
        m_storage->start_log_handling(std::move(params), std::move(sources));
    }

    auto AnyLogHandler::stop_log_handling(stop_reason reason) -> void
    {
        m_storage->stop_log_handling(reason);
    }

    auto AnyLogHandler::set_log_level(log_level new_level) -> void
    {
        m_storage->set_log_level(new_level);
    }

    auto AnyLogHandler::set_params(LoggingParams new_params) -> void
    {
        m_storage->set_params(std::move(new_params));
    }

    auto AnyLogHandler::log(LogRecord record) -> void
    {
        m_storage->log(std::move(record));
    }

    auto AnyLogHandler::flush(std::optional<log_source> source) -> void
    {
        m_storage->flush(source);
    }

    auto set_log_handler(AnyLogHandler new_handler, std::optional<LoggingParams> maybe_new_params)
        -> AnyLogHandler
    {
        if (current_log_handler)
        {
            current_log_handler.stop_log_handling();
        }

        auto previous_handler = std::exchange(current_log_handler, std::move(new_handler));

        auto params = LoggingParams{};
        {
            auto lock = std::scoped_lock{ params_mutex };
            if (maybe_new_params)
            {
                logging_params = std::move(*maybe_new_params);
            }
            params = logging_params;
        }

        if (current_log_handler)
        {
            current_log_handler.start_log_handling(std::move(params), all_log_sources());
        }

        return previous_handler;
    }

    auto get_log_handler() -> AnyLogHandler&
    {
        return current_log_handler;
    }

    auto set_log_level(log_level new_level) -> log_level
    {
        auto lock = std::scoped_lock{ params_mutex };
        const auto previous_level = std::exchange(logging_params.logging_level, new_level);
        if (current_log_handler)
        {
            current_log_handler.set_log_level(new_level);
        }
        return previous_level;
    }

    auto get_log_level() -> log_level
    {
        auto lock = std::scoped_lock{ params_mutex };
        return logging_params.logging_level;
    }

    auto get_logging_params() -> LoggingParams
    {
        auto lock = std::scoped_lock{ params_mutex };
        return logging_params;
    }

    auto set_logging_params(LoggingParams new_params) -> LoggingParams
    {
        auto lock = std::scoped_lock{ params_mutex };
        auto previous_params = std::exchange(logging_params, std::move(new_params));
        if (current_log_handler)
        {
            current_log_handler.set_params(logging_params);
        }
        return previous_params;
    }

    auto log(LogRecord record) -> void
    {
        if (current_log_handler)
        {
            current_log_handler.log(std::move(record));
        }
    }

    auto flush_logs(std::optional<log_source> source) -> void
    {
        if (current_log_handler)
        {
            current_log_handler.flush(source);
        }
    }

    ///////////////////////////////////////////////////////////////////
    // MessageLogger

    MessageLogger::MessageLogger(log_level level, std::source_location location)
        : MessageLogger(level, log_source::envstack, std::move(location))
    {
    }

    MessageLogger::MessageLogger(log_level level, log_source source, std::source_location location)
        : m_level(level)
        , m_source(source)
        , m_location(std::move(location))
    {
    }

    MessageLogger::~MessageLogger()
    {
        const auto current_level = get_log_level();
        if (current_level == log_level::off
            || (current_level != log_level::all && m_level < current_level))
        {
            return;
        }
        log(LogRecord{
            .message = m_stream.str(),
            .level = m_level,
            .source = m_source,
            .location = std::move(m_location),
        });
    }
}
