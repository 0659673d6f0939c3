// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <cassert>
#include <functional>
#include <ranges>
#include <stdexcept>
#include <string>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "envstack/core/logging_spdlog.hpp"

namespace envstack::logging::spdlogimpl
{
    namespace
    {
        auto make_logger(std::string_view name, std::string_view pattern)
            -> std::shared_ptr<spdlog::logger>
        {
            auto logger = std::make_shared<spdlog::logger>(
                std::string(name),
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
            );
            logger->set_formatter(std::make_unique<spdlog::pattern_formatter>(
                std::string(pattern),
                spdlog::pattern_time_type::local,
                std::string("\n")
            ));
            return logger;
        }

        template <std::invocable<std::shared_ptr<spdlog::logger>> Func>
        auto apply_to_logger(log_source source, Func&& func) -> void
        {
            if (auto logger = spdlog::get(name_of(source)))
            {
                std::invoke(std::forward<Func>(func), std::move(logger));
            }
            else if (auto default_logger = spdlog::default_logger())
            {
                std::invoke(std::forward<Func>(func), std::move(default_logger));
            }
        }
    }

    struct LogHandler_spdlog::Impl
    {
        std::atomic_bool is_active{ false };
    };

    LogHandler_spdlog::LogHandler_spdlog()
        : pimpl(std::make_unique<Impl>())
    {
    }

    LogHandler_spdlog::~LogHandler_spdlog() = default;

    LogHandler_spdlog::LogHandler_spdlog(LogHandler_spdlog&& other) noexcept = default;
    LogHandler_spdlog& LogHandler_spdlog::operator=(LogHandler_spdlog&& other) noexcept = default;

    auto LogHandler_spdlog::start_log_handling(LoggingParams params, std::vector<log_source> sources)
        -> void
    {
        assert(pimpl);
        if (sources.empty())
        {
            throw std::invalid_argument("LogHandler_spdlog must be started with at least one log source"
            );
        }

        const auto main_source = sources.front();
        spdlog::set_default_logger(make_logger(name_of(main_source), params.log_pattern));

        for (const auto source : sources | std::views::drop(1))
        {
            spdlog::register_logger(make_logger(name_of(source), params.log_pattern));
        }

        spdlog::set_level(to_spdlog(params.logging_level));

        pimpl->is_active = true;
    }

    auto LogHandler_spdlog::stop_log_handling(stop_reason reason) -> void
    {
        if (not pimpl)
        {
            return;
        }

        // On program exit spdlog flushes and cleans up by itself, it might already be
        // shut down so it must not be touched.
        if (reason != stop_reason::program_exit)
        {
            if (auto default_logger = spdlog::default_logger())
            {
                default_logger->flush();
            }
            spdlog::drop_all();
        }
        pimpl->is_active = false;
    }

    auto LogHandler_spdlog::set_log_level(log_level new_level) -> void
    {
        spdlog::set_level(to_spdlog(new_level));
    }

    auto LogHandler_spdlog::set_params(LoggingParams new_params) -> void
    {
        spdlog::set_level(to_spdlog(new_params.logging_level));
        spdlog::set_pattern(new_params.log_pattern);
    }

    auto LogHandler_spdlog::log(LogRecord record) -> void
    {
        apply_to_logger(
            record.source,
            [&](auto logger)
            {
                logger->log(
                    spdlog::source_loc{
                        record.location.file_name(),
                        static_cast<int>(record.location.line()),
                        record.location.function_name(),
                    },
                    to_spdlog(record.level),
                    record.message
                );
            }
        );
    }

    auto LogHandler_spdlog::flush(std::optional<log_source> source) -> void
    {
        if (source)
        {
            apply_to_logger(*source, [](auto logger) { logger->flush(); });
        }
        else
        {
            spdlog::apply_all([](std::shared_ptr<spdlog::logger> l) { l->flush(); });
        }
    }

    auto LogHandler_spdlog::is_started() const -> bool
    {
        return pimpl && pimpl->is_active;
    }
}
