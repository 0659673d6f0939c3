// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_LOGGING_TOOLS_HPP
#define ENVSTACK_CORE_LOGGING_TOOLS_HPP

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "envstack/core/logging.hpp"

namespace envstack::logging
{
    struct LogHandler_History_Options  // not nested type because clang and gcc dont like it
    {
        std::size_t max_records_count = 0;
        bool clear_on_stop = true;
    };

    /** `LogHandler` that retains `LogRecord`s in order of being logged.
        Can hold any number of records or just the specified number of last records.

        All operations are thread-safe except move operations.
    */
    class LogHandler_History
    {
    public:

        using Options = LogHandler_History_Options;

        LogHandler_History(Options options = Options{});

        LogHandler_History(const LogHandler_History& other) = delete;
        LogHandler_History& operator=(const LogHandler_History& other) = delete;

        LogHandler_History(LogHandler_History&& other) noexcept = default;
        LogHandler_History& operator=(LogHandler_History&& other) noexcept = default;

        auto start_log_handling(LoggingParams params, const std::vector<log_source>&) -> void;
        auto stop_log_handling(stop_reason reason) -> void;

        auto set_log_level(log_level new_level) -> void;
        auto set_params(LoggingParams new_params) -> void;

        auto log(LogRecord record) -> void;

        auto flush(std::optional<log_source> source = {}) -> void;

        /** @returns A copy of the current log record history. */
        auto capture_history() const -> std::vector<LogRecord>;

        auto clear_history() -> void;

        auto is_started() const -> bool;

    private:

        struct Impl
        {
            mutable std::mutex mutex;
            std::deque<LogRecord> history;
            std::atomic<log_level> current_log_level = log_level::info;
            std::atomic_bool is_started = false;
        };

        std::unique_ptr<Impl> pimpl;
        Options options;
    };

    static_assert(LogHandler<LogHandler_History>);

    /** Installs a log handler for the lifetime of this object, restoring the previous one
        on destruction.
    */
    class ScopedLogHandler
    {
    public:

        explicit ScopedLogHandler(AnyLogHandler handler, std::optional<LoggingParams> params = {});
        ~ScopedLogHandler();

        ScopedLogHandler(const ScopedLogHandler&) = delete;
        ScopedLogHandler& operator=(const ScopedLogHandler&) = delete;

    private:

        AnyLogHandler m_previous_handler;
        LoggingParams m_previous_params;
    };
}

#endif
