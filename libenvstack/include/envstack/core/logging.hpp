// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_LOGGING_HPP
#define ENVSTACK_CORE_LOGGING_HPP

#include <array>
#include <concepts>
#include <memory>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   envstack::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(envstack::log_level::trace)
#define LOG_DEBUG       LOG(envstack::log_level::debug)
#define LOG_INFO        LOG(envstack::log_level::info)
#define LOG_WARNING     LOG(envstack::log_level::warn)
#define LOG_ERROR       LOG(envstack::log_level::err)
#define LOG_CRITICAL    LOG(envstack::log_level::critical)
// clang-format on

namespace envstack
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        @see `envstack::LoggingParams`
        @see `envstack::logging::LogRecord`
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,

        // Special values:
        off,
        all
    };

    /// @returns The name of the specified log level as an UTF-8 null-terminated string.
    inline constexpr auto name_of(log_level level) noexcept -> const char*
    {
        constexpr std::array names{ "trace", "debug",    "info", "warning",
                                    "error", "critical", "off",  "all" };
        return names.at(static_cast<std::size_t>(level));
    }

    /// @returns The level matching the given name, as written by `name_of` or by spdlog.
    auto log_level_from_name(std::string_view name) -> std::optional<log_level>;

    /** Parameters for the logging system.
     */
    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /// Formatting pattern to use in formatted logs.
        std::string log_pattern{ "%^%-9!l%-8n%$ %v" };

        auto operator==(const LoggingParams& other) const noexcept -> bool = default;
    };

    namespace logging
    {
        /** Specifies the source a `LogRecord` is originating from.
         */
        enum class log_source
        {
            envstack,  ///< Log record emitted by the activation engine itself.
            hooks,     ///< Log record reporting on activation or deactivation hook scripts.
        };

        /// @returns The name of the specified log source as an UTF-8 null-terminated string.
        inline constexpr auto name_of(log_source source) noexcept -> const char*
        {
            switch (source)
            {
                case log_source::envstack:
                    return "envstack";
                case log_source::hooks:
                    return "hooks";
            }
            return "";
        }

        /// @returns All `log_source` values as a range.
        inline auto all_log_sources() -> std::vector<log_source>
        {
            return { log_source::envstack, log_source::hooks };
        }

        /// Log record information.
        struct LogRecord
        {
            /// Message to be printed/captured in the logging implementation.
            std::string message;

            /// Level of this log. If lower than the current level, this log will be ignored.
            log_level level = log_level::off;

            /// Origin of this log.
            log_source source = log_source::envstack;

            /// Source location of this log if available, otherwise empty.
            std::source_location location = {};

            // comparisons are mainly used for testing
            auto operator==(const LogRecord& other) const noexcept -> bool
            {
                return message == other.message and level == other.level
                       and source == other.source;
            }
        };

        /** Reason why we are stopping the logging system.
         */
        enum class stop_reason
        {
            manual_stop,   ///< The log handler is being replaced or explicitly stopped.
            program_exit,  ///< The program is exiting, the implementation must not block.
        };

        /** Requirements for a type to be usable as a log handler by the logging system.

            Log handlers receive every log record which passed the level filter and decide
            where and how to print or keep them.

            @see `envstack::logging::AnyLogHandler`
            @see `envstack::logging::set_log_handler`
        */
        template <class T>
        concept LogHandler = requires(
            T& handler,
            LoggingParams params,
            std::vector<log_source> sources,
            LogRecord log_record,
            log_level level,
            stop_reason reason,
            std::optional<log_source> source  // no value means all sources
        ) {
            handler.start_log_handling(params, sources);
            handler.stop_log_handling(reason);
            handler.set_log_level(level);
            handler.set_params(params);
            handler.log(log_record);
            handler.flush(source);
        };

        template <class T>
        concept LogHandler_Moveable = LogHandler<T> and std::movable<T>;

        template <typename T>
        concept LogHandlerPtr = std::is_pointer_v<T> and LogHandler<std::remove_pointer_t<T>>;

        /** Stores or refers to a log handler implementation object which must satisfy the
            requirements from `envstack::logging::LogHandler`.

            The log handler implementation can be passed either:
            - by move, in which case it will be owned by this object;
            - using a pointer to the implementation, in which case this object will only refer to
            the existing implementation object and that object MUST have a greater lifetime than
            this object.
        */
        class AnyLogHandler
        {
        public:

            constexpr AnyLogHandler() noexcept = default;

            /** Destructor calling `stop_log_handling()` if this is the log handler
                currently registered in the logging system.
            */
            ~AnyLogHandler();

            AnyLogHandler(AnyLogHandler&&) noexcept = default;
            AnyLogHandler& operator=(AnyLogHandler&&) noexcept = default;

            template <class T>
                requires(not std::is_same_v<std::remove_cvref_t<T>, AnyLogHandler>)
                        and LogHandler_Moveable<std::remove_cvref_t<T>>
            AnyLogHandler(T&& handler);

            template <class T>
                requires LogHandler<T>
            AnyLogHandler(T* handler_ptr);

            auto start_log_handling(LoggingParams params, std::vector<log_source> sources) -> void;
            auto stop_log_handling(stop_reason reason = stop_reason::manual_stop) -> void;
            auto set_log_level(log_level new_level) -> void;
            auto set_params(LoggingParams new_params) -> void;
            auto log(LogRecord record) -> void;
            auto flush(std::optional<log_source> source = {}) -> void;

            auto has_value() const noexcept -> bool
            {
                return m_storage != nullptr;
            }

            explicit operator bool() const noexcept
            {
                return has_value();
            }

        private:

            struct Interface
            {
                virtual ~Interface() = default;
                virtual void start_log_handling(LoggingParams, std::vector<log_source>) = 0;
                virtual void stop_log_handling(stop_reason) = 0;
                virtual void set_log_level(log_level) = 0;
                virtual void set_params(LoggingParams) = 0;
                virtual void log(LogRecord) = 0;
                virtual void flush(std::optional<log_source>) = 0;
            };

            template <class T>
            struct Wrapper final : Interface
            {
                T handler;

                explicit Wrapper(T h)
                    : handler(std::move(h))
                {
                }

                auto object() -> auto&
                {
                    if constexpr (std::is_pointer_v<T>)
                    {
                        return *handler;
                    }
                    else
                    {
                        return handler;
                    }
                }

                void start_log_handling(LoggingParams params, std::vector<log_source> sources) override
                {
                    object().start_log_handling(std::move(params), std::move(sources));
                }

                void stop_log_handling(stop_reason reason) override
                {
                    object().stop_log_handling(reason);
                }

                void set_log_level(log_level level) override
                {
                    object().set_log_level(level);
                }

                void set_params(LoggingParams params) override
                {
                    object().set_params(std::move(params));
                }

                void log(LogRecord record) override
                {
                    object().log(std::move(record));
                }

                void flush(std::optional<log_source> source) override
                {
                    object().flush(source);
                }
            };

            std::unique_ptr<Interface> m_storage;
        };

        /** Sets the log handler used by the logging system, stopping the previous one.

            @returns The previously registered log handler.
        */
        auto set_log_handler(
            AnyLogHandler new_handler,
            std::optional<LoggingParams> maybe_new_params = {}
        ) -> AnyLogHandler;

        auto get_log_handler() -> AnyLogHandler&;

        /// @returns The previous log level.
        auto set_log_level(log_level new_level) -> log_level;
        auto get_log_level() -> log_level;

        auto get_logging_params() -> LoggingParams;
        auto set_logging_params(LoggingParams new_params) -> LoggingParams;

        /// Sends the record to the current log handler if there is one.
        auto log(LogRecord record) -> void;
        auto flush_logs(std::optional<log_source> source = {}) -> void;

        /** Collects a message through a stream and sends it as a log record on destruction.

            Used through the `LOG_*` macros.
        */
        class MessageLogger
        {
        public:

            MessageLogger(
                log_level level,
                std::source_location location = std::source_location::current()
            );
            MessageLogger(
                log_level level,
                log_source source,
                std::source_location location = std::source_location::current()
            );
            ~MessageLogger();

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            log_source m_source;
            std::stringstream m_stream;
            std::source_location m_location;
        };

        /************************************
         *  AnyLogHandler implementation    *
         ************************************/

        template <class T>
            requires(not std::is_same_v<std::remove_cvref_t<T>, AnyLogHandler>)
                    and LogHandler_Moveable<std::remove_cvref_t<T>>
        AnyLogHandler::AnyLogHandler(T&& handler)
            : m_storage(std::make_unique<Wrapper<std::remove_cvref_t<T>>>(std::forward<T>(handler)))
        {
        }

        template <class T>
            requires LogHandler<T>
        AnyLogHandler::AnyLogHandler(T* handler_ptr)
            : m_storage(std::make_unique<Wrapper<T*>>(std::move(handler_ptr)))
        {
        }
    }
}

#endif
