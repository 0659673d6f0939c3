// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CLI_TESTS_CLI_RUNNER_HPP
#define ENVSTACK_CLI_TESTS_CLI_RUNNER_HPP

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "envstack/api/configuration.hpp"
#include "envstack/core/context.hpp"
#include "envstack/core/logging_tools.hpp"

#include "envstack.hpp"

namespace envstackclitests
{
    /** Redirects a stream to a buffer until destruction. */
    class StreamCapture
    {
    public:

        explicit StreamCapture(std::ostream& stream)
            : m_stream(stream)
            , m_previous(stream.rdbuf(m_buffer.rdbuf()))
        {
        }

        ~StreamCapture()
        {
            m_stream.rdbuf(m_previous);
        }

        StreamCapture(const StreamCapture&) = delete;
        StreamCapture& operator=(const StreamCapture&) = delete;

        [[nodiscard]] auto str() const -> std::string
        {
            return m_buffer.str();
        }

    private:

        std::ostream& m_stream;
        std::stringstream m_buffer;
        std::streambuf* m_previous;
    };

    struct CliResult
    {
        int exit_code = 0;
        std::string out = {};
        std::string err = {};
        std::vector<std::string> logs = {};
    };

    /** Run the command line ``envstack <args>`` in process with a fresh configuration. */
    inline auto run_cli(const std::vector<std::string>& args) -> CliResult
    {
        auto history = envstack::logging::LogHandler_History();
        const auto scoped = envstack::logging::ScopedLogHandler(&history);

        envstack::Context ctx;
        envstack::Configuration config{ ctx };
        CLI::App app{ "envstack" };
        set_envstack_command(&app, config);

        auto argv = std::vector<const char*>{ "envstack" };
        for (const auto& arg : args)
        {
            argv.push_back(arg.c_str());
        }

        auto result = CliResult();
        {
            const auto out = StreamCapture(std::cout);
            const auto err = StreamCapture(std::cerr);
            result.exit_code = run_envstack(app, static_cast<int>(argv.size()), argv.data());
            result.out = out.str();
            result.err = err.str();
        }
        for (const auto& record : history.capture_history())
        {
            result.logs.push_back(record.message);
        }
        return result;
    }
}

#endif
