// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "envstack/core/context.hpp"
#include "envstack/core/logging_spdlog.hpp"
#include "envstack/util/os.hpp"

namespace envstack
{
    auto default_root_prefix() -> fs::u8path
    {
        // <root_prefix>/bin/envstack
        return util::get_self_exe_path().parent_path().parent_path();
    }

    Context::Context(const ContextOptions& options)
    {
        prefix_params.root_prefix = default_root_prefix();
        envs_dirs = { prefix_params.root_prefix / "envs" };

        if (options.enable_logging)
        {
            logging::set_log_handler(LogHandler_spdlog(), logging_params());
            m_logging_enabled = true;
        }
    }

    Context::~Context()
    {
        if (m_logging_enabled)
        {
            logging::set_log_handler({});
        }
    }

    void Context::set_verbosity(int lvl)
    {
        this->output_params.verbosity = lvl;

        switch (lvl)
        {
            case -3:
                this->output_params.logging_level = log_level::off;
                break;
            case -2:
                this->output_params.logging_level = log_level::critical;
                break;
            case -1:
                this->output_params.logging_level = log_level::err;
                break;
            case 0:
                this->output_params.logging_level = log_level::warn;
                break;
            case 1:
                this->output_params.logging_level = log_level::info;
                break;
            case 2:
                this->output_params.logging_level = log_level::debug;
                break;
            default:
                this->output_params.logging_level = (lvl > 0) ? log_level::trace : log_level::off;
                break;
        }
        set_log_level(this->output_params.logging_level);
    }

    void Context::set_log_level(log_level level)
    {
        output_params.logging_level = level;
        logging::set_log_level(level);
    }

    auto Context::logging_params() const -> LoggingParams
    {
        return {
            .logging_level = output_params.logging_level,
            .log_pattern = output_params.log_pattern,
        };
    }
}
