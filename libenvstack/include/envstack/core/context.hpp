// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_CONTEXT_HPP
#define ENVSTACK_CORE_CONTEXT_HPP

#include <optional>
#include <string>
#include <vector>

#include "envstack/core/logging.hpp"
#include "envstack/fs/filesystem.hpp"

namespace envstack
{
    struct ContextOptions
    {
        bool enable_logging = false;
    };

    class Context
    {
    public:

        struct OutputParams
        {
            int verbosity{ 0 };
            log_level logging_level{ log_level::warn };

            bool json{ false };
            bool quiet{ false };

            std::string log_pattern{ "%^%-9!l%-8n%$ %v" };
        };

        struct SrcParams
        {
            bool no_rc{ false };
            bool no_env{ false };
        };

        struct PrefixParams
        {
            fs::u8path root_prefix;
        };

        // Search directories for environments referred to by name.
        std::vector<fs::u8path> envs_dirs;

        bool change_ps1 = true;
        std::string env_prompt = "({default_env}) ";

        OutputParams output_params;
        SrcParams src_params;
        PrefixParams prefix_params;

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

        Context(const ContextOptions& options = {});
        ~Context();

        void set_verbosity(int lvl);
        void set_log_level(log_level level);

        [[nodiscard]] auto logging_params() const -> LoggingParams;

    private:

        bool m_logging_enabled = false;
    };

    /** Default root prefix, the parent of the directory holding the running executable. */
    [[nodiscard]] auto default_root_prefix() -> fs::u8path;

    inline constexpr auto ROOT_ENV_NAME = "root";
    inline constexpr auto BASE_ENV_NAME = "base";
}

#endif
