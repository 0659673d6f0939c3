// Copyright (c) 2024, envstack contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVSTACK_CORE_SHELL_DETECTION_HPP
#define ENVSTACK_CORE_SHELL_DETECTION_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "envstack/core/error_handling.hpp"
#include "envstack/fs/filesystem.hpp"
#include "envstack/util/environment.hpp"

namespace envstack
{
    enum class ShellFlavor
    {
        bash,
        zsh,
        dash,
        posh,
        ksh,
        csh,
        tcsh,
        cmd,
        powershell,
        xonsh,
        unknown,
    };

    [[nodiscard]] auto to_string(ShellFlavor flavor) -> std::string_view;

    /**
     * Parse a shell name such as ``bash``, ``/bin/zsh``, ``-tcsh``, ``cmd.exe`` or ``pwsh``.
     *
     * Returns ``unknown`` for names which do not match a supported shell, including the
     * ambiguous ``sh``.
     */
    [[nodiscard]] auto shell_flavor_from_name(std::string_view name) -> ShellFlavor;

    [[nodiscard]] auto all_shell_flavors() -> std::vector<ShellFlavor>;

    /** A process table entry. */
    struct ProcessInfo
    {
        int pid = 0;
        int ppid = 0;
        /** Short command name. */
        std::string comm = {};
        /** Command line, with ``args[0]`` as seen by the program. */
        std::vector<std::string> args = {};
    };

    /** Read access to the system process table. */
    class ProcessTable
    {
    public:

        virtual ~ProcessTable() = default;

        [[nodiscard]] virtual auto lookup(int pid) const -> std::optional<ProcessInfo> = 0;
    };

    /** Process table read from a ``procfs`` mount. */
    class ProcFsProcessTable : public ProcessTable
    {
    public:

        explicit ProcFsProcessTable(fs::u8path proc_root = "/proc");

        [[nodiscard]] auto lookup(int pid) const -> std::optional<ProcessInfo> override;

    private:

        fs::u8path m_proc_root;
    };

    /** Process table read through the ``ps`` program, for systems without ``procfs``. */
    class PsProcessTable : public ProcessTable
    {
    public:

        [[nodiscard]] auto lookup(int pid) const -> std::optional<ProcessInfo> override;
    };

    /** @returns The process table implementation suited to the running system. */
    [[nodiscard]] auto make_system_process_table() -> std::unique_ptr<ProcessTable>;

    /** Host information used to disambiguate the generic ``sh`` name. */
    struct SystemInfo
    {
        /** Kernel name, ``Linux`` or ``Darwin`` for instance. */
        std::string sysname = {};
        /** Lower case distribution identifier, empty if unknown. */
        std::string distribution = {};
        /** Real program behind ``/bin/sh`` if it is a link. */
        std::optional<fs::u8path> bin_sh_target = {};
        /** The user login shell, from ``SHELL``. */
        std::string login_shell = {};
        /** Nesting depth of the calling shell, ``SHLVL`` minus the detector own level. */
        int shell_level = 0;
    };

    [[nodiscard]] auto current_system_info() -> SystemInfo;

    /** Outcome of a detection, with the details reported in verbose mode. */
    struct ShellDetection
    {
        ShellFlavor flavor = ShellFlavor::unknown;
        /** Name of the process as it was inspected, without login marker. */
        std::string process_name = {};
        /** The shell was started as a login shell. */
        bool login = false;
        /** Which rule resolved the flavor. */
        std::string method = {};
    };

    /**
     * Classify the shell running as a given process.
     *
     * Resolution order is: shell specific environment markers, the process command name, and
     * for the ambiguous ``sh`` a set of host heuristics.
     */
    class ShellDetector
    {
    public:

        ShellDetector(const ProcessTable& table, SystemInfo info, util::environment_map env);

        /** Detect the shell running as the process @p pid. */
        [[nodiscard]] auto detect(int pid) const -> expected_t<ShellDetection>;

        /** Detect the shell running as the parent of the current process. */
        [[nodiscard]] auto detect() const -> expected_t<ShellDetection>;

        /** Resolve the real shell behind ``sh``. */
        [[nodiscard]] auto disambiguate_sh(bool login) const -> ShellDetection;

    private:

        const ProcessTable& m_table;
        SystemInfo m_info;
        util::environment_map m_env;

        auto from_markers() const -> std::optional<ShellDetection>;
        auto from_process(const ProcessInfo& process) const -> ShellDetection;
    };

    /** Detect the calling shell using the live system. */
    [[nodiscard]] auto detect_shell() -> expected_t<ShellDetection>;
}

#endif
