#pragma once
/**
 * @file process.hpp
 * @brief Child-process launch and supervision for rapp entry points.
 * @note Linux implemented (fork/exec into a fresh process group, reaper thread per child).
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "appmgr/compat/expected.hpp"

namespace appmgr::os {

    /// @brief How a child ended: exit code, or the terminating signal.
    struct ExitStatus {
        int code{0};   ///< Exit code when exited normally
        int signal{0}; ///< Terminating signal, 0 if exited normally
        bool signaled() const noexcept { return signal != 0; }
        bool success() const noexcept { return signal == 0 && code == 0; }
    };

    std::string describe(const ExitStatus& s);

    enum class LaunchErrc : std::uint8_t {
        EmptyCommand, ///< No entry point given
        SpawnFailed,  ///< fork/pipe failed in the parent
        ExecFailed    ///< Child could not exec the entry point
    };

    const char* to_string(LaunchErrc c) noexcept;

    struct LaunchError {
        LaunchErrc  code{LaunchErrc::SpawnFailed};
        int         sys_errno{0};
        std::string detail;
    };

    /// @brief What to run and who to tell when it ends.
    struct LaunchSpec {
        std::string              entry;                ///< Executable (PATH lookup when relative)
        std::vector<std::string> args;                 ///< argv[1..]
        bool                     inherit_output{false};///< false: stdout/stderr to /dev/null
        /// Invoked once, from a supervisor thread, after the child has been reaped.
        std::function<void(const ExitStatus&)> on_exit;
    };

    /**
     * @class ProcessHandle
     * @brief Owning handle; destroying it kills a still-running child and
     *        waits for the supervisor (including a pending on_exit) to finish.
     */
    class ProcessHandle {
    public:
        virtual ~ProcessHandle() = default;
        virtual int  pid() const noexcept = 0;
        virtual bool alive() const = 0;
        /// SIGTERM to the child's process group. false if already gone.
        virtual bool terminate() = 0;
        /// SIGKILL to the child's process group. false if already gone.
        virtual bool kill() = 0;
        /// Block up to @p timeout for the exit; nullopt if still running.
        virtual std::optional<ExitStatus> wait_for(std::chrono::milliseconds timeout) = 0;
    };

    class ProcessLauncher {
    public:
        virtual ~ProcessLauncher() = default;
        virtual appmgr_detail::expected<std::unique_ptr<ProcessHandle>, LaunchError>
        launch(const LaunchSpec& spec) = 0;
    };

    /// fork/exec launcher; exec failures are reported synchronously.
    class PosixProcessLauncher final : public ProcessLauncher {
    public:
        appmgr_detail::expected<std::unique_ptr<ProcessHandle>, LaunchError>
        launch(const LaunchSpec& spec) override;
    };

} // namespace appmgr::os
