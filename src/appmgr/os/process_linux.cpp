#if defined(__linux__)

#include "appmgr/os/process.hpp"

#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace appmgr::os {

using appmgr_detail::unexpected;

std::string describe(const ExitStatus& s) {
    if (s.signaled()) return "killed by signal " + std::to_string(s.signal);
    return "exit code " + std::to_string(s.code);
}

const char* to_string(LaunchErrc c) noexcept {
    switch (c) {
        case LaunchErrc::EmptyCommand: return "empty_command";
        case LaunchErrc::SpawnFailed:  return "spawn_failed";
        case LaunchErrc::ExecFailed:   return "exec_failed";
    }
    return "unknown";
}

namespace {

/// State shared between the handle and its supervisor thread.
struct ChildState {
    std::mutex              mu;
    std::condition_variable cv;
    bool                    reaped{false};
    ExitStatus              status{};
    std::function<void(const ExitStatus&)> on_exit;
};

ExitStatus decode(int raw) {
    ExitStatus s;
    if (WIFEXITED(raw))   s.code = WEXITSTATUS(raw);
    if (WIFSIGNALED(raw)) s.signal = WTERMSIG(raw);
    return s;
}

/**
 * @brief Wait for the child without reaping, then reap under the state lock.
 * Signals are only sent while !reaped under the same lock, so a recycled pid
 * is never signalled.
 */
void supervise(pid_t pid, std::shared_ptr<ChildState> st) {
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {}
    ExitStatus status;
    {
        std::lock_guard<std::mutex> lk(st->mu);
        int raw = 0;
        while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {}
        status = decode(raw);
        st->status = status;
        st->reaped = true;
    }
    st->cv.notify_all();
    if (st->on_exit) st->on_exit(status);
}

class PosixProcess final : public ProcessHandle {
public:
    PosixProcess(pid_t pid, std::shared_ptr<ChildState> st)
        : pid_(pid), st_(std::move(st)) {
        reaper_ = std::thread(supervise, pid_, st_);
    }

    ~PosixProcess() override {
        (void)signal_group(SIGKILL); // no-op when already reaped
        if (!reaper_.joinable()) return;
        // Destroyed from inside on_exit: the supervisor is about to return.
        if (reaper_.get_id() == std::this_thread::get_id()) reaper_.detach();
        else reaper_.join();
    }

    int pid() const noexcept override { return static_cast<int>(pid_); }

    bool alive() const override {
        std::lock_guard<std::mutex> lk(st_->mu);
        return !st_->reaped;
    }

    bool terminate() override { return signal_group(SIGTERM); }
    bool kill() override      { return signal_group(SIGKILL); }

    std::optional<ExitStatus> wait_for(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lk(st_->mu);
        if (!st_->cv.wait_for(lk, timeout, [&] { return st_->reaped; })) return std::nullopt;
        return st_->status;
    }

private:
    bool signal_group(int sig) {
        std::lock_guard<std::mutex> lk(st_->mu);
        if (st_->reaped) return false;
        // Child leads its own group; fall back to the pid if the group is gone.
        if (::kill(-pid_, sig) == 0) return true;
        return ::kill(pid_, sig) == 0;
    }

    pid_t                       pid_;
    std::shared_ptr<ChildState> st_;
    std::thread                 reaper_;
};

} // namespace

appmgr_detail::expected<std::unique_ptr<ProcessHandle>, LaunchError>
PosixProcessLauncher::launch(const LaunchSpec& spec) {
    if (spec.entry.empty()) {
        return unexpected(LaunchError{LaunchErrc::EmptyCommand, 0, "no entry point"});
    }

    // argv is built before fork(): only async-signal-safe calls in the child.
    std::vector<std::string> storage;
    storage.reserve(spec.args.size() + 1);
    storage.push_back(spec.entry);
    storage.insert(storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    // Close-on-exec pipe: EOF means exec succeeded, an int means it failed.
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        const int e = errno;
        return unexpected(LaunchError{LaunchErrc::SpawnFailed, e, std::string("pipe2: ") + std::strerror(e)});
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return unexpected(LaunchError{LaunchErrc::SpawnFailed, e, std::string("fork: ") + std::strerror(e)});
    }

    if (pid == 0) {
        ::close(fds[0]);
        ::setpgid(0, 0);
        // The parent may block termination signals for sigwait(); the rapp must not.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        // stdin belongs to the manager's control channel
        if (const int in = ::open("/dev/null", O_RDONLY); in >= 0) {
            ::dup2(in, STDIN_FILENO);
            if (in > STDERR_FILENO) ::close(in);
        }
        if (!spec.inherit_output) {
            const int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) ::close(devnull);
            }
        }
        ::execvp(argv[0], argv.data());
        const int e = errno;
        ssize_t unused = ::write(fds[1], &e, sizeof(e));
        (void)unused;
        ::_exit(127);
    }

    ::close(fds[1]);
    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(fds[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    ::close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int raw = 0;
        while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {}
        return unexpected(LaunchError{LaunchErrc::ExecFailed, child_errno,
                                      spec.entry + ": " + std::strerror(child_errno)});
    }

    auto st = std::make_shared<ChildState>();
    st->on_exit = spec.on_exit;
    return std::unique_ptr<ProcessHandle>(std::make_unique<PosixProcess>(pid, std::move(st)));
}

} // namespace appmgr::os
#endif
