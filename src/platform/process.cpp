#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_.load()), status_(other.status_) {
    other.pid_ = -1;
    other.reaped_.store(false);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_.store(other.reaped_.load());
        status_ = other.status_;
        other.pid_ = -1;
        other.reaped_.store(false);
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() const {
    if (pid_ <= 0 || reaped_) return false;
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return false;
    return info.si_pid == 0;  // no state change yet
}

bool ProcessHandle::await_exit() const {
    if (pid_ <= 0 || reaped_) return false;
    siginfo_t info;
    for (;;) {
        if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == 0)
            return true;
        if (errno != EINTR) return false;
    }
}

void ProcessHandle::record(int raw_status) {
    if (WIFEXITED(raw_status)) {
        status_.code = WEXITSTATUS(raw_status);
        status_.signal = 0;
    } else if (WIFSIGNALED(raw_status)) {
        status_.code = -1;
        status_.signal = WTERMSIG(raw_status);
    }
    reaped_.store(true);
}

ExitStatus ProcessHandle::reap() {
    if (pid_ <= 0 || reaped_) return status_;
    int raw = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &raw, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret == pid_) {
        record(raw);
    } else {
        // Not our child any more; nothing left to reap.
        reaped_.store(true);
    }
    return status_;
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait for graceful exit
    for (int waited = 0; waited < TERMINATE_GRACE_MS; waited += 100) {
        int raw = 0;
        if (waitpid(pid_, &raw, WNOHANG) == pid_) {
            record(raw);
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    reap();
}

// ── spawn_piped ──────────────────────────────────────────────

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

Result<PipedChild> spawn_piped(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& cwd) {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};

    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        return Result<PipedChild>::Err(
            fmt::format("cannot create stdin pipe: {}", std::strerror(errno)));
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        return Result<PipedChild>::Err(
            fmt::format("cannot create output pipe: {}", std::strerror(err)));
    }

    // Build argv before forking; the child may only make async-signal-safe calls.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return Result<PipedChild>::Err(fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child process. dup2 clears close-on-exec on the targets.
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            static const char msg[] = "sftpdrive: cannot change to working directory\n";
            (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(EXEC_FAILED_EXIT_CODE);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        static const char msg[] = "sftpdrive: exec failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(EXEC_FAILED_EXIT_CODE);
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);

    PipedChild child;
    child.process.pid_ = pid;
    child.stdin_fd = in_pipe[1];
    child.output_fd = out_pipe[0];
    return Result<PipedChild>::Ok(std::move(child));
}

} // namespace platform
