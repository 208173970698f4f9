#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

struct PipedChild;

// Owning handle to a spawned child process. The pid is reaped at most once;
// after that the recorded ExitStatus is returned and no signal is ever sent.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running() const;

    // Block until the process has exited, without reaping it. Safe to call
    // while another thread holds the handle's owner lock.
    // Returns false if there is nothing to wait for.
    bool await_exit() const;

    // Reap the process (blocking until it exits) and record its status.
    ExitStatus reap();

    // SIGTERM, then SIGKILL if still alive after the grace period. Reaps.
    void terminate();

    bool reaped() const { return reaped_.load(); }
    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    std::atomic<bool> reaped_{false};
    ExitStatus status_;

    void record(int raw_status);

    friend Result<PipedChild> spawn_piped(const std::string& program,
                                          const std::vector<std::string>& args,
                                          const std::string& cwd);
};

// A child whose stdin is `stdin_fd` and whose stdout+stderr both feed `output_fd`.
struct PipedChild {
    ProcessHandle process;
    int stdin_fd = -1;
    int output_fd = -1;
};

// Spawn `program args...` in `cwd` (empty = inherit) with piped stdin and a
// single combined output pipe. Both fds are close-on-exec in the parent.
Result<PipedChild> spawn_piped(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& cwd = "");

} // namespace platform
