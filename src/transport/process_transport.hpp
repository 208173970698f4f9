#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <platform/process.hpp>
#include "transport.hpp"
#include "line_splitter.hpp"

// SftpTransport over a real child process: commands go to its stdin, lines
// come from its combined stdout/stderr pipe.
class ProcessTransport : public SftpTransport {
public:
    // Spawn `program args...` in `cwd`. Fails if the pipes or the child
    // cannot be created.
    static Result<std::unique_ptr<ProcessTransport>> open(const std::string& program,
                                                          const std::vector<std::string>& args,
                                                          const std::string& cwd);

    // Take over an already spawned child and its pipe ends.
    explicit ProcessTransport(platform::PipedChild child);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    std::optional<std::string> next_line() override;
    Result<void> write_command(const std::string& command) override;
    void close_input() override;
    ExitStatus wait_exit() override;
    bool kill() override;

    int pid() const { return process_.native_handle(); }

private:
    platform::ProcessHandle process_;
    std::mutex process_mutex_;      // guards process_ reap/terminate

    int stdin_fd_;
    std::mutex write_mutex_;        // guards stdin_fd_

    int output_fd_;                 // reader thread only
    LineSplitter splitter_;
    std::deque<std::string> ready_;
    bool output_done_ = false;
};
