#include "process_transport.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

Result<std::unique_ptr<ProcessTransport>> ProcessTransport::open(
        const std::string& program,
        const std::vector<std::string>& args,
        const std::string& cwd) {
    platform::ignore_sigpipe();

    auto child = platform::spawn_piped(program, args, cwd);
    if (child.is_err()) {
        return Result<std::unique_ptr<ProcessTransport>>::Err(
            fmt::format("cannot start '{}': {}", program, child.error));
    }
    return Result<std::unique_ptr<ProcessTransport>>::Ok(
        std::make_unique<ProcessTransport>(std::move(child.value)));
}

ProcessTransport::ProcessTransport(platform::PipedChild child)
    : process_(std::move(child.process)),
      stdin_fd_(child.stdin_fd),
      output_fd_(child.output_fd) {}

ProcessTransport::~ProcessTransport() {
    close_input();
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_.terminate();
    }
    if (output_fd_ >= 0) {
        ::close(output_fd_);
        output_fd_ = -1;
    }
}

std::optional<std::string> ProcessTransport::next_line() {
    while (ready_.empty()) {
        if (output_done_) return std::nullopt;

        char buf[OUTPUT_READ_BUF_SIZE];
        ssize_t n = ::read(output_fd_, buf, sizeof(buf));
        if (n > 0) {
            for (auto& line : splitter_.feed(std::string_view(buf, static_cast<size_t>(n)))) {
                ready_.push_back(std::move(line));
            }
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            // EOF (or a read error, which ends the stream the same way)
            output_done_ = true;
            if (auto tail = splitter_.flush()) {
                ready_.push_back(std::move(*tail));
            }
        }
    }

    std::string line = std::move(ready_.front());
    ready_.pop_front();
    return line;
}

Result<void> ProcessTransport::write_command(const std::string& command) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        return Result<void>::Err("command input is closed");
    }

    std::string data = command + COMMAND_TERMINATOR;
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = ::write(stdin_fd_, data.data() + sent, data.size() - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(fmt::format("write to sftp failed: {}", std::strerror(errno)));
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

void ProcessTransport::close_input() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

ExitStatus ProcessTransport::wait_exit() {
    // Wait without the lock so kill() stays possible, then reap under it.
    process_.await_exit();
    std::lock_guard<std::mutex> lock(process_mutex_);
    return process_.reap();
}

bool ProcessTransport::kill() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!process_.running()) return false;
    process_.terminate();
    return true;
}
