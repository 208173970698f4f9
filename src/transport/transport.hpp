#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

// Sequential, blocking producer of the child's output lines.
// Every line is trimmed and non-empty; nullopt means the stream has ended.
class LineSource {
public:
    virtual ~LineSource() = default;
    virtual std::optional<std::string> next_line() = 0;
};

// Writes commands to the child's stdin. write_command() appends the line
// terminator; concurrent writers are serialized in call order.
class CommandSink {
public:
    virtual ~CommandSink() = default;
    virtual Result<void> write_command(const std::string& command) = 0;
    virtual void close_input() = 0;
};

// Both ends of one sftp child plus its lifecycle.
class SftpTransport : public LineSource, public CommandSink {
public:
    // Block until the child exits and return how it ended.
    virtual ExitStatus wait_exit() = 0;

    // Hard-kill the child. Returns false if it had already exited.
    virtual bool kill() = 0;
};
