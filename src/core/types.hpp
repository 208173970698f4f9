#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

class Logger;

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// How a child process ended. signal != 0 means it was killed by that signal.
struct ExitStatus {
    int code = -1;
    int signal = 0;

    bool clean() const { return signal == 0 && code == 0; }
};

// Which diagnostics reach the logger (see should_forward()).
enum class VerbosityMode {
    Normal,
    Verbose,
    Silent,
    OnlyUnknown,
    UnknownAndError,
};

const char* verbosity_name(VerbosityMode mode);
std::optional<VerbosityMode> parse_verbosity(const std::string& name);

// Everything needed to start one sftp session.
struct SessionOptions {
    std::string host;                        // ssh alias, must be usable as `sftp <host>`
    std::string cwd;                         // local working directory of the child (empty = inherit)
    std::string label = "sftpdrive";         // prefixed to every diagnostic line
    VerbosityMode verbosity = VerbosityMode::Normal;
    std::shared_ptr<Logger> logger;          // null = ConsoleLogger
    std::string program = "sftp";
    std::vector<std::string> program_args;   // empty = {host}
    std::string log_file;                    // optional debug log, "default" = ~/.sftpdrive/debug.log
};

// Progress callback for batch uploads: (file, 1-based position in the batch)
using UploadProgressCallback = std::function<void(const std::string&, size_t)>;
