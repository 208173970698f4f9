#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <fstream>

enum class Severity {
    Debug,
    Log,
    Info,
    Warn,
    Error,
};

const char* severity_name(Severity severity);

// Pluggable log sink. Implementations must be safe to call from the
// session's reader thread and from caller threads at the same time.
class Logger {
public:
    virtual ~Logger() = default;

    virtual void write(Severity severity, const std::string& message) = 0;

    void debug(const std::string& message) { write(Severity::Debug, message); }
    void log(const std::string& message)   { write(Severity::Log, message); }
    void info(const std::string& message)  { write(Severity::Info, message); }
    void warn(const std::string& message)  { write(Severity::Warn, message); }
    void error(const std::string& message) { write(Severity::Error, message); }
};

// debug/log/info → stdout, warn/error → stderr.
class ConsoleLogger : public Logger {
public:
    void write(Severity severity, const std::string& message) override;

private:
    std::mutex mutex_;
};

// Appends "[HH:MM:SS.mmm] LEVEL message" lines to a file.
class FileLogger : public Logger {
public:
    explicit FileLogger(std::string path);

    void write(Severity severity, const std::string& message) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
    std::ofstream out_;
};

// Fans every line out to several loggers.
class TeeLogger : public Logger {
public:
    explicit TeeLogger(std::vector<std::shared_ptr<Logger>> sinks);

    void write(Severity severity, const std::string& message) override;

private:
    std::vector<std::shared_ptr<Logger>> sinks_;
};
