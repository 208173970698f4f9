#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <fmt/format.h>

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug: return "DEBUG";
        case Severity::Log:   return "LOG";
        case Severity::Info:  return "INFO";
        case Severity::Warn:  return "WARN";
        case Severity::Error: return "ERROR";
    }
    return "LOG";
}

// ── ConsoleLogger ────────────────────────────────────────────

void ConsoleLogger::write(Severity severity, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool to_stderr = severity == Severity::Warn || severity == Severity::Error;
    std::FILE* stream = to_stderr ? stderr : stdout;
    if (severity == Severity::Log || severity == Severity::Info) {
        fmt::print(stream, "{}\n", message);
    } else {
        fmt::print(stream, "[{}] {}\n", severity_name(severity), message);
    }
    std::fflush(stream);
}

// ── FileLogger ───────────────────────────────────────────────

FileLogger::FileLogger(std::string path) : path_(std::move(path)) {
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    out_.open(path_, std::ios::app);
}

void FileLogger::write(Severity severity, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out_ << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {:<5} {}\n",
                        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                        static_cast<int>(ms.count()), severity_name(severity), message);
    out_.flush();
}

// ── TeeLogger ────────────────────────────────────────────────

TeeLogger::TeeLogger(std::vector<std::shared_ptr<Logger>> sinks)
    : sinks_(std::move(sinks)) {}

void TeeLogger::write(Severity severity, const std::string& message) {
    for (const auto& sink : sinks_) {
        if (sink) sink->write(severity, message);
    }
}
