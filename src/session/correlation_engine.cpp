#include "correlation_engine.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

CorrelationEngine::CorrelationEngine(OperationRegistry& registry,
                                     const DiagnosticRouter& router,
                                     std::string host)
    : registry_(registry), router_(router), host_(std::move(host)) {}

std::string CorrelationEngine::last_line() const {
    std::lock_guard<std::mutex> lock(last_line_mutex_);
    return last_line_;
}

uint64_t CorrelationEngine::run(LineSource& source) {
    uint64_t n = 0;
    while (auto line = source.next_line()) {
        process_line(*line);
        ++n;
    }
    return n;
}

void CorrelationEngine::process_line(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(last_line_mutex_);
        last_line_ = line;
    }
    lines_processed_.fetch_add(1);
    router_.raw_line(line);

    ClassifiedLine c = classify_line(line);
    switch (c.tag) {
        case LineTag::Connected:        on_connected(c); break;
        case LineTag::UploadProgress:   on_upload(c); break;
        case LineTag::DownloadProgress: on_download(c); break;
        case LineTag::PwdResult:        on_pwd(c); break;
        case LineTag::LocalPwdResult:
            router_.routine(fmt::format("local working directory is {}", c.local_path));
            break;
        case LineTag::CdFailureShell:
        case LineTag::CdFailureStat:    on_cd_failure(c); break;
        case LineTag::Prompt:           on_prompt(c); break;
        case LineTag::Unrecognized:     router_.unrecognized(line); break;
    }
}

void CorrelationEngine::report_mismatch(const std::string& what, const ClassifiedLine& c) {
    state_mismatches_.fetch_add(1);
    std::string detail;
    if (!c.local_path.empty()) detail += fmt::format(" localPath='{}'", c.local_path);
    if (!c.remote_path.empty()) detail += fmt::format(" remotePath='{}'", c.remote_path);
    router_.problem(fmt::format("STATE_MISMATCH: {} but no matching operation was pending "
                                "(line {}: '{}'){}",
                                what, lines_processed_.load(), c.raw, detail));
}

void CorrelationEngine::on_connected(const ClassifiedLine& c) {
    // One-time event: the connect slot is consumed by the first occurrence.
    if (registry_.settle(OperationKind::Connect, "", true) != SettleOutcome::Settled) {
        report_mismatch("sftp announced a connection", c);
        return;
    }
    router_.milestone(fmt::format("connected to {}", host_));
}

void CorrelationEngine::on_upload(const ClassifiedLine& c) {
    if (registry_.settle(OperationKind::Upload, c.local_path, true) != SettleOutcome::Settled) {
        report_mismatch("sftp announced an upload", c);
        return;
    }
    router_.milestone(fmt::format("Uploaded {} to {}", c.local_path, c.remote_path));
}

void CorrelationEngine::on_download(const ClassifiedLine& c) {
    if (registry_.settle(OperationKind::Download, c.local_path, true) != SettleOutcome::Settled) {
        report_mismatch("sftp announced a download", c);
        return;
    }
    router_.milestone(fmt::format("Downloaded {} to {}", c.remote_path, c.local_path));
}

void CorrelationEngine::on_pwd(const ClassifiedLine& c) {
    if (registry_.settle(OperationKind::Pwd, "", c.remote_path) != SettleOutcome::Settled) {
        report_mismatch("sftp reported the remote working directory", c);
        return;
    }
    router_.routine(fmt::format("remote working directory is {}", c.remote_path));
}

void CorrelationEngine::on_cd_failure(const ClassifiedLine& c) {
    auto pending = registry_.peek(OperationKind::Cd);
    if (!pending) {
        report_mismatch("sftp reported a failed cd", c);
        return;
    }

    // "stat remote:" carries only the reason; the path is the one we asked for.
    // A shell failure naming another directory is not about this cd.
    if (c.tag == LineTag::CdFailureShell && !c.remote_path.empty() &&
        c.remote_path != pending->key) {
        report_mismatch(fmt::format("sftp reported a failed cd into '{}'", c.remote_path), c);
        return;
    }
    std::string message = fmt::format("cd into '{}' failed: {}", pending->key, c.failure_reason);
    registry_.fail(OperationKind::Cd, "", message);
    router_.problem(message, Severity::Warn);
}

void CorrelationEngine::on_prompt(const ClassifiedLine& c) {
    router_.routine(prompt_command(c));

    auto pending = registry_.peek(OperationKind::Cd);
    if (!pending) return;

    // sftp echoes each command it reads as "sftp> <command>". The echo of the
    // pending cd itself starts that cd; any later prompt (normally the echo of
    // the fence command written right after it) means it succeeded.
    std::string echoed = StringUtils::join(StringUtils::split_whitespace(prompt_command(c)), " ");
    std::string issued = StringUtils::join(StringUtils::split_whitespace(pending->command), " ");
    if (pending->phase == OperationPhase::Issued && echoed == issued) {
        registry_.mark_echoed(OperationKind::Cd);
        return;
    }

    registry_.settle(OperationKind::Cd, "");
    router_.routine(fmt::format("cd into '{}' succeeded", pending->key));
}
