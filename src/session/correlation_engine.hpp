#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <transport/transport.hpp>
#include "diagnostic_router.hpp"
#include "line_classifier.hpp"
#include "operation_registry.hpp"

// Matches sftp output lines to outstanding operations.
//
// process_line() must only ever be called from one thread at a time, in
// output order (run() does exactly that). A line confirming something the
// registry does not hold is a state mismatch: it is reported through the
// router at error severity and otherwise dropped, never thrown.
class CorrelationEngine {
public:
    CorrelationEngine(OperationRegistry& registry, const DiagnosticRouter& router,
                      std::string host);

    void process_line(const std::string& line);

    // Consume `source` until it ends. Returns the number of lines processed.
    uint64_t run(LineSource& source);

    uint64_t lines_processed() const { return lines_processed_.load(); }
    uint64_t state_mismatches() const { return state_mismatches_.load(); }
    std::string last_line() const;

private:
    OperationRegistry& registry_;
    const DiagnosticRouter& router_;
    std::string host_;

    std::atomic<uint64_t> lines_processed_{0};
    std::atomic<uint64_t> state_mismatches_{0};
    mutable std::mutex last_line_mutex_;
    std::string last_line_;

    void on_connected(const ClassifiedLine& c);
    void on_upload(const ClassifiedLine& c);
    void on_download(const ClassifiedLine& c);
    void on_pwd(const ClassifiedLine& c);
    void on_cd_failure(const ClassifiedLine& c);
    void on_prompt(const ClassifiedLine& c);

    void report_mismatch(const std::string& what, const ClassifiedLine& c);
};
