#pragma once

#include <memory>
#include <string>
#include <core/logger.hpp>
#include <core/types.hpp>

// What a diagnostic is about, independent of its severity.
enum class EventClass {
    RawLine,        // every output line before classification
    Unrecognized,   // a line no pattern matched
    Milestone,      // connected, transfer complete, clean exit
    Routine,        // prompt echoes, pwd results, other housekeeping
    Problem,        // state mismatches, failures, unclean exit
};

// The verbosity policy as a pure function, consulted once per diagnostic.
//
//   mode               | unrecognized | milestone | routine | problem      | raw
//   normal             | yes          | yes       | no      | yes          | no
//   verbose            | yes          | yes       | yes     | yes          | yes (debug)
//   silent             | no           | no        | no      | no           | no
//   only-unknown       | yes          | no        | no      | no           | no
//   unknown-and-error  | yes          | error severity only, any class   | no
bool should_forward(VerbosityMode mode, EventClass event, Severity severity);

// Applies should_forward() and hands surviving messages, prefixed with the
// session label, to the logger.
class DiagnosticRouter {
public:
    DiagnosticRouter(std::shared_ptr<Logger> logger, VerbosityMode mode, std::string label);

    void route(EventClass event, Severity severity, const std::string& message) const;

    void raw_line(const std::string& line) const;
    void unrecognized(const std::string& line) const;
    void milestone(const std::string& message) const;
    void routine(const std::string& message) const;
    void problem(const std::string& message, Severity severity = Severity::Error) const;

    VerbosityMode mode() const { return mode_; }
    const std::string& label() const { return label_; }

private:
    std::shared_ptr<Logger> logger_;
    VerbosityMode mode_;
    std::string label_;
};
