#include "diagnostic_router.hpp"
#include <fmt/format.h>

bool should_forward(VerbosityMode mode, EventClass event, Severity severity) {
    switch (mode) {
        case VerbosityMode::Silent:
            return false;
        case VerbosityMode::Verbose:
            return true;
        case VerbosityMode::Normal:
            return event == EventClass::Unrecognized ||
                   event == EventClass::Milestone ||
                   event == EventClass::Problem;
        case VerbosityMode::OnlyUnknown:
            return event == EventClass::Unrecognized;
        case VerbosityMode::UnknownAndError:
            return event == EventClass::Unrecognized ||
                   (severity == Severity::Error && event != EventClass::RawLine);
    }
    return false;
}

DiagnosticRouter::DiagnosticRouter(std::shared_ptr<Logger> logger, VerbosityMode mode,
                                   std::string label)
    : logger_(std::move(logger)), mode_(mode), label_(std::move(label)) {}

void DiagnosticRouter::route(EventClass event, Severity severity,
                             const std::string& message) const {
    if (!logger_ || !should_forward(mode_, event, severity)) return;
    logger_->write(severity, fmt::format("{}: {}", label_, message));
}

void DiagnosticRouter::raw_line(const std::string& line) const {
    route(EventClass::RawLine, Severity::Debug, "<- " + line);
}

void DiagnosticRouter::unrecognized(const std::string& line) const {
    route(EventClass::Unrecognized, Severity::Log, "-> " + line);
}

void DiagnosticRouter::milestone(const std::string& message) const {
    route(EventClass::Milestone, Severity::Info, message);
}

void DiagnosticRouter::routine(const std::string& message) const {
    route(EventClass::Routine, Severity::Log, message);
}

void DiagnosticRouter::problem(const std::string& message, Severity severity) const {
    route(EventClass::Problem, severity, message);
}
