#include "types.hpp"
#include "errors.hpp"

const char* verbosity_name(VerbosityMode mode) {
    switch (mode) {
        case VerbosityMode::Normal:          return "normal";
        case VerbosityMode::Verbose:         return "verbose";
        case VerbosityMode::Silent:          return "silent";
        case VerbosityMode::OnlyUnknown:     return "only-unknown";
        case VerbosityMode::UnknownAndError: return "unknown-and-error";
    }
    return "normal";
}

std::optional<VerbosityMode> parse_verbosity(const std::string& name) {
    if (name == "normal")            return VerbosityMode::Normal;
    if (name == "verbose")           return VerbosityMode::Verbose;
    if (name == "silent")            return VerbosityMode::Silent;
    if (name == "only-unknown")      return VerbosityMode::OnlyUnknown;
    if (name == "unknown-and-error") return VerbosityMode::UnknownAndError;
    return std::nullopt;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::StateMismatch:               return "STATE_MISMATCH";
        case ErrorKind::OperationFailure:            return "OPERATION_FAILURE";
        case ErrorKind::DuplicateOperation:          return "DUPLICATE_OPERATION";
        case ErrorKind::ProcessTransportUnavailable: return "PROCESS_TRANSPORT_UNAVAILABLE";
        case ErrorKind::UncleanExit:                 return "UNCLEAN_EXIT";
    }
    return "UNKNOWN";
}
