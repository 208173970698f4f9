#pragma once

#include <stdexcept>
#include <string>

// Failure taxonomy of a session. Rejected futures carry an SftpError.
enum class ErrorKind {
    StateMismatch,               // output confirmed an operation nobody registered
    OperationFailure,            // the operation itself failed (e.g. cd into a missing dir)
    DuplicateOperation,          // a single-slot operation was already outstanding
    ProcessTransportUnavailable, // stdin/output pipes or the child could not be set up
    UncleanExit,                 // close() saw a non-zero exit or a signal
};

const char* error_kind_name(ErrorKind kind);

class SftpError : public std::runtime_error {
public:
    SftpError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
