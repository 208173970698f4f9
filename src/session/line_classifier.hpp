#pragma once

#include <optional>
#include <string>

// Which known sftp output shape a line has.
enum class LineTag {
    Connected,          // "Connected to host."
    UploadProgress,     // "Uploading <local> to <remote>"
    DownloadProgress,   // "Fetching <remote> to <local>"
    PwdResult,          // "Remote working directory: <path>"
    LocalPwdResult,     // "Local working directory: <path>"
    CdFailureShell,     // "-bash: cd: <path>: <reason>"
    CdFailureStat,      // "stat remote: <reason>"
    Prompt,             // "sftp> <action> <args...>"
    Unrecognized,
};

const char* line_tag_name(LineTag tag);

struct ClassifiedLine {
    LineTag tag = LineTag::Unrecognized;
    std::string raw;
    std::string local_path;
    std::string remote_path;
    std::string failure_reason;
    std::string action;       // prompt: first token after "sftp>"
    std::string args_text;    // prompt: remaining tokens, single-space joined
};

// Classify one trimmed, non-empty line. First matching pattern wins, in the
// order the LineTag values are declared. Pure; never fails.
ClassifiedLine classify_line(const std::string& line);

// Rebuild the canonical output line for tags where that is well defined
// (PwdResult, UploadProgress, DownloadProgress).
std::optional<std::string> format_line(const ClassifiedLine& classified);

// Text of the command a prompt line echoes ("cd /tmp" for "sftp> cd /tmp").
std::string prompt_command(const ClassifiedLine& classified);
