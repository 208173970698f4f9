#include "line_classifier.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>
#include <cstring>
#include <fmt/format.h>

using StringUtils::starts_with;
using StringUtils::trim;

const char* line_tag_name(LineTag tag) {
    switch (tag) {
        case LineTag::Connected:        return "connected";
        case LineTag::UploadProgress:   return "uploadProgress";
        case LineTag::DownloadProgress: return "downloadProgress";
        case LineTag::PwdResult:        return "pwdResult";
        case LineTag::LocalPwdResult:   return "localPwdResult";
        case LineTag::CdFailureShell:   return "cdFailureShell";
        case LineTag::CdFailureStat:    return "cdFailureStat";
        case LineTag::Prompt:           return "prompt";
        case LineTag::Unrecognized:     return "unrecognized";
    }
    return "unrecognized";
}

// "<first> to <second>"; splits at the first separator. Paths containing
// " to " are therefore attributed to the second field.
static void split_transfer(const std::string& rest, std::string& first, std::string& second) {
    auto sep = rest.find(LINE_TRANSFER_SEP);
    if (sep == std::string::npos) {
        first = trim(rest);
        second.clear();
        return;
    }
    first = trim(rest.substr(0, sep));
    second = trim(rest.substr(sep + std::strlen(LINE_TRANSFER_SEP)));
}

ClassifiedLine classify_line(const std::string& line) {
    ClassifiedLine c;
    c.raw = line;

    if (starts_with(line, LINE_CONNECTED)) {
        c.tag = LineTag::Connected;
        return c;
    }

    if (starts_with(line, LINE_UPLOADING)) {
        c.tag = LineTag::UploadProgress;
        split_transfer(line.substr(std::strlen(LINE_UPLOADING)), c.local_path, c.remote_path);
        return c;
    }

    if (starts_with(line, LINE_FETCHING)) {
        c.tag = LineTag::DownloadProgress;
        split_transfer(line.substr(std::strlen(LINE_FETCHING)), c.remote_path, c.local_path);
        return c;
    }

    if (starts_with(line, LINE_REMOTE_PWD)) {
        c.tag = LineTag::PwdResult;
        c.remote_path = trim(line.substr(std::strlen(LINE_REMOTE_PWD)));
        return c;
    }

    if (starts_with(line, LINE_LOCAL_PWD)) {
        c.tag = LineTag::LocalPwdResult;
        c.local_path = trim(line.substr(std::strlen(LINE_LOCAL_PWD)));
        return c;
    }

    if (starts_with(line, LINE_SHELL_CD_FAIL)) {
        c.tag = LineTag::CdFailureShell;
        std::string rest = line.substr(std::strlen(LINE_SHELL_CD_FAIL));
        // The reason never contains ": ", the path might.
        auto sep = rest.rfind(": ");
        if (sep == std::string::npos) {
            c.remote_path = trim(rest);
        } else {
            c.remote_path = trim(rest.substr(0, sep));
            c.failure_reason = trim(rest.substr(sep + 2));
        }
        return c;
    }

    if (starts_with(line, LINE_STAT_REMOTE)) {
        c.tag = LineTag::CdFailureStat;
        c.failure_reason = trim(line.substr(std::strlen(LINE_STAT_REMOTE)));
        return c;
    }

    if (starts_with(line, SFTP_PROMPT)) {
        c.tag = LineTag::Prompt;
        auto tokens = StringUtils::split_whitespace(line.substr(std::strlen(SFTP_PROMPT)));
        if (!tokens.empty()) {
            c.action = tokens.front();
            tokens.erase(tokens.begin());
            c.args_text = StringUtils::join(tokens, " ");
        }
        return c;
    }

    c.tag = LineTag::Unrecognized;
    return c;
}

std::optional<std::string> format_line(const ClassifiedLine& classified) {
    switch (classified.tag) {
        case LineTag::PwdResult:
            return fmt::format("{} {}", LINE_REMOTE_PWD, classified.remote_path);
        case LineTag::UploadProgress:
            return fmt::format("{}{}{}{}", LINE_UPLOADING, classified.local_path,
                               LINE_TRANSFER_SEP, classified.remote_path);
        case LineTag::DownloadProgress:
            return fmt::format("{}{}{}{}", LINE_FETCHING, classified.remote_path,
                               LINE_TRANSFER_SEP, classified.local_path);
        default:
            return std::nullopt;
    }
}

std::string prompt_command(const ClassifiedLine& classified) {
    if (classified.args_text.empty()) return classified.action;
    return classified.action + " " + classified.args_text;
}
