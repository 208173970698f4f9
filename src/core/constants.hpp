#pragma once

#include <cstddef>

// ── sftp CLI ────────────────────────────────────────────────
constexpr const char* SFTP_PROGRAM         = "sftp";
constexpr const char* SFTP_PROMPT          = "sftp>";
constexpr const char* SFTP_EXIT_COMMAND    = "exit";
// Written right after every cd; its echo marks the end of the cd's output.
constexpr const char* CD_FENCE_COMMAND     = "lpwd";
constexpr const char* COMMAND_TERMINATOR   = "\n";

// ── Recognized output line prefixes ─────────────────────────
constexpr const char* LINE_CONNECTED       = "Connected";
constexpr const char* LINE_UPLOADING       = "Uploading ";
constexpr const char* LINE_FETCHING        = "Fetching ";
constexpr const char* LINE_TRANSFER_SEP    = " to ";
constexpr const char* LINE_REMOTE_PWD      = "Remote working directory:";
constexpr const char* LINE_LOCAL_PWD       = "Local working directory:";
constexpr const char* LINE_SHELL_CD_FAIL   = "-bash: cd: ";
constexpr const char* LINE_STAT_REMOTE     = "stat remote:";

// ── Process handling ────────────────────────────────────────
constexpr int TERMINATE_GRACE_MS           = 2000;  // SIGTERM → SIGKILL escalation
constexpr int EXEC_FAILED_EXIT_CODE        = 127;

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t OUTPUT_READ_BUF_SIZE = 4096;

// ── Configuration ───────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_NAME  = "sftpdrive.yaml";
constexpr const char* GLOBAL_CONFIG_DIR    = ".sftpdrive";
constexpr const char* GLOBAL_CONFIG_NAME   = "config.yaml";
constexpr const char* DEFAULT_LOG_NAME     = "debug.log";
constexpr const char* SFTPDRIVE_VERSION    = "0.4.0";
