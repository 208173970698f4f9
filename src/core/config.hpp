#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.sftpdrive/config.yaml
    static Result<Config> load_global();

    // Load project config from ./sftpdrive.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load a single config file (no fallback)
    static Result<Config> load_file(const fs::path& path);

    // Load both and combine (project keys override global ones).
    // Either file may be absent, but the merged result must name a host.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Accessors
    const SessionOptions& session() const { return session_; }
    SessionOptions& session() { return session_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    SessionOptions session_;
    fs::path source_;

    friend Result<void> overlay_config(Config& config, const fs::path& path);
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
fs::path get_default_log_path();

// Create default global config
Result<void> create_default_global_config();
