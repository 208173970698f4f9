#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_NAME;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_NAME;
}

fs::path get_default_log_path() {
    return get_global_config_dir() / DEFAULT_LOG_NAME;
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Default config content
    const char* default_config = R"(# sftpdrive configuration
# The host must be an alias from ~/.ssh/config that works with `sftp <host>`.

host: ""
cwd: ""                 # local working directory for the sftp child
label: "sftpdrive"      # prefix for all diagnostic output

# normal | verbose | silent | only-unknown | unknown-and-error
verbosity: normal

# Optional: program and arguments (default: sftp <host>)
# Never pass -q: quiet mode hides the "Connected", "Uploading" and
# "Fetching" lines that complete connects and transfers.
# program: sftp
# args: ["-P", "2222", "my-alias"]

# Optional: debug log ("default" = ~/.sftpdrive/debug.log)
# log_file: default
)";

    try {
        // Ensure directory exists
        fs::create_directories(config_path.parent_path());

        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// Apply every key present in the file at `path` on top of `config`.
Result<void> overlay_config(Config& config, const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<void>::Ok();
        }
        if (!root.IsMap()) {
            return Result<void>::Err(fmt::format("{}: top level must be a mapping", path.string()));
        }

        SessionOptions& s = config.session_;
        if (root["host"])  s.host = root["host"].as<std::string>("");
        if (root["cwd"])   s.cwd = root["cwd"].as<std::string>("");
        if (root["label"]) s.label = root["label"].as<std::string>(s.label);

        if (root["verbosity"]) {
            auto name = root["verbosity"].as<std::string>("");
            auto mode = parse_verbosity(name);
            if (!mode) {
                return Result<void>::Err(fmt::format(
                    "{}: unknown verbosity '{}' (expected normal, verbose, silent, "
                    "only-unknown or unknown-and-error)", path.string(), name));
            }
            s.verbosity = *mode;
        }

        if (root["program"]) s.program = root["program"].as<std::string>(SFTP_PROGRAM);

        if (root["args"]) {
            if (root["args"].IsSequence()) {
                s.program_args = root["args"].as<std::vector<std::string>>();
            } else if (root["args"].IsScalar()) {
                s.program_args = {root["args"].as<std::string>()};
            }
            for (const auto& arg : s.program_args) {
                if (arg == "-q") {
                    return Result<void>::Err(fmt::format(
                        "{}: 'args' must not contain -q (quiet sftp never confirms "
                        "connects or transfers)", path.string()));
                }
            }
        }

        if (root["log_file"]) {
            s.log_file = root["log_file"].as<std::string>("");
            if (s.log_file == "default") {
                s.log_file = get_default_log_path().string();
            }
        }

        config.source_ = path;
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    Config config;
    auto r = overlay_config(config, path);
    if (r.is_err()) {
        return Result<Config>::Err(r.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}

Result<Config> Config::load_project(const fs::path& dir) {
    return load_file(get_project_config_path(dir));
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;

    if (global_config_exists()) {
        auto r = overlay_config(config, get_global_config_path());
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    if (project_config_exists(project_dir)) {
        auto r = overlay_config(config, get_project_config_path(project_dir));
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    if (config.session_.host.empty()) {
        return Result<Config>::Err(fmt::format(
            "No host configured. Set 'host' in {} or {}",
            get_project_config_path(project_dir).string(),
            get_global_config_path().string()));
    }

    return Result<Config>::Ok(config);
}
