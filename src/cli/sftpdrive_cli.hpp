#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <core/config.hpp>
#include <session/sftp_session.hpp>

// Interactive front end: one sftp session behind a readline REPL.
class SftpDriveCLI {
public:
    using CommandHandler = std::function<void(const std::string&)>;

    explicit SftpDriveCLI(Config config);

    // Connect, wait for the connection line, run the REPL until exit/EOF.
    // Returns the process exit code.
    int run();

    void add_command(const std::string& name, CommandHandler handler, const std::string& help);
    void execute_command(const std::string& command, const std::string& args);
    void print_help() const;

private:
    Config config_;
    std::unique_ptr<SftpSession> session_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    bool done_ = false;
    int exit_code_ = 0;

    void register_all_commands();
    void close_session();
    std::string prompt_string() const;
};
