#include "sftpdrive_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>
#include <iostream>
#include <sstream>
#include <chrono>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

SftpDriveCLI::SftpDriveCLI(Config config) : config_(std::move(config)) {
    register_all_commands();
}

void SftpDriveCLI::add_command(const std::string& name, CommandHandler handler,
                               const std::string& help) {
    commands_[name] = {std::move(handler), help};
}

void SftpDriveCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::hint("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(args);
    } catch (const SftpError& e) {
        std::cout << theme::fail(fmt::format("[{}] {}", error_kind_name(e.kind()), e.what()));
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void SftpDriveCLI::print_help() const {
    std::cout << "\n";
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::color::TEAL << fmt::format("    {:<22}", name)
                  << theme::color::RESET << theme::dim(entry.second) << "\n";
    }
    std::cout << "\n";
}

static std::pair<std::string, std::string> split_two(const std::string& args) {
    auto parts = StringUtils::split_whitespace(args);
    std::string first = parts.size() > 0 ? parts[0] : "";
    std::string second = parts.size() > 1 ? parts[1] : "";
    return {first, second};
}

void SftpDriveCLI::register_all_commands() {
    add_command("help", [this](const std::string&) {
        print_help();
    }, "Show this help message");

    add_command("pwd", [this](const std::string&) {
        std::cout << theme::kv("remote", session_->pwd().get());
    }, "Print the remote working directory");

    add_command("cd", [this](const std::string& args) {
        auto path = StringUtils::trim(args);
        session_->cd(path).get();
        std::cout << theme::ok("cd " + path);
    }, "cd <path>: change the remote directory");

    add_command("lcd", [this](const std::string& args) {
        session_->lcd(StringUtils::trim(args)).get();
    }, "lcd <path>: change the local directory");

    add_command("ls", [this](const std::string& args) {
        session_->ls(StringUtils::trim(args)).get();
    }, "ls [path]: list a remote directory");

    add_command("lls", [this](const std::string& args) {
        session_->lls(StringUtils::trim(args)).get();
    }, "lls [path]: list a local directory");

    add_command("put", [this](const std::string& args) {
        auto [local, remote] = split_two(args);
        if (session_->upload_file(local, remote).get()) {
            std::cout << theme::transfer(local, "->", remote.empty() ? "." : remote);
        }
    }, "put <local> [remote]: upload one file");

    add_command("mput", [this](const std::string& args) {
        auto files = StringUtils::split_whitespace(args);
        auto total = files.size();
        session_->upload_files(files, [total](const std::string& file, size_t nr) {
            std::cout << theme::progress(nr, total, file);
        }).get();
    }, "mput <file>...: upload files one after another");

    add_command("get", [this](const std::string& args) {
        auto [remote, local] = split_two(args);
        if (session_->download_file(remote, local).get()) {
            std::cout << theme::transfer(remote, "->", local.empty() ? "." : local);
        }
    }, "get <remote> [local]: download one file");

    add_command("raw", [this](const std::string& args) {
        session_->send_command(StringUtils::trim(args)).get();
    }, "raw <command>: send a command to sftp as-is");

    add_command("kill", [this](const std::string&) {
        session_->kill();
        done_ = true;
        exit_code_ = 1;
    }, "Kill the sftp process and leave");

    auto quit = [this](const std::string&) {
        close_session();
        done_ = true;
    };
    add_command("exit", quit, "Close the session and leave");
    add_command("quit", quit, "Close the session and leave");
}

void SftpDriveCLI::close_session() {
    if (!session_) return;
    try {
        auto status = session_->close().get();
        std::cout << theme::dim(fmt::format("    sftp exited with code {}", status.code)) << "\n";
    } catch (const std::exception& e) {
        std::cout << theme::fail(e.what());
        exit_code_ = 1;
    }
}

std::string SftpDriveCLI::prompt_string() const {
    return theme::prompt(config_.session().label, config_.session().host);
}

int SftpDriveCLI::run() {
    const auto& options = config_.session();
    std::cout << theme::banner(SFTPDRIVE_VERSION);

    std::cout << theme::section("Connecting");
    std::cout << theme::kv("Host", options.host);
    if (!options.cwd.empty()) std::cout << theme::kv("Local dir", options.cwd);
    std::cout << theme::kv("Verbosity", verbosity_name(options.verbosity));
    if (!config_.source().empty()) std::cout << theme::kv("Config", config_.source().string());

    auto opened = SftpSession::open(options);
    if (opened.is_err()) {
        std::cout << theme::fail(opened.error);
        return 1;
    }
    session_ = std::move(opened.value);

    std::cout << theme::dim("    waiting for sftp to connect...") << "\n";
    auto connected = session_->connected();
    while (connected.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (!session_->output_open()) {
            std::cout << theme::fail("sftp exited before it connected.");
            close_session();
            return 1;
        }
    }
    std::cout << theme::ok("Connected to " + options.host);
    std::cout << theme::dim("    Type 'help' for commands, 'exit' to quit.") << "\n\n";

    std::string line;
    while (!done_) {
        std::string prompt = prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            close_session();  // EOF / Ctrl-D
            break;
        }

        line = raw;
        free(raw);

        if (StringUtils::trim(line).empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    session_.reset();
    return exit_code_;
}
