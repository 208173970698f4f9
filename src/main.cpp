#include <iostream>
#include <string>
#include "cli/sftpdrive_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>

void print_usage() {
    std::cout << theme::banner(SFTPDRIVE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sftpdrive"
              << theme::color::RESET << theme::color::DIM
              << "                  Connect using sftpdrive.yaml" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sftpdrive "
              << theme::color::RESET << "<host> [cwd]" << theme::color::DIM
              << "     Connect to an ssh alias" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sftpdrive --init"
              << theme::color::RESET << theme::color::DIM
              << "           Write ~/.sftpdrive/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    sftpdrive --version        Show version\n"
              << "    sftpdrive --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string first = argc >= 2 ? argv[1] : "";

        if (first == "--version") {
            std::cout << "sftpdrive version " << SFTPDRIVE_VERSION << "\n";
            return 0;
        } else if (first == "--help") {
            print_usage();
            return 0;
        } else if (first == "--init") {
            auto r = create_default_global_config();
            if (r.is_err()) {
                std::cout << theme::fail(r.error);
                return 1;
            }
            std::cout << theme::ok("Config at " + get_global_config_path().string());
            return 0;
        }

        // Command-line host/cwd override the config files, which become optional.
        Config config;
        auto loaded = Config::load();
        if (loaded.is_ok()) {
            config = loaded.value;
        } else if (first.empty()) {
            std::cout << theme::fail(loaded.error);
            std::cout << theme::hint("Run 'sftpdrive --init' or pass a host.");
            return 1;
        }
        if (!first.empty()) config.session().host = first;
        if (argc >= 3) config.session().cwd = argv[2];

        SftpDriveCLI cli(std::move(config));
        return cli.run();
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
