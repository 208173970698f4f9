#pragma once

#include <cstddef>
#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// Readline needs non-printing sequences wrapped in \001 ... \002 to measure
// the prompt width.
inline std::string rl_invisible(const std::string& code) {
    return "\001" + code + "\002";
}

// "label@host> " for the REPL.
inline std::string prompt(const std::string& label, const std::string& host) {
    return rl_invisible(color::TEAL) + label + rl_invisible(color::RESET) + "@"
         + rl_invisible(color::BLUE) + host + rl_invisible(color::RESET) + "> ";
}

// ── Layout ──────────────────────────────────────────────

inline std::string banner(const std::string& version) {
    return "\n" + color::TEAL + color::BOLD + "  sftpdrive\n"
         + color::RESET + color::DIM + "  v" + version + "  sftp, one future at a time\n"
         + color::RESET + "\n";
}

inline std::string section(const std::string& title) {
    return "\n" + color::TEAL + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status ──────────────────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string hint(const std::string& msg) {
    return color::TEAL + "    > " + color::RESET + msg + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

// ── Transfers ───────────────────────────────────────────

// "    + a.txt -> /srv/a.txt"
inline std::string transfer(const std::string& from, const std::string& arrow,
                            const std::string& to) {
    return color::GREEN + "    + " + color::RESET + from
         + color::DIM + " " + arrow + " " + color::RESET + to + "\n";
}

// "    [2/5] b.txt" for batch uploads.
inline std::string progress(std::size_t done, std::size_t total, const std::string& file) {
    return color::GREEN + fmt::format("    [{}/{}] ", done, total) + color::RESET + file + "\n";
}

} // namespace theme
