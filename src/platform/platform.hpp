#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Writes to a pipe whose reader is gone must fail with EPIPE instead of
// killing the process. Idempotent.
void ignore_sigpipe();

} // namespace platform
