#pragma once

#include <string>
#include <filesystem>
#include <chrono>
#include <optional>

namespace platform {

// POSIX only (Linux and macOS).

// Returns $HOME, or temp_dir() when it is unset or empty.
std::filesystem::path home_dir();

// Returns the system temporary directory ($TMPDIR, else /tmp).
std::filesystem::path temp_dir();

// Modification time of `path` itself (symlinks are not followed).
// Returns nullopt if the path cannot be stat'ed.
std::optional<std::chrono::system_clock::time_point>
modification_time(const std::filesystem::path& path);

// Number of hardware threads, at least 1.
int hardware_threads();

// True when running with an effective uid of 0.
bool is_superuser();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
