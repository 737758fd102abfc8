#pragma once

#include <atomic>
#include <cstdint>
#include <core/types.hpp>
#include <scan/warning_sink.hpp>

// Apparent size of everything below `path`: the sum of regular file lengths.
// Symlinks are not followed and directories add nothing themselves.
// Unreadable entries are reported to `warnings` and skipped, so a partial
// failure still yields the total of what could be read. Fails only when
// `path` itself cannot be stat'ed. A regular file yields its own length.
Result<uint64_t> size_of(const fs::path& path, WarningSink& warnings,
                         const std::atomic<bool>* cancel = nullptr);
