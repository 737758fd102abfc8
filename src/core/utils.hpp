#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Expand "~" and "~/..." against `home`. Other paths are returned unchanged.
fs::path expand_user_path(const std::string& raw, const fs::path& home);

// Resolve symlinks and normalize. Falls back to an absolute, lexically
// normalized path when the target does not exist.
fs::path canonical_or_self(const fs::path& path);

// True if `path` equals `base` or lies below it (component-wise, so
// "/a/foobar" is not within "/a/foo").
bool is_within(const fs::path& path, const fs::path& base);

// True if `path` lies strictly below `base`.
bool is_strict_descendant(const fs::path& path, const fs::path& base);

// True if `path` is equal to or below any of `excludes`.
bool is_excluded(const fs::path& path, const std::vector<fs::path>& excludes);

// Parse a non-negative integer option. Rejects junk, negatives and values
// above `max`; `name` is used in the error message.
Result<long long> parse_non_negative(const std::string& text, const std::string& name,
                                     long long max);
