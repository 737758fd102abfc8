#include "utils.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstdlib>

fs::path expand_user_path(const std::string& raw, const fs::path& home) {
    if (raw == "~") {
        return home;
    }
    if (StringUtils::starts_with(raw, "~/")) {
        return home / raw.substr(2);
    }
    return fs::path(raw);
}

fs::path canonical_or_self(const fs::path& path) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (!ec) return resolved;

    fs::path absolute = fs::absolute(path, ec);
    if (ec) return path.lexically_normal();
    return absolute.lexically_normal();
}

bool is_within(const fs::path& path, const fs::path& base) {
    auto p = path.begin();
    for (auto b = base.begin(); b != base.end(); ++b) {
        // A trailing separator shows up as an empty final component
        if (b->empty()) continue;
        if (p == path.end() || *p != *b) return false;
        ++p;
    }
    return true;
}

static size_t component_count(const fs::path& path) {
    size_t n = 0;
    for (const auto& part : path) {
        if (!part.empty()) ++n;
    }
    return n;
}

bool is_strict_descendant(const fs::path& path, const fs::path& base) {
    return is_within(path, base) && component_count(path) > component_count(base);
}

bool is_excluded(const fs::path& path, const std::vector<fs::path>& excludes) {
    for (const auto& ex : excludes) {
        if (is_within(path, ex)) return true;
    }
    return false;
}

Result<long long> parse_non_negative(const std::string& text, const std::string& name,
                                     long long max) {
    std::string s = StringUtils::trim(text);
    if (s.empty()) {
        return Result<long long>::Err(fmt::format("{} expects a number", name));
    }
    if (s[0] == '-') {
        return Result<long long>::Err(fmt::format("{} must not be negative: {}", name, s));
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0') {
        return Result<long long>::Err(fmt::format("{} expects a number, got '{}'", name, s));
    }
    if (errno == ERANGE || value > max) {
        return Result<long long>::Err(fmt::format("{} is too large: {} (max {})", name, s, max));
    }
    return Result<long long>::Ok(value);
}
