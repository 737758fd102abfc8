#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string CYAN      = "\033[96m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Styling switch. Off when stdout is not a terminal, NO_COLOR is set or
// --no-color was given.
inline bool& colors_enabled() {
    static bool enabled = true;
    return enabled;
}

inline void set_colors(bool on) { colors_enabled() = on; }

inline std::string paint(const std::string& code, const std::string& s) {
    return colors_enabled() ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string blue(const std::string& s)    { return paint(color::BLUE, s); }
inline std::string brown(const std::string& s)   { return paint(color::BROWN, s); }
inline std::string bold(const std::string& s)    { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)     { return paint(color::DIM, s); }
inline std::string green(const std::string& s)   { return paint(color::GREEN, s); }
inline std::string yellow(const std::string& s)  { return paint(color::YELLOW, s); }
inline std::string cyan(const std::string& s)    { return paint(color::CYAN, s); }

// ── Layout ──────────────────────────────────────────────

// Just the horizontal line (callers control gaps)
inline std::string rule(int width = 44) {
    std::string line;
    for (int i = 0; i < width; ++i) line += "\xe2\x94\x80";
    return "  " + dim(line) + "\n";
}

// Title line shown above the report
inline std::string banner() {
    return "\n" + paint(color::BLUE + color::BOLD, "  devstrip")
        + dim(fmt::format("  v{}", DEVSTRIP_VERSION)) + "\n"
        + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + paint(color::BROWN + color::BOLD, "  " + title) + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return paint(color::GREEN, "    + ") + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "    x ") + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return paint(color::YELLOW, "    ! ") + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return paint(color::BLUE, "    ~ ") + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return paint(color::BROWN, "    > ") + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return paint("\033[38;2;80;80;80m", "    \xc2\xb7 " + msg) + "\n";
}

// Key-value row for summary panels
inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<12}", key)) + value + "\n";
}

} // namespace theme
