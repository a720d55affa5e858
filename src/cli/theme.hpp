#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences; cleared when output is not a terminal.
namespace color {
    inline std::string BLUE      = "\033[38;2;62;120;178m";
    inline std::string BROWN     = "\033[38;2;128;99;58m";
    inline std::string RED       = "\033[91m";
    inline std::string GREEN     = "\033[92m";
    inline std::string YELLOW    = "\033[93m";
    inline std::string BOLD      = "\033[1m";
    inline std::string DIM       = "\033[2m";
    inline std::string RESET     = "\033[0m";
}

// Plain output for pipes and log capture
inline void disable_colors() {
    color::BLUE = color::BROWN = color::RED = color::GREEN = "";
    color::YELLOW = color::BOLD = color::DIM = color::RESET = "";
}

// Shorthand wrappers
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Section header, padded by blank lines
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<14}", key) + color::RESET + value + "\n";
}

} // namespace theme
