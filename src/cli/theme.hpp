#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// Terminal palette (ANSI escape sequences)
namespace color {
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string SAND      = "\033[38;2;233;196;106m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string title() {
    return color::TEAL + color::BOLD + "  " + PROJECT_NAME + color::RESET
         + color::DIM + "  v" + PODTUN_VERSION + color::RESET + "\n";
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& name) {
    return "\n" + color::SAND + color::BOLD + "  " + name + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::SAND + "    > " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Command row for help output
inline std::string usage_row(const std::string& usage, const std::string& help) {
    return color::TEAL + fmt::format("    {:<28}", usage) + color::RESET
         + color::DIM + help + color::RESET + "\n";
}

} // namespace theme
