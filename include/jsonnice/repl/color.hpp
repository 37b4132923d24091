#pragma once

#include <iostream>
#include <unistd.h>

namespace jsonnice::repl::color {

// =============================================================================
// ANSI color support
// =============================================================================

namespace ansi {
    inline constexpr const char* reset      = "\033[0m";
    inline constexpr const char* bold       = "\033[1m";
    inline constexpr const char* underline  = "\033[4m";
    inline constexpr const char* red        = "\033[31m";
    inline constexpr const char* blue       = "\033[34m";
    inline constexpr const char* magenta    = "\033[35m";
    inline constexpr const char* gray       = "\033[90m";
} // namespace ansi

struct scheme_t {
    const char* reset       = ansi::reset;
    const char* header      = ansi::bold;
    const char* emphasis    = ansi::underline;
    const char* gutter      = ansi::gray;
    const char* highlight   = ansi::blue;
    const char* file        = ansi::blue;
    const char* value       = ansi::magenta;
    const char* error       = ansi::red;
};

inline auto enabled() -> scheme_t { return scheme_t{}; }
inline auto disabled() -> scheme_t {
    return scheme_t{"", "", "", "", "", "", "", ""};
}

inline auto is_tty(int fd) -> bool { return isatty(fd) != 0; }
inline auto is_tty(std::ostream& os) -> bool {
    if (&os == &std::cout) return is_tty(STDOUT_FILENO);
    if (&os == &std::cerr) return is_tty(STDERR_FILENO);
    return false;
}

inline auto for_stream(std::ostream& os) -> scheme_t {
    return is_tty(os) ? enabled() : disabled();
}

} // namespace jsonnice::repl::color
