#pragma once

#include <csignal>

namespace jsonnice::signal {

// =============================================================================
// Signal handling for Ctrl-C and termination requests
// =============================================================================

inline volatile std::sig_atomic_t interrupted = 0;

inline void handler(int) {
    interrupted = 1;
}

/// Installs the flag-setting handler for SIGINT and SIGTERM for its lifetime.
struct interrupt_guard_t {
    std::sig_atomic_t previous_state;
    void (*previous_int)(int);
    void (*previous_term)(int);

    interrupt_guard_t() {
        previous_state = interrupted;
        interrupted = 0;
        previous_int = std::signal(SIGINT, handler);
        previous_term = std::signal(SIGTERM, handler);
    }

    ~interrupt_guard_t() {
        std::signal(SIGINT, previous_int);
        std::signal(SIGTERM, previous_term);
        interrupted = previous_state;
    }

    interrupt_guard_t(const interrupt_guard_t&) = delete;
    interrupt_guard_t& operator=(const interrupt_guard_t&) = delete;

    auto is_interrupted() const -> bool { return interrupted != 0; }
};

} // namespace jsonnice::signal
