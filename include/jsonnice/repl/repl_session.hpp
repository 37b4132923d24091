#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>
#include "color.hpp"
#include "../debugger/engine.hpp"
#include "../parallel/queue.hpp"

namespace jsonnice::repl {

// =============================================================================
// Commands
// =============================================================================

namespace cmd {

struct list_breakpoints {};                 // b
struct set_breakpoint {                     // b file:line[:col]
    std::string file;
    int line = 0;
    int column = -1;
};
struct next {};                             // n, next
struct step {};                             // s
struct list {};                             // l
struct list_locations {};                   // lb, lbs
struct print {                              // p [name]
    std::string name = "self";
};
struct trace {};
struct last {};
struct vars {};
struct clear {                              // clear file
    std::string file;
};
struct resume {};                           // c
struct quit {};                             // q

} // namespace cmd

using command_t = std::variant<
    cmd::list_breakpoints,
    cmd::set_breakpoint,
    cmd::next,
    cmd::step,
    cmd::list,
    cmd::list_locations,
    cmd::print,
    cmd::trace,
    cmd::last,
    cmd::vars,
    cmd::clear,
    cmd::resume,
    cmd::quit
>;

struct parsed_command_t {
    std::optional<command_t> cmd;
    std::string error;
};

auto parse_command(std::string_view input) -> parsed_command_t;

// =============================================================================
// repl_state
// =============================================================================

enum class repl_state {
    awaiting_launch,
    stopped,
    running,
    terminated
};

inline auto to_string(repl_state s) -> const char* {
    switch (s) {
        case repl_state::awaiting_launch: return "awaiting_launch";
        case repl_state::stopped: return "stopped";
        case repl_state::running: return "running";
        case repl_state::terminated: return "terminated";
    }
    return "unknown";
}

// =============================================================================
// repl_session_t - interactive debugger on a terminal
//
// One command is read per prompt. A command that starts evaluation moving
// (c, n, s) puts the session in the running state, and no prompt is shown
// again until the engine reports the next stop or the end of evaluation.
// =============================================================================

struct program_source_t {
    std::string name;
    std::string text;
    std::vector<std::string> search_paths;
};

/// Reads one line given a prompt; nullopt at end of input.
using line_reader_t = std::function<std::optional<std::string>(const std::string& prompt)>;

class repl_session_t {
public:
    /// Without a reader, lines come from GNU readline.
    repl_session_t(debugger::engine_facade_t& engine,
                   program_source_t source,
                   std::ostream& out = std::cout,
                   line_reader_t reader = {});
    ~repl_session_t();

    repl_session_t(const repl_session_t&) = delete;
    repl_session_t& operator=(const repl_session_t&) = delete;

    void run();

    auto state() const -> repl_state { return state_; }
    auto state_history() const -> const std::vector<repl_state>& { return history_; }
    auto prompt() const -> std::string;

    /// Candidates for completing `word` given the whole input line so far.
    auto completions(std::string_view line, std::string_view word) -> std::vector<std::string>;

private:
    void setup_readline();
    auto read_line() -> std::optional<std::string>;
    void execute_line(const std::string& input);
    void execute(const command_t& command);
    void wait_for_event();
    void pump_events();
    void set_state(repl_state s);

    void handle(const cmd::list_breakpoints&);
    void handle(const cmd::set_breakpoint&);
    void handle(const cmd::next&);
    void handle(const cmd::step&);
    void handle(const cmd::list&);
    void handle(const cmd::list_locations&);
    void handle(const cmd::print&);
    void handle(const cmd::trace&);
    void handle(const cmd::last&);
    void handle(const cmd::vars&);
    void handle(const cmd::clear&);
    void handle(const cmd::resume&);
    void handle(const cmd::quit&);

    void print_event(const debugger::event::stop& e);
    void print_event(const debugger::event::exit& e);
    void print_context(const debugger::node_t& node);
    void print_file();
    auto lines_of(const std::string& file) const -> std::vector<std::string>;

    debugger::engine_facade_t& engine_;
    program_source_t source_;
    std::ostream& out_;
    line_reader_t reader_;
    color::scheme_t colors_;

    parallel::blocking_queue<debugger::debug_event_t> events_;
    std::thread pump_;

    repl_state state_ = repl_state::awaiting_launch;
    std::vector<repl_state> history_;
    debugger::node_ref_t current_;
    std::optional<std::string> last_evaluation_;
    bool had_error_ = false;
    bool quit_ = false;
};

} // namespace jsonnice::repl

// =============================================================================
// Include implementations for header-only mode
// =============================================================================

#ifndef JSONNICE_SEPARATE_COMPILATION
#include "repl_session.ipp"
#endif
