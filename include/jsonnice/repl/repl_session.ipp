// repl_session.ipp - implementation file for repl_session_t

#ifdef JSONNICE_SEPARATE_COMPILATION
#define JSONNICE_INLINE
#else
#define JSONNICE_INLINE inline
#endif

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <readline/history.h>
#include <readline/readline.h>
#include <spdlog/spdlog.h>
#include "../debugger/line_engine.hpp"

namespace jsonnice::repl {

// =============================================================================
// Command parsing
// =============================================================================

namespace detail {

JSONNICE_INLINE auto split(const std::string& s, char sep) -> std::vector<std::string> {
    auto parts = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (true) {
        auto end = s.find(sep, start);
        parts.push_back(s.substr(start, end - start));
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return parts;
}

JSONNICE_INLINE auto parse_int(const std::string& s) -> std::optional<int> {
    auto value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || end != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace detail

JSONNICE_INLINE auto parse_command(std::string_view input) -> parsed_command_t {
    auto iss = std::istringstream{std::string{input}};
    auto first = std::string{};
    iss >> first;

    if (first.empty()) {
        return {{}, "empty command"};
    }

    if (first == "b" || first == "break") {
        auto where = std::string{};
        if (!(iss >> where)) {
            return {cmd::list_breakpoints{}, {}};
        }
        auto parts = detail::split(where, ':');
        if (parts.size() < 2) {
            return {{}, "Must specify file and line separated by `:`"};
        }
        auto line = detail::parse_int(parts[1]);
        if (!line) {
            return {{}, "Invalid line number: " + parts[1]};
        }
        auto column = -1;
        if (parts.size() >= 3) {
            auto c = detail::parse_int(parts[2]);
            if (!c) {
                return {{}, "Invalid column number: " + parts[2]};
            }
            column = *c;
        }
        return {cmd::set_breakpoint{parts[0], *line, column}, {}};
    }

    if (first == "n" || first == "next") return {cmd::next{}, {}};
    if (first == "s") return {cmd::step{}, {}};
    if (first == "l") return {cmd::list{}, {}};
    if (first == "lb" || first == "lbs") return {cmd::list_locations{}, {}};

    if (first == "p") {
        auto name = std::string{};
        if (!(iss >> name)) {
            return {cmd::print{}, {}};
        }
        return {cmd::print{name}, {}};
    }

    if (first == "trace") return {cmd::trace{}, {}};
    if (first == "last") return {cmd::last{}, {}};
    if (first == "vars") return {cmd::vars{}, {}};

    if (first == "clear") {
        auto file = std::string{};
        if (!(iss >> file)) {
            return {{}, "clear requires a file name"};
        }
        return {cmd::clear{file}, {}};
    }

    if (first == "c") return {cmd::resume{}, {}};
    if (first == "q") return {cmd::quit{}, {}};

    return {{}, "Unknown command: " + std::string{input}};
}

// =============================================================================
// Readline completion
// =============================================================================

namespace detail {

inline repl_session_t* completing_session = nullptr;

JSONNICE_INLINE auto completion_generator(const char* text, int state) -> char* {
    static std::vector<std::string> matches;
    static std::size_t index = 0;

    if (state == 0) {
        matches = completing_session->completions(rl_line_buffer, text);
        index = 0;
    }
    if (index < matches.size()) {
        return strdup(matches[index++].c_str());
    }
    return nullptr;
}

JSONNICE_INLINE auto attempted_completion(const char* text, int, int) -> char** {
    rl_attempted_completion_over = 1;
    if (!completing_session) {
        return nullptr;
    }
    return rl_completion_matches(text, completion_generator);
}

} // namespace detail

// =============================================================================
// repl_session_t implementation
// =============================================================================

JSONNICE_INLINE repl_session_t::repl_session_t(debugger::engine_facade_t& engine,
                                               program_source_t source,
                                               std::ostream& out,
                                               line_reader_t reader)
    : engine_(engine)
    , source_(std::move(source))
    , out_(out)
    , reader_(std::move(reader))
    , colors_(color::for_stream(out))
{
    if (!reader_) {
        setup_readline();
    }
}

JSONNICE_INLINE repl_session_t::~repl_session_t() {
    if (detail::completing_session == this) {
        detail::completing_session = nullptr;
        rl_attempted_completion_function = nullptr;
    }
    if (pump_.joinable()) {
        engine_.terminate();
        pump_.join();
    }
}

JSONNICE_INLINE void repl_session_t::setup_readline() {
    detail::completing_session = this;
    rl_attempted_completion_function = detail::attempted_completion;
}

JSONNICE_INLINE void repl_session_t::run() {
    pump_ = std::thread([this] { pump_events(); });
    history_.assign(1, state_);

    while (state_ != repl_state::terminated) {
        if (state_ == repl_state::running) {
            wait_for_event();
            continue;
        }
        auto input = read_line();
        if (!input) {
            out_ << "\n";
            execute(cmd::quit{});
            continue;
        }
        execute_line(*input);
    }

    if (!quit_) {
        engine_.terminate();
    }
    pump_.join();
}

JSONNICE_INLINE auto repl_session_t::prompt() const -> std::string {
    if (current_ && current_->loc) {
        return current_->loc->to_string() + " [" + current_->kind + "]> ";
    }
    return "> ";
}

JSONNICE_INLINE auto repl_session_t::read_line() -> std::optional<std::string> {
    if (had_error_) {
        out_ << colors_.error << "! " << colors_.reset;
    }
    out_.flush();

    auto p = prompt();
    if (reader_) {
        return reader_(p);
    }

    auto* line = readline(p.c_str());
    if (!line) {
        return std::nullopt;
    }
    auto input = std::string{line};
    std::free(line);
    if (!input.empty()) {
        add_history(input.c_str());
    }
    return input;
}

JSONNICE_INLINE auto repl_session_t::completions(std::string_view line, std::string_view word) -> std::vector<std::string> {
    auto iss = std::istringstream{std::string{line}};
    auto first = std::string{};
    iss >> first;
    if ((first != "b" && first != "break") || line.find(' ') == std::string_view::npos) {
        return {};
    }

    auto result = std::vector<std::string>{};
    try {
        for (const auto& loc : engine_.breakpoint_locations(source_.name)) {
            auto candidate = loc.file + ":" + loc.begin_string();
            if (candidate.starts_with(word)) {
                result.push_back(candidate);
            }
        }
    } catch (const engine_error& e) {
        spdlog::warn("unable to autocomplete breakpoints: {}", e.what());
    }
    return result;
}

JSONNICE_INLINE void repl_session_t::execute_line(const std::string& input) {
    auto parsed = parse_command(input);
    if (!parsed.cmd) {
        if (input.find_first_not_of(" \t") != std::string::npos) {
            out_ << parsed.error << "\n";
        }
        return;
    }
    try {
        execute(*parsed.cmd);
    } catch (const engine_error& e) {
        out_ << colors_.error << e.what() << colors_.reset << "\n";
    }
}

JSONNICE_INLINE void repl_session_t::execute(const command_t& command) {
    std::visit([this](const auto& c) { handle(c); }, command);
}

JSONNICE_INLINE void repl_session_t::set_state(repl_state s) {
    spdlog::debug("repl: {} -> {}", to_string(state_), to_string(s));
    state_ = s;
    history_.push_back(s);
}

// =============================================================================
// Events
// =============================================================================

JSONNICE_INLINE void repl_session_t::pump_events() {
    while (auto ev = engine_.events().recv()) {
        events_.send(std::move(*ev));
    }
    events_.close();
}

JSONNICE_INLINE void repl_session_t::wait_for_event() {
    auto ev = events_.recv();
    if (!ev) {
        set_state(repl_state::terminated);
        return;
    }
    std::visit([this](const auto& e) { print_event(e); }, *ev);
}

JSONNICE_INLINE void repl_session_t::print_event(const debugger::event::stop& e) {
    spdlog::debug("received stop event: {}", debugger::to_string(e.reason));
    current_ = e.current;
    last_evaluation_ = e.last_evaluation;
    had_error_ = e.error.has_value();

    switch (e.reason) {
        case debugger::stop_reason::breakpoint:
            out_ << colors_.header << "Hit breakpoint: " << colors_.reset
                 << colors_.emphasis << e.breakpoint << colors_.reset << "\n";
            break;
        case debugger::stop_reason::exception:
            out_ << colors_.error << "Encountered error during evaluation" << colors_.reset
                 << ": " << e.error.value_or("") << "\n";
            break;
        case debugger::stop_reason::step:
            break;
    }
    if (current_) {
        print_context(*current_);
    }
    set_state(repl_state::stopped);
}

JSONNICE_INLINE void repl_session_t::print_event(const debugger::event::exit& e) {
    spdlog::debug("received exit event");
    if (!e.output.empty()) {
        out_ << e.output;
        if (e.output.back() != '\n') {
            out_ << "\n";
        }
    }
    if (e.error) {
        out_ << "Error during evaluation: " << *e.error << "\n";
    }
    current_.reset();
    set_state(repl_state::terminated);
}

// =============================================================================
// Source display
// =============================================================================

JSONNICE_INLINE auto repl_session_t::lines_of(const std::string& file) const -> std::vector<std::string> {
    if (debugger::file_identity(file) == debugger::file_identity(source_.name)) {
        return debugger::split_lines(source_.text);
    }
    if (auto lines = debugger::read_source_lines(file, source_.search_paths)) {
        return std::move(*lines);
    }
    spdlog::warn("cannot read {} for display", file);
    return {};
}

JSONNICE_INLINE void repl_session_t::print_context(const debugger::node_t& node) {
    constexpr int context_lines = 3;
    if (!node.loc) {
        return;
    }
    const auto& loc = *node.loc;
    auto end_line = std::max(loc.end_line, loc.line);
    auto lines = lines_of(loc.file);
    auto count = static_cast<int>(lines.size());

    auto line_at = [&](int n) -> const std::string& {
        static const auto empty = std::string{};
        return n >= 1 && n <= count ? lines[n - 1] : empty;
    };
    auto gutter = [&](int n) {
        out_ << colors_.gutter << std::setw(2) << n << "| " << colors_.reset;
    };
    auto clamp = [](int column, const std::string& text) {
        return static_cast<std::size_t>(std::clamp(column - 1, 0, static_cast<int>(text.size())));
    };

    for (auto i = loc.line - context_lines; i < loc.line; ++i) {
        if (i < 1) continue;
        gutter(i);
        out_ << line_at(i) << "\n";
    }

    const auto& first = line_at(loc.line);
    auto begin = clamp(loc.column, first);
    gutter(loc.line);
    out_ << first.substr(0, begin);

    if (loc.line == end_line) {
        auto end = std::max(begin, clamp(loc.end_column, first));
        out_ << colors_.highlight << first.substr(begin, end - begin) << colors_.reset
             << first.substr(end) << "\n";
    } else {
        out_ << colors_.highlight << first.substr(begin) << colors_.reset << "\n";
        for (auto i = loc.line + 1; i < end_line; ++i) {
            gutter(i);
            out_ << colors_.highlight << line_at(i) << colors_.reset << "\n";
        }
        const auto& final_line = line_at(end_line);
        auto end = clamp(loc.end_column, final_line);
        gutter(end_line);
        out_ << colors_.highlight << final_line.substr(0, end) << colors_.reset
             << final_line.substr(end) << "\n";
    }

    for (auto i = end_line + 1; i <= end_line + context_lines && i <= count; ++i) {
        gutter(i);
        out_ << line_at(i) << "\n";
    }
}

JSONNICE_INLINE void repl_session_t::print_file() {
    out_ << "File: " << colors_.file << source_.name << colors_.reset << "\n";
    auto lines = debugger::split_lines(source_.text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        out_ << colors_.gutter << std::setw(2) << i + 1 << "| " << colors_.reset << lines[i] << "\n";
    }
}

// =============================================================================
// Command handlers
// =============================================================================

JSONNICE_INLINE void repl_session_t::handle(const cmd::list_breakpoints&) {
    for (const auto& b : engine_.active_breakpoints()) {
        out_ << "- " << b << "\n";
    }
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::set_breakpoint& c) {
    auto target = engine_.set_breakpoint(c.file, c.line, c.column);
    out_ << "Adding breakpoint at " << target.to_string() << "\n";
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::next&) {
    if (state_ == repl_state::awaiting_launch) {
        out_ << "Evaluation has not started; use 'c' to launch it\n";
        return;
    }
    engine_.continue_until_after(current_);
    set_state(repl_state::running);
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::step&) {
    if (state_ == repl_state::awaiting_launch) {
        out_ << "Evaluation has not started; use 'c' to launch it\n";
        return;
    }
    engine_.step();
    set_state(repl_state::running);
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::list&) {
    if (current_ && current_->loc) {
        print_context(*current_);
    } else {
        print_file();
    }
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::list_locations&) {
    try {
        for (const auto& loc : engine_.breakpoint_locations(source_.name)) {
            out_ << "- " << loc.file << ":" << loc.begin_string() << "\n";
        }
    } catch (const engine_error& e) {
        spdlog::warn("unable to list breakpoint locations: {}", e.what());
    }
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::print& c) {
    out_ << engine_.lookup_value(c.name) << "\n";
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::trace&) {
    auto frames = engine_.stack_trace();
    std::reverse(frames.begin(), frames.end());
    for (const auto& frame : frames) {
        out_ << "- " << frame.name;
        if (frame.loc) {
            out_ << "\t\t\t" << colors_.gutter << frame.loc->to_string() << colors_.reset;
        }
        out_ << "\n";
    }
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::last&) {
    if (last_evaluation_) {
        out_ << "Last evaluation: " << colors_.value << *last_evaluation_ << colors_.reset << "\n";
    }
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::vars&) {
    out_ << "Variables:\n";
    for (const auto& v : engine_.list_vars()) {
        out_ << "- " << v << "\n";
    }
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::clear& c) {
    engine_.clear_breakpoints(c.file);
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::resume&) {
    if (state_ == repl_state::awaiting_launch) {
        engine_.launch(source_.name, source_.text, source_.search_paths);
    } else {
        engine_.resume();
    }
    set_state(repl_state::running);
}

JSONNICE_INLINE void repl_session_t::handle(const cmd::quit&) {
    quit_ = true;
    engine_.terminate();
    set_state(repl_state::terminated);
}

} // namespace jsonnice::repl

#undef JSONNICE_INLINE
