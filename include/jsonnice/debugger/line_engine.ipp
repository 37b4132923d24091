// line_engine.ipp - implementation file for line_engine_t

#ifdef JSONNICE_SEPARATE_COMPILATION
#define JSONNICE_INLINE
#else
#define JSONNICE_INLINE inline
#endif

#include <filesystem>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace jsonnice::debugger {

// =============================================================================
// Source helpers
// =============================================================================

namespace detail {

JSONNICE_INLINE auto trim(const std::string& s) -> std::string {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

JSONNICE_INLINE auto starts_with_word(const std::string& s, const std::string& word) -> bool {
    if (!s.starts_with(word)) return false;
    return s.size() == word.size() || s[word.size()] == ' ' || s[word.size()] == '\t' || s[word.size()] == '(';
}

/// 1-based column of the first and one-past-last non-blank characters.
JSONNICE_INLINE auto text_span(const std::string& line) -> std::pair<int, int> {
    auto first = line.find_first_not_of(" \t");
    auto last = line.find_last_not_of(" \t\r");
    return {static_cast<int>(first) + 1, static_cast<int>(last) + 2};
}

} // namespace detail

JSONNICE_INLINE auto split_lines(const std::string& text) -> std::vector<std::string> {
    auto lines = std::vector<std::string>{};
    auto iss = std::istringstream{text};
    auto line = std::string{};
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

JSONNICE_INLINE auto read_source_lines(const std::string& file, const std::vector<std::string>& search_paths)
    -> std::optional<std::vector<std::string>>
{
    auto candidates = std::vector<std::filesystem::path>{file};
    for (const auto& dir : search_paths) {
        candidates.push_back(std::filesystem::path(dir) / file);
    }
    for (const auto& candidate : candidates) {
        auto in = std::ifstream{candidate};
        if (in) {
            auto oss = std::ostringstream{};
            oss << in.rdbuf();
            return split_lines(oss.str());
        }
    }
    return std::nullopt;
}

JSONNICE_INLINE auto file_identity(const std::string& file) -> std::string {
    if (file.empty() || file.front() == '<') {
        return file;
    }
    auto ec = std::error_code{};
    auto abs = std::filesystem::absolute(file, ec);
    if (ec) {
        return std::filesystem::path(file).lexically_normal().string();
    }
    return abs.lexically_normal().string();
}

JSONNICE_INLINE auto is_node_line(const std::string& line) -> bool {
    auto t = detail::trim(line);
    return !t.empty() && !t.starts_with("//") && !t.starts_with("#");
}

JSONNICE_INLINE auto node_kind(const std::string& line) -> std::string {
    auto t = detail::trim(line);
    if (detail::starts_with_word(t, "local")) return "local";
    if (detail::starts_with_word(t, "error")) return "error";
    return "expr";
}

// =============================================================================
// line_engine_t implementation
// =============================================================================

JSONNICE_INLINE line_engine_t::line_engine_t() = default;

JSONNICE_INLINE line_engine_t::~line_engine_t() {
    terminate();
}

JSONNICE_INLINE void line_engine_t::launch(const std::string& source_name,
                                           const std::string& source_text,
                                           const std::vector<std::string>& search_paths) {
    auto lifecycle = std::lock_guard<std::mutex>{lifecycle_mutex_};
    {
        auto lock = std::unique_lock<std::mutex>{mutex_};
        if (terminated_) {
            throw engine_error("engine has been terminated");
        }
        if (running_) {
            throw engine_error("evaluation already running");
        }

        auto program = program_t{};
        program.name = source_name;
        program.identity = file_identity(source_name);
        program.lines = split_lines(source_text);
        for (std::size_t i = 0; i < program.lines.size(); ++i) {
            if (is_node_line(program.lines[i])) {
                program.nodes.push_back(static_cast<int>(i) + 1);
            }
        }
        spdlog::debug("line engine: launching {} ({} nodes)", source_name, program.nodes.size());

        program_ = std::move(program);
        search_paths_ = search_paths;
        bindings_.clear();
        output_.clear();
        current_.reset();
        last_evaluation_.reset();
        mode_ = run_mode::run;
        running_ = true;
        suspended_ = false;
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread([this] { evaluate(); });
}

JSONNICE_INLINE void line_engine_t::resume() {
    resume_with(run_mode::run, 0);
}

JSONNICE_INLINE void line_engine_t::continue_until_after(const node_ref_t& node) {
    auto after_line = 0;
    if (node && node->loc) {
        after_line = node->loc->end_line;
    } else {
        auto lock = std::unique_lock<std::mutex>{mutex_};
        if (program_ && current_) {
            after_line = program_->nodes[*current_];
        }
    }
    resume_with(run_mode::until_after, after_line);
}

JSONNICE_INLINE void line_engine_t::step() {
    resume_with(run_mode::step, 0);
}

JSONNICE_INLINE void line_engine_t::resume_with(run_mode mode, int after_line) {
    {
        auto lock = std::unique_lock<std::mutex>{mutex_};
        require_suspended("resume");
        mode_ = mode;
        until_after_line_ = after_line;
        suspended_ = false;
    }
    cv_.notify_all();
}

JSONNICE_INLINE void line_engine_t::require_suspended(const char* operation) const {
    if (!running_) {
        throw engine_error(std::string("cannot ") + operation + ": no evaluation in progress");
    }
    if (!suspended_) {
        throw engine_error(std::string("cannot ") + operation + ": evaluation is not suspended");
    }
}

JSONNICE_INLINE auto line_engine_t::set_breakpoint(const std::string& file, int line, int column) -> breakpoint_target_t {
    auto lock = std::unique_lock<std::mutex>{mutex_};
    auto lines = lines_of(file);
    auto where = file + ":" + std::to_string(line);

    if (line < 1 || line > static_cast<int>(lines.size()) || !is_node_line(lines[line - 1])) {
        throw engine_error("no breakpoint target at " + where);
    }
    const auto& text = lines[line - 1];
    auto [first, last] = detail::text_span(text);

    auto resolved_column = column;
    if (column == -1) {
        resolved_column = first;
    } else if (column < first || column >= last) {
        throw engine_error("no breakpoint target at " + where + ":" + std::to_string(column));
    }

    auto& file_breakpoints = breakpoints_[file_identity(file)];
    auto key = breakpoint_key_t{line, resolved_column};
    auto it = file_breakpoints.find(key);
    if (it != file_breakpoints.end()) {
        return it->second;
    }

    auto target = breakpoint_target_t{
        source_location_t{file, line, resolved_column, line, last},
        node_kind(text)
    };
    file_breakpoints.emplace(key, target);
    return target;
}

JSONNICE_INLINE void line_engine_t::clear_breakpoints(const std::string& file) {
    auto lock = std::unique_lock<std::mutex>{mutex_};
    breakpoints_.erase(file_identity(file));
}

JSONNICE_INLINE auto line_engine_t::active_breakpoints() -> std::vector<std::string> {
    auto lock = std::unique_lock<std::mutex>{mutex_};
    auto result = std::vector<std::string>{};
    for (const auto& [identity, targets] : breakpoints_) {
        for (const auto& [key, target] : targets) {
            result.push_back(target.to_string());
        }
    }
    return result;
}

JSONNICE_INLINE auto line_engine_t::breakpoint_locations(const std::string& file) -> std::vector<source_location_t> {
    auto lock = std::unique_lock<std::mutex>{mutex_};
    auto lines = lines_of(file);
    auto result = std::vector<source_location_t>{};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!is_node_line(lines[i])) continue;
        auto [first, last] = detail::text_span(lines[i]);
        auto line = static_cast<int>(i) + 1;
        result.push_back(source_location_t{file, line, first, line, last});
    }
    return result;
}

JSONNICE_INLINE auto line_engine_t::lookup_value(const std::string& name) -> std::string {
    auto lock = std::unique_lock<std::mutex>{mutex_};
    if (!running_ || !current_) {
        throw engine_error("no evaluation in progress");
    }
    if (name == "self") {
        return detail::trim(program_->lines[program_->nodes[*current_] - 1]);
    }
    auto it = bindings_.find(name);
    if (it == bindings_.end()) {
        throw engine_error("Unknown variable: " + name);
    }
    return it->second;
}

JSONNICE_INLINE auto line_engine_t::list_vars() -> std::vector<std::string> {
    auto lock = std::unique_lock<std::mutex>{mutex_};
    auto result = std::vector<std::string>{};
    for (const auto& [name, value] : bindings_) {
        result.push_back(name);
    }
    return result;
}

JSONNICE_INLINE auto line_engine_t::stack_trace() -> std::vector<stack_frame_t> {
    auto lock = std::unique_lock<std::mutex>{mutex_};
    if (!running_ || !current_) {
        return {};
    }
    auto frames = std::vector<stack_frame_t>{};
    frames.push_back(stack_frame_t{program_->name, std::nullopt});
    frames.push_back(stack_frame_t{"$", node_at(*current_)->loc});
    return frames;
}

JSONNICE_INLINE void line_engine_t::terminate() {
    auto lifecycle = std::lock_guard<std::mutex>{lifecycle_mutex_};
    {
        auto lock = std::unique_lock<std::mutex>{mutex_};
        terminated_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    events_.close();
}

// =============================================================================
// Evaluation thread
// =============================================================================

JSONNICE_INLINE void line_engine_t::evaluate() {
    auto lock = std::unique_lock<std::mutex>{mutex_};
    auto error = std::optional<std::string>{};
    const auto& program = *program_;

    for (std::size_t i = 0; i < program.nodes.size() && !terminated_; ++i) {
        current_ = i;
        auto line = program.nodes[i];
        auto text = detail::trim(program.lines[line - 1]);

        if (auto reason = stop_reason_at(line)) {
            auto ev = event::stop{*reason, node_at(i), last_evaluation_, std::nullopt, {}};
            if (*reason == stop_reason::breakpoint) {
                ev.breakpoint = find_breakpoint(line)->to_string();
            }
            suspend(lock, std::move(ev));
            if (terminated_) break;
        }

        auto kind = node_kind(text);
        if (kind == "error") {
            auto message = detail::trim(text.substr(5));
            if (message.empty()) message = "error";
            error = message;
            suspend(lock, event::stop{stop_reason::exception, node_at(i), last_evaluation_, message, {}});
            break;
        }

        auto value = text;
        if (kind == "local") {
            auto body = detail::trim(text.substr(5));
            auto eq = body.find('=');
            if (eq != std::string::npos) {
                auto name = detail::trim(body.substr(0, eq));
                value = detail::trim(body.substr(eq + 1));
                while (!value.empty() && (value.back() == ';' || value.back() == ',')) {
                    value.pop_back();
                }
                value = detail::trim(value);
                bindings_[name] = value;
            }
        }
        last_evaluation_ = value;
        output_ += text + "\n";
    }

    running_ = false;
    suspended_ = false;
    current_.reset();
    spdlog::debug("line engine: evaluation of {} finished", program.name);
    events_.send(event::exit{output_, error});
}

JSONNICE_INLINE void line_engine_t::suspend(std::unique_lock<std::mutex>& lock, event::stop ev) {
    suspended_ = true;
    events_.send(std::move(ev));
    cv_.wait(lock, [this] { return !suspended_ || terminated_; });
}

JSONNICE_INLINE auto line_engine_t::stop_reason_at(int line) const -> std::optional<stop_reason> {
    if (find_breakpoint(line)) {
        return stop_reason::breakpoint;
    }
    switch (mode_) {
        case run_mode::step:
            return stop_reason::step;
        case run_mode::until_after:
            if (line > until_after_line_) return stop_reason::step;
            return std::nullopt;
        case run_mode::run:
            return std::nullopt;
    }
    return std::nullopt;
}

JSONNICE_INLINE auto line_engine_t::find_breakpoint(int line) const -> const breakpoint_target_t* {
    auto it = breakpoints_.find(program_->identity);
    if (it == breakpoints_.end()) {
        return nullptr;
    }
    for (const auto& [key, target] : it->second) {
        if (key.first == line) {
            return &target;
        }
    }
    return nullptr;
}

JSONNICE_INLINE auto line_engine_t::node_at(std::size_t index) const -> node_ref_t {
    auto line = program_->nodes[index];
    const auto& text = program_->lines[line - 1];
    auto [first, last] = detail::text_span(text);
    return std::make_shared<const node_t>(node_t{
        node_kind(text),
        source_location_t{program_->name, line, first, line, last}
    });
}

JSONNICE_INLINE auto line_engine_t::lines_of(const std::string& file) const -> std::vector<std::string> {
    if (program_ && program_->identity == file_identity(file)) {
        return program_->lines;
    }
    if (auto lines = read_source_lines(file, search_paths_)) {
        return std::move(*lines);
    }
    throw engine_error("cannot open " + file);
}

} // namespace jsonnice::debugger

#undef JSONNICE_INLINE
