#pragma once

#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "engine.hpp"

namespace jsonnice::debugger {

// =============================================================================
// line_engine_t - reference engine that steps a source file line by line
//
// Every non-blank line that is not a comment is one node. Nodes are visited
// in order on a dedicated evaluation thread. "local NAME = EXPR" lines bind
// NAME to the text EXPR, an "error TEXT" line raises an exception stop, and
// the exit output is the text of every evaluated node.
// =============================================================================

class line_engine_t : public engine_facade_t {
public:
    line_engine_t();
    ~line_engine_t() override;

    // Non-copyable, non-movable (owns the evaluation thread)
    line_engine_t(const line_engine_t&) = delete;
    line_engine_t& operator=(const line_engine_t&) = delete;
    line_engine_t(line_engine_t&&) = delete;
    line_engine_t& operator=(line_engine_t&&) = delete;

    void launch(const std::string& source_name,
                const std::string& source_text,
                const std::vector<std::string>& search_paths) override;
    void resume() override;
    void continue_until_after(const node_ref_t& node) override;
    void step() override;

    auto set_breakpoint(const std::string& file, int line, int column) -> breakpoint_target_t override;
    void clear_breakpoints(const std::string& file) override;
    auto active_breakpoints() -> std::vector<std::string> override;
    auto breakpoint_locations(const std::string& file) -> std::vector<source_location_t> override;

    auto lookup_value(const std::string& name) -> std::string override;
    auto list_vars() -> std::vector<std::string> override;
    auto stack_trace() -> std::vector<stack_frame_t> override;

    void terminate() override;
    auto events() -> event_channel_t& override { return events_; }

private:
    enum class run_mode { run, step, until_after };

    struct program_t {
        std::string name;
        std::string identity;
        std::vector<std::string> lines;
        std::vector<int> nodes; // 1-based line numbers
    };

    using breakpoint_key_t = std::pair<int, int>;

    void evaluate();
    auto stop_reason_at(int line) const -> std::optional<stop_reason>;
    void suspend(std::unique_lock<std::mutex>& lock, event::stop ev);
    void require_suspended(const char* operation) const;
    void resume_with(run_mode mode, int after_line);
    auto node_at(std::size_t index) const -> node_ref_t;
    auto lines_of(const std::string& file) const -> std::vector<std::string>;
    auto find_breakpoint(int line) const -> const breakpoint_target_t*;

    std::mutex lifecycle_mutex_; // guards worker_
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    event_channel_t events_;
    std::thread worker_;

    std::optional<program_t> program_;
    std::vector<std::string> search_paths_;
    std::map<std::string, std::map<breakpoint_key_t, breakpoint_target_t>> breakpoints_;
    std::map<std::string, std::string> bindings_;
    std::string output_;
    std::optional<std::size_t> current_;
    std::optional<std::string> last_evaluation_;
    run_mode mode_ = run_mode::run;
    int until_after_line_ = 0;
    bool running_ = false;
    bool suspended_ = false;
    bool terminated_ = false;
};

// =============================================================================
// Source helpers (shared with the REPL's context display)
// =============================================================================

auto split_lines(const std::string& text) -> std::vector<std::string>;
auto file_identity(const std::string& file) -> std::string;

/// Lines of `file`, tried as given and then under each search path in order.
auto read_source_lines(const std::string& file, const std::vector<std::string>& search_paths)
    -> std::optional<std::vector<std::string>>;

auto is_node_line(const std::string& line) -> bool;
auto node_kind(const std::string& line) -> std::string;

} // namespace jsonnice::debugger

// =============================================================================
// Include implementations for header-only mode
// =============================================================================

#ifndef JSONNICE_SEPARATE_COMPILATION
#include "line_engine.ipp"
#endif
