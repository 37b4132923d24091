#pragma once

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include "../error.hpp"
#include "../parallel/queue.hpp"

namespace jsonnice::debugger {

// =============================================================================
// Locations and nodes
// =============================================================================

/// 1-based line and column range within a source file.
struct source_location_t {
    std::string file;
    int line = 0;
    int column = 0;
    int end_line = 0;
    int end_column = 0;

    auto to_string() const -> std::string {
        auto oss = std::ostringstream{};
        oss << file << ":" << line << ":" << column;
        return oss.str();
    }

    /// Begin position only ("line:column"), as shown in breakpoint listings.
    auto begin_string() const -> std::string {
        return std::to_string(line) + ":" + std::to_string(column);
    }
};

/// The node evaluation is suspended at. Opaque to the front ends except for
/// display; handed back to the engine by continue_until_after().
struct node_t {
    std::string kind;
    std::optional<source_location_t> loc;
};

using node_ref_t = std::shared_ptr<const node_t>;

struct breakpoint_target_t {
    source_location_t loc;
    std::string kind;

    auto to_string() const -> std::string {
        return loc.to_string() + " [" + kind + "]";
    }
};

struct stack_frame_t {
    std::string name;
    std::optional<source_location_t> loc;
};

// =============================================================================
// Events
// =============================================================================

enum class stop_reason {
    breakpoint,
    step,
    exception
};

inline auto to_string(stop_reason r) -> const char* {
    switch (r) {
        case stop_reason::breakpoint: return "breakpoint";
        case stop_reason::step: return "step";
        case stop_reason::exception: return "exception";
    }
    return "unknown";
}

namespace event {

struct stop {
    stop_reason reason;
    node_ref_t current;
    std::optional<std::string> last_evaluation;
    std::optional<std::string> error;
    std::string breakpoint;
};

struct exit {
    std::string output;
    std::optional<std::string> error;
};

} // namespace event

using debug_event_t = std::variant<event::stop, event::exit>;
using event_channel_t = parallel::blocking_queue<debug_event_t>;

// =============================================================================
// engine_facade_t - the evaluation engine as seen by the front ends
//
// Thread-safety contract: implementations must accept concurrent calls to
// every operation from any number of threads. Control operations (launch,
// resume, continue_until_after, step) schedule work and return without
// waiting for the next stop; the outcome arrives on events(). terminate()
// ends any running evaluation, emits a final exit event if one was running,
// and closes the event channel. Front ends never lock around these calls.
//
// Operations that can be rejected throw engine_error.
// =============================================================================

class engine_facade_t {
public:
    virtual ~engine_facade_t() = default;

    virtual void launch(const std::string& source_name,
                        const std::string& source_text,
                        const std::vector<std::string>& search_paths) = 0;
    virtual void resume() = 0;
    virtual void continue_until_after(const node_ref_t& node) = 0;
    virtual void step() = 0;

    /// column == -1 means any column on the line.
    virtual auto set_breakpoint(const std::string& file, int line, int column) -> breakpoint_target_t = 0;
    virtual void clear_breakpoints(const std::string& file) = 0;
    virtual auto active_breakpoints() -> std::vector<std::string> = 0;
    virtual auto breakpoint_locations(const std::string& file) -> std::vector<source_location_t> = 0;

    virtual auto lookup_value(const std::string& name) -> std::string = 0;
    virtual auto list_vars() -> std::vector<std::string> = 0;

    /// Frames ordered outermost first, innermost last.
    virtual auto stack_trace() -> std::vector<stack_frame_t> = 0;

    virtual void terminate() = 0;
    virtual auto events() -> event_channel_t& = 0;
};

} // namespace jsonnice::debugger
