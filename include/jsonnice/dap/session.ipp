// session.ipp - implementation file for session_t

#ifdef JSONNICE_SEPARATE_COMPILATION
#define JSONNICE_INLINE
#else
#define JSONNICE_INLINE inline
#endif

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace jsonnice::dap {

// =============================================================================
// Lifecycle
// =============================================================================

JSONNICE_INLINE session_t::session_t(transport_t& transport,
                                     std::unique_ptr<debugger::engine_facade_t> engine,
                                     std::size_t handler_threads)
    : transport_(transport)
    , engine_(std::move(engine))
    , writer_(transport)
    , pool_(std::max<std::size_t>(handler_threads, 1))
    , handlers_(pool_)
{
}

JSONNICE_INLINE session_t::~session_t() {
    shutdown();
}

JSONNICE_INLINE void session_t::run() {
    event_thread_ = std::thread([this] { dispatch_events(); });
    read_loop();
    shutdown();
}

JSONNICE_INLINE void session_t::read_loop() {
    while (!stopping()) {
        auto request = request_t{};
        try {
            auto frame = transport_.read_message();
            if (!frame) {
                spdlog::debug("no more data to read from {}", transport_.describe());
                return;
            }
            spdlog::debug("received request: {}", *frame);
            request = decode_request(*frame);
        } catch (const protocol_error& e) {
            spdlog::error("protocol violation on {}: {}; closing session", transport_.describe(), e.what());
            return;
        } catch (const transport_error& e) {
            spdlog::debug("connection {} ended: {}", transport_.describe(), e.what());
            return;
        }

        handlers_.spawn([this, request = std::move(request)] { dispatch(request); });
    }
}

JSONNICE_INLINE void session_t::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    stop();
    try {
        handlers_.wait();
    } catch (const std::exception& e) {
        spdlog::error("request handler failed: {}", e.what());
    }
    engine_->terminate();
    if (event_thread_.joinable()) {
        event_thread_.join();
    }
    writer_.close();
    transport_.close();
    spdlog::debug("session on {} closed", transport_.describe());
}

JSONNICE_INLINE void session_t::send(json message) {
    writer_.enqueue(std::move(message));
}

JSONNICE_INLINE auto session_t::current() const -> debugger::node_ref_t {
    auto lock = std::lock_guard<std::mutex>{current_mutex_};
    return current_;
}

JSONNICE_INLINE void session_t::set_current(debugger::node_ref_t node) {
    auto lock = std::lock_guard<std::mutex>{current_mutex_};
    current_ = std::move(node);
}

// =============================================================================
// Event multiplexer
// =============================================================================

// Runs until the engine closes its event channel on terminate(). An exit
// event ends only the current run; a later launch reports through here too.
JSONNICE_INLINE void session_t::dispatch_events() {
    while (auto ev = engine_->events().recv()) {
        std::visit([this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, debugger::event::stop>) {
                set_current(e.current);
                auto text = std::string{};
                if (e.reason == debugger::stop_reason::exception && e.error) {
                    text = *e.error;
                }
                send(stopped_event(debugger::to_string(e.reason), text));
            } else {
                set_current(nullptr);
                if (!e.output.empty()) {
                    send(output_event(e.output));
                }
                if (e.error) {
                    send(output_event("Error during evaluation: " + *e.error + "\n", "stderr"));
                }
                send(terminated_event());
            }
        }, *ev);
    }
}

// =============================================================================
// Request dispatcher
// =============================================================================

JSONNICE_INLINE void session_t::dispatch(const request_t& request) {
    try {
        std::visit([this, &request](const auto& args) { handle(request, args); }, request.body);
    } catch (const std::exception& e) {
        spdlog::debug("{} request {} failed: {}", request.command, request.seq, e.what());
        send(failed_response(request.seq, request.command, e.what()));
    }
}

// =============================================================================
// Request handlers
// =============================================================================

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::initialize& args) {
    spdlog::debug("initialize from client={} adapter={}", args.client_id, args.adapter_id);
    // Configuration requests are accepted at any time, so the client may be
    // told immediately.
    send(initialized_event());
    send(make_response(r.seq, r.command, capabilities()));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::launch& args) {
    auto program = std::string{};
    auto jpaths = std::vector<std::string>{};
    try {
        program = args.arguments.at("program").get<std::string>();
        if (args.arguments.contains("jpaths")) {
            jpaths = args.arguments.at("jpaths").get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        spdlog::debug("invalid launch arguments {}: {}", args.arguments.dump(), e.what());
        send(failed_response(r.seq, r.command, "Invalid launch arguments"));
        return;
    }

    auto in = std::ifstream{program, std::ios::binary};
    if (!in || std::filesystem::is_directory(program)) {
        auto reason = in ? std::make_error_code(std::errc::is_a_directory).message()
                         : std::error_code{errno, std::generic_category()}.message();
        send(failed_response(r.seq, r.command, "Failed to open file: " + program + ": " + reason));
        return;
    }
    auto source = std::ostringstream{};
    source << in.rdbuf();

    if (stopping()) {
        send(cancelled_response(r.seq, r.command));
        return;
    }
    engine_->launch(program, source.str(), jpaths);
    spdlog::debug("starting debugging {} with breakpoints [{}]", program,
                  fmt::join(engine_->active_breakpoints(), ", "));
    send(make_response(r.seq, r.command));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::disconnect&) {
    send(make_response(r.seq, r.command));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::set_breakpoints& args) {
    auto breakpoints = json::array();
    engine_->clear_breakpoints(args.path);
    for (const auto& b : args.breakpoints) {
        try {
            auto target = engine_->set_breakpoint(args.path, b.line, b.column.value_or(-1));
            breakpoints.push_back(json{
                {"verified", true},
                {"line", target.loc.line},
                {"column", target.loc.column},
                {"source", json{{"path", args.path}}},
            });
        } catch (const engine_error& e) {
            spdlog::error("failed to set breakpoint at {}:{}: {}", args.path, b.line, e.what());
            breakpoints.push_back(json{
                {"verified", false},
                {"line", b.line},
                {"message", e.what()},
            });
        }
    }
    send(make_response(r.seq, r.command, json{{"breakpoints", breakpoints}}));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::set_exception_breakpoints&) {
    send(make_response(r.seq, r.command));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::resume&) {
    if (stopping()) {
        send(cancelled_response(r.seq, r.command));
        return;
    }
    engine_->resume();
    send(make_response(r.seq, r.command, json{{"allThreadsContinued", true}}));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::next&) {
    if (stopping()) {
        send(cancelled_response(r.seq, r.command));
        return;
    }
    engine_->continue_until_after(current());
    send(make_response(r.seq, r.command));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::step_in&) {
    if (stopping()) {
        send(cancelled_response(r.seq, r.command));
        return;
    }
    engine_->step();
    send(make_response(r.seq, r.command));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::stack_trace&) {
    auto trace = engine_->stack_trace();
    auto frames = json::array();

    // Engine order is outermost first; clients expect innermost first.
    for (std::size_t i = trace.size(); i-- > 0;) {
        const auto& frame = trace[i];
        auto name = frame.name;
        if (name.starts_with("/")) {
            name = std::filesystem::path(name).filename().string();
        }
        auto fr = json{
            {"id", static_cast<int>(i)},
            {"name", name},
            {"line", 0},
            {"column", 0},
        };
        if (frame.loc) {
            auto ec = std::error_code{};
            auto abs = std::filesystem::absolute(frame.loc->file, ec);
            if (ec) {
                spdlog::error("invalid location for stack frame {}: {}", frame.name, ec.message());
                continue;
            }
            fr["source"] = json{{"name", frame.loc->file}, {"path", abs.string()}, {"sourceReference", 0}};
            fr["line"] = frame.loc->line;
            fr["column"] = frame.loc->column;
            fr["endLine"] = frame.loc->end_line;
            fr["endColumn"] = frame.loc->end_column;
        }
        frames.push_back(std::move(fr));
    }

    auto total = frames.size();
    send(make_response(r.seq, r.command, json{{"stackFrames", std::move(frames)}, {"totalFrames", total}}));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::scopes&) {
    auto scopes = json::array({
        json{{"name", "Local"}, {"variablesReference", local_scope_reference}, {"expensive", false}},
    });
    send(make_response(r.seq, r.command, json{{"scopes", scopes}}));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::variables&) {
    auto names = engine_->list_vars();
    if (std::find(names.begin(), names.end(), "self") == names.end()) {
        names.push_back("self");
    }

    auto variables = json::array();
    for (const auto& name : names) {
        auto value = std::string{};
        try {
            value = engine_->lookup_value(name);
        } catch (const engine_error& e) {
            spdlog::warn("failed to get value for variable listing: var={} err={}", name, e.what());
        }
        variables.push_back(json{
            {"name", name},
            {"value", value},
            {"evaluateName", name},
            {"variablesReference", 0},
        });
    }
    send(make_response(r.seq, r.command, json{{"variables", variables}}));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::evaluate& args) {
    auto value = std::string{};
    try {
        value = engine_->lookup_value(args.expression);
    } catch (const engine_error& e) {
        send(failed_response(r.seq, r.command, std::string("Failed to look up variable: ") + e.what()));
        return;
    }
    send(make_response(r.seq, r.command, json{
        {"result", value},
        {"type", "string"},
        {"variablesReference", 0},
    }));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::threads&) {
    auto threads = json::array({json{{"id", main_thread_id}, {"name", "main"}}});
    send(make_response(r.seq, r.command, json{{"threads", threads}}));
}

JSONNICE_INLINE void session_t::handle(const request_t& r, const req::unsupported& args) {
    send(unsupported_response(r.seq, r.command, args.name + "Request is not yet supported"));
}

} // namespace jsonnice::dap

#undef JSONNICE_INLINE
