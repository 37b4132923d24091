#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include "output_writer.hpp"
#include "protocol.hpp"
#include "request.hpp"
#include "transport.hpp"
#include "../debugger/engine.hpp"
#include "../parallel/scheduler.hpp"

namespace jsonnice::dap {

// =============================================================================
// session_t - one debug adapter connection
//
// Owns the engine and the output writer. run() reads requests until the
// connection ends, handing each to a pooled handler; a separate thread turns
// engine events into protocol events. Shutdown order: stop signal, join all
// handlers, terminate the engine and join the event thread, drain the
// writer, close the transport.
//
// The engine is called from handlers without any locking here; it must honor
// the engine_facade_t thread-safety contract. Two control requests in flight
// at once (e.g. two "continue") are passed through as-is.
// =============================================================================

class session_t {
public:
    static constexpr std::size_t default_handler_threads = 4;

    session_t(transport_t& transport,
              std::unique_ptr<debugger::engine_facade_t> engine,
              std::size_t handler_threads = default_handler_threads);
    ~session_t();

    session_t(const session_t&) = delete;
    session_t& operator=(const session_t&) = delete;

    void run();

    /// Signal long-running handlers to wind down at their next checkpoint.
    void stop() { stopping_ = true; }
    auto stopping() const -> bool { return stopping_.load(); }

    auto engine() -> debugger::engine_facade_t& { return *engine_; }

private:
    void read_loop();
    void shutdown();
    void dispatch(const request_t& request);
    void dispatch_events();
    void send(json message);

    auto current() const -> debugger::node_ref_t;
    void set_current(debugger::node_ref_t node);

    void handle(const request_t& r, const req::initialize& args);
    void handle(const request_t& r, const req::launch& args);
    void handle(const request_t& r, const req::disconnect& args);
    void handle(const request_t& r, const req::set_breakpoints& args);
    void handle(const request_t& r, const req::set_exception_breakpoints& args);
    void handle(const request_t& r, const req::resume& args);
    void handle(const request_t& r, const req::next& args);
    void handle(const request_t& r, const req::step_in& args);
    void handle(const request_t& r, const req::stack_trace& args);
    void handle(const request_t& r, const req::scopes& args);
    void handle(const request_t& r, const req::variables& args);
    void handle(const request_t& r, const req::evaluate& args);
    void handle(const request_t& r, const req::threads& args);
    void handle(const request_t& r, const req::unsupported& args);

    transport_t& transport_;
    std::unique_ptr<debugger::engine_facade_t> engine_;
    output_writer_t writer_;
    parallel::thread_pool_t pool_;
    parallel::task_group_t<parallel::thread_pool_t> handlers_;
    std::thread event_thread_;
    std::atomic<bool> stopping_{false};
    bool shut_down_ = false;

    mutable std::mutex current_mutex_;
    debugger::node_ref_t current_;
};

} // namespace jsonnice::dap

// =============================================================================
// Include implementations for header-only mode
// =============================================================================

#ifndef JSONNICE_SEPARATE_COMPILATION
#include "session.ipp"
#endif
