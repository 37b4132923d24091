#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <dap/io.h>
#include <dap/network.h>
#include "session.hpp"
#include "transport.hpp"

namespace jsonnice::dap {

using engine_factory_t = std::function<std::unique_ptr<debugger::engine_facade_t>()>;

// =============================================================================
// server_t - debug adapter over TCP
//
// Connections are accepted by a dap::net::Server. Each one gets its own
// thread, engine and session_t; nothing is shared between connections.
// =============================================================================

class server_t {
public:
    server_t(engine_factory_t make_engine,
             std::size_t handler_threads = session_t::default_handler_threads);
    ~server_t();

    server_t(const server_t&) = delete;
    server_t& operator=(const server_t&) = delete;

    /// Start accepting on localhost:port. Throws transport_error if the
    /// port cannot be bound.
    void listen(uint16_t port);
    auto port() const -> uint16_t { return port_; }

    /// Block until stop() is called or `interrupted` (polled every 100ms)
    /// returns true, then wait for open connections to finish.
    void run(std::function<bool()> interrupted = {});
    void stop();

    auto connections_served() const -> std::size_t { return served_.load(); }

private:
    struct connection_t {
        std::shared_ptr<stream_transport_t> transport;
        std::thread thread;
        bool done = false;
    };

    void accept(const std::shared_ptr<::dap::ReaderWriter>& stream);
    void serve(connection_t& connection);
    void reap(bool all);

    engine_factory_t make_engine_;
    std::size_t handler_threads_;
    std::unique_ptr<::dap::net::Server> listener_;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> served_{0};

    std::mutex connections_mutex_;
    std::condition_variable stopped_;
    std::list<connection_t> connections_;
};

/// Run a single session until the client goes away. Defaults to
/// stdin/stdout.
void run_stdio(std::unique_ptr<debugger::engine_facade_t> engine,
               std::shared_ptr<::dap::Reader> in = ::dap::file(stdin, false),
               std::shared_ptr<::dap::Writer> out = ::dap::file(stdout, false));

} // namespace jsonnice::dap

// =============================================================================
// Include implementations for header-only mode
// =============================================================================

#ifndef JSONNICE_SEPARATE_COMPILATION
#include "server.ipp"
#endif
