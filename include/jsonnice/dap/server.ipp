// server.ipp - implementation file for server_t

#ifdef JSONNICE_SEPARATE_COMPILATION
#define JSONNICE_INLINE
#else
#define JSONNICE_INLINE inline
#endif

#include <chrono>
#include <spdlog/spdlog.h>

namespace jsonnice::dap {

// =============================================================================
// server_t implementation
// =============================================================================

JSONNICE_INLINE server_t::server_t(engine_factory_t make_engine, std::size_t handler_threads)
    : make_engine_(std::move(make_engine))
    , handler_threads_(handler_threads)
{
}

JSONNICE_INLINE server_t::~server_t() {
    stop();
    reap(true);
}

JSONNICE_INLINE void server_t::listen(uint16_t port) {
    auto listener = ::dap::net::Server::create();
    auto on_connect = [this](const std::shared_ptr<::dap::ReaderWriter>& stream) { accept(stream); };
    auto on_error = [](const char* message) { spdlog::error("debug adapter server: {}", message); };
    if (!listener->start(port, on_connect, on_error)) {
        throw transport_error("cannot listen on port " + std::to_string(port));
    }
    listener_ = std::move(listener);
    port_ = port;
    spdlog::info("listening for debug adapter connections on port {}", port_);
}

JSONNICE_INLINE void server_t::run(std::function<bool()> interrupted) {
    {
        auto lock = std::unique_lock<std::mutex>{connections_mutex_};
        while (!stopping_) {
            if (interrupted && interrupted()) {
                lock.unlock();
                spdlog::info("interrupted; shutting down server");
                stop();
                lock.lock();
                break;
            }
            stopped_.wait_for(lock, std::chrono::milliseconds(100));
            reap(false);
        }
    }
    reap(true);
}

// The listener is stopped without holding connections_mutex_: stopping it
// joins the accept thread, which may be waiting on that mutex in accept().
JSONNICE_INLINE void server_t::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    if (listener_) {
        listener_->stop();
    }

    auto lock = std::lock_guard<std::mutex>{connections_mutex_};
    for (auto& connection : connections_) {
        if (!connection.done) {
            connection.transport->close();
        }
    }
    stopped_.notify_all();
}

/// Called on the listener's accept thread for each new connection.
JSONNICE_INLINE void server_t::accept(const std::shared_ptr<::dap::ReaderWriter>& stream) {
    auto lock = std::lock_guard<std::mutex>{connections_mutex_};
    auto name = "connection #" + std::to_string(served_.load() + 1);
    if (stopping_) {
        spdlog::info("refusing {}: server is stopping", name);
        stream->close();
        return;
    }
    spdlog::info("accepted {}", name);

    auto& connection = connections_.emplace_back();
    connection.transport = std::make_shared<stream_transport_t>(stream, name);
    connection.thread = std::thread([this, &connection] { serve(connection); });
    ++served_;
    reap(false);
}

JSONNICE_INLINE void server_t::serve(connection_t& connection) {
    auto& transport = *connection.transport;
    try {
        auto session = session_t{transport, make_engine_(), handler_threads_};
        session.run();
    } catch (const std::exception& e) {
        spdlog::error("session on {} failed: {}", transport.describe(), e.what());
    }
    spdlog::info("{} closed", transport.describe());

    auto lock = std::lock_guard<std::mutex>{connections_mutex_};
    connection.done = true;
}

/// Join finished connection threads; with all=true, wait for every one.
/// Called with connections_mutex_ held when all=false.
JSONNICE_INLINE void server_t::reap(bool all) {
    if (!all) {
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->done) {
                it->thread.join();
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
        return;
    }

    auto remaining = std::list<connection_t>{};
    {
        auto lock = std::lock_guard<std::mutex>{connections_mutex_};
        remaining.splice(remaining.end(), connections_);
    }
    for (auto& connection : remaining) {
        if (connection.thread.joinable()) {
            connection.thread.join();
        }
    }
}

// =============================================================================
// stdio mode
// =============================================================================

JSONNICE_INLINE void run_stdio(std::unique_ptr<debugger::engine_facade_t> engine,
                               std::shared_ptr<::dap::Reader> in,
                               std::shared_ptr<::dap::Writer> out) {
    auto transport = stream_transport_t{std::move(in), std::move(out), "stdio"};
    auto session = session_t{transport, std::move(engine)};
    session.run();
}

} // namespace jsonnice::dap

#undef JSONNICE_INLINE
