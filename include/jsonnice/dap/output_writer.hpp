#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include "protocol.hpp"
#include "transport.hpp"
#include "../parallel/queue.hpp"

namespace jsonnice::dap {

// =============================================================================
// output_writer_t - the single serialization point for outbound messages
//
// enqueue() may be called from any thread. One worker thread pops messages in
// enqueue order, numbers them, and writes each as a complete frame followed
// by a flush. close() stops accepting new messages, lets the worker drain
// everything already queued, and joins it.
// =============================================================================

class output_writer_t {
public:
    explicit output_writer_t(transport_t& transport);
    ~output_writer_t();

    output_writer_t(const output_writer_t&) = delete;
    output_writer_t& operator=(const output_writer_t&) = delete;

    /// Returns false if the writer is already closed (the message is dropped).
    auto enqueue(json message) -> bool;
    void close();

    auto written() const -> std::size_t { return written_.load(); }

private:
    void run();

    transport_t& transport_;
    parallel::blocking_queue<json> queue_;
    std::thread worker_;
    int next_seq_ = 1;
    bool broken_ = false;
    std::atomic<std::size_t> written_{0};
};

} // namespace jsonnice::dap

// =============================================================================
// Include implementations for header-only mode
// =============================================================================

#ifndef JSONNICE_SEPARATE_COMPILATION
#include "output_writer.ipp"
#endif
