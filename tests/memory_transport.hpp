#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "jsonnice/dap/protocol.hpp"
#include "jsonnice/dap/transport.hpp"
#include "jsonnice/parallel/queue.hpp"

// =============================================================================
// memory_transport_t - transport fed by the test and recording every write
// =============================================================================

class memory_transport_t : public jsonnice::dap::transport_t {
public:
    using json = jsonnice::dap::json;

    auto read_message() -> std::optional<std::string> override {
        return incoming_.recv();
    }

    void write_message(const std::string& body) override {
        auto lock = std::lock_guard<std::mutex>{mutex_};
        written_.push_back(body);
    }

    void close() override {
        closed_ = true;
        incoming_.close();
    }

    auto describe() const -> std::string override { return "memory"; }

    // =========================================================================
    // Test controls
    // =========================================================================

    void push(const std::string& body) { incoming_.send(body); }

    void push_request(int seq, const std::string& command, json arguments = json::object()) {
        push(json{
            {"seq", seq},
            {"type", "request"},
            {"command", command},
            {"arguments", std::move(arguments)},
        }.dump());
    }

    /// End of input: the session's read loop sees end of stream.
    void finish() { incoming_.close(); }

    auto written() const -> std::vector<std::string> {
        auto lock = std::lock_guard<std::mutex>{mutex_};
        return written_;
    }

    auto messages() const -> std::vector<json> {
        auto result = std::vector<json>{};
        for (const auto& body : written()) {
            result.push_back(json::parse(body));
        }
        return result;
    }

    auto closed() const -> bool { return closed_.load(); }

private:
    jsonnice::parallel::blocking_queue<std::string> incoming_;
    mutable std::mutex mutex_;
    std::vector<std::string> written_;
    std::atomic<bool> closed_{false};
};

// =============================================================================
// Message queries
// =============================================================================

inline auto responses_to(const std::vector<jsonnice::dap::json>& messages, int request_seq)
    -> std::vector<jsonnice::dap::json>
{
    auto result = std::vector<jsonnice::dap::json>{};
    for (const auto& m : messages) {
        if (m["type"] == "response" && m["request_seq"] == request_seq) {
            result.push_back(m);
        }
    }
    return result;
}

inline auto index_of_event(const std::vector<jsonnice::dap::json>& messages, const std::string& event) -> int {
    for (std::size_t i = 0; i < messages.size(); ++i) {
        if (messages[i]["type"] == "event" && messages[i]["event"] == event) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

inline auto index_of_response(const std::vector<jsonnice::dap::json>& messages, int request_seq) -> int {
    for (std::size_t i = 0; i < messages.size(); ++i) {
        if (messages[i]["type"] == "response" && messages[i]["request_seq"] == request_seq) {
            return static_cast<int>(i);
        }
    }
    return -1;
}
