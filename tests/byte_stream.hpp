#pragma once

#include <algorithm>
#include <atomic>
#include <cstring>
#include <limits>
#include <mutex>
#include <string>
#include <dap/io.h>
#include <dap/network.h>

// =============================================================================
// string_reader_t - cppdap reader over fixed bytes, at most `chunk` per read
// =============================================================================

class string_reader_t : public ::dap::Reader {
public:
    explicit string_reader_t(std::string data, std::size_t chunk = std::numeric_limits<std::size_t>::max())
        : data_(std::move(data))
        , chunk_(chunk)
    {
    }

    bool isOpen() override { return open_; }
    void close() override { open_ = false; }

    size_t read(void* buffer, size_t n) override {
        if (!open_) {
            return 0;
        }
        n = std::min({n, chunk_, data_.size() - pos_});
        std::memcpy(buffer, data_.data() + pos_, n);
        pos_ += n;
        return n;
    }

private:
    std::string data_;
    std::size_t chunk_;
    std::size_t pos_ = 0;
    std::atomic<bool> open_{true};
};

// =============================================================================
// string_writer_t - cppdap writer collecting everything written
// =============================================================================

class string_writer_t : public ::dap::Writer {
public:
    bool isOpen() override { return open_; }
    void close() override { open_ = false; }

    bool write(const void* buffer, size_t n) override {
        if (!open_) {
            return false;
        }
        auto lock = std::lock_guard<std::mutex>{mutex_};
        data_.append(static_cast<const char*>(buffer), n);
        return true;
    }

    auto str() const -> std::string {
        auto lock = std::lock_guard<std::mutex>{mutex_};
        return data_;
    }

private:
    mutable std::mutex mutex_;
    std::string data_;
    std::atomic<bool> open_{true};
};

// =============================================================================
// Local ports
// =============================================================================

/// Start `server` on the first free port from `first`; returns the port.
template<typename OnConnect>
auto start_on_free_port(::dap::net::Server& server, OnConnect on_connect, int first = 47310) -> int {
    for (auto port = first; port < first + 200; ++port) {
        if (server.start(port, on_connect)) {
            return port;
        }
    }
    return -1;
}
