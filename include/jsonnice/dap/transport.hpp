#pragma once

#include <charconv>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <dap/io.h>
#include "../error.hpp"

namespace jsonnice::dap {

// =============================================================================
// transport_t - a byte stream carrying Content-Length framed messages
//
// read_message() returns nullopt at a clean end of stream, throws
// protocol_error for bad framing and transport_error for I/O failures.
// write_message() writes one complete frame.
// =============================================================================

class transport_t {
public:
    virtual ~transport_t() = default;

    virtual auto read_message() -> std::optional<std::string> = 0;
    virtual void write_message(const std::string& body) = 0;
    virtual void close() = 0;
    virtual auto describe() const -> std::string = 0;
};

// =============================================================================
// Framing
// =============================================================================

/// Largest message body accepted from a client.
inline constexpr std::size_t max_frame_size = std::size_t{64} << 20;

/// Longest header line accepted from a client.
inline constexpr std::size_t max_header_line = 1024;

/// Encode one frame: "Content-Length: N\r\n\r\n" followed by the body.
auto encode_frame(const std::string& body) -> std::string;

/// Decode one frame from a source providing read_line(std::string&) -> bool
/// (false only at end of stream with nothing read) and
/// read_exact(std::size_t) -> std::string.
template<typename Source>
auto read_frame(Source& source) -> std::optional<std::string>;

// =============================================================================
// stream_transport_t - framing over cppdap byte streams
//
// The reader and writer come from dap::file (stdin/stdout), from
// dap::net (an accepted connection), or from tests. close() may be called
// from another thread to unblock a read in progress.
// =============================================================================

class stream_transport_t : public transport_t {
public:
    stream_transport_t(std::shared_ptr<::dap::Reader> reader,
                       std::shared_ptr<::dap::Writer> writer,
                       std::string name);
    stream_transport_t(const std::shared_ptr<::dap::ReaderWriter>& stream, std::string name);

    auto read_message() -> std::optional<std::string> override;
    void write_message(const std::string& body) override;
    void close() override;
    auto describe() const -> std::string override { return name_; }

    auto read_line(std::string& line) -> bool;
    auto read_exact(std::size_t size) -> std::string;

private:
    std::shared_ptr<::dap::Reader> reader_;
    std::shared_ptr<::dap::Writer> writer_;
    std::string name_;
};

// =============================================================================
// read_frame
// =============================================================================

template<typename Source>
auto read_frame(Source& source) -> std::optional<std::string> {
    auto content_length = std::optional<std::size_t>{};
    auto line = std::string{};
    auto first = true;

    while (true) {
        if (!source.read_line(line)) {
            if (first) {
                return std::nullopt;
            }
            throw protocol_error("unexpected end of stream in message header");
        }
        first = false;
        if (line.empty()) {
            break;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw protocol_error("malformed header line: " + line);
        }
        auto name = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        auto start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string{} : value.substr(start);

        if (name == "Content-Length") {
            auto length = std::size_t{0};
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            if (ec != std::errc{} || end != value.data() + value.size()) {
                throw protocol_error("invalid Content-Length: " + value);
            }
            if (length > max_frame_size) {
                throw protocol_error("Content-Length " + value + " exceeds the limit of "
                                     + std::to_string(max_frame_size) + " bytes");
            }
            content_length = length;
        }
    }

    if (!content_length) {
        throw protocol_error("missing Content-Length header");
    }
    return source.read_exact(*content_length);
}

} // namespace jsonnice::dap

// =============================================================================
// Include implementations for header-only mode
// =============================================================================

#ifndef JSONNICE_SEPARATE_COMPILATION
#include "transport.ipp"
#endif
