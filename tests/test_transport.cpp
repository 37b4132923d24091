#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include "jsonnice/dap/transport.hpp"
#include "byte_stream.hpp"

using namespace jsonnice;
using namespace jsonnice::dap;

namespace {

auto over(const std::string& input, std::size_t chunk = std::numeric_limits<std::size_t>::max())
    -> stream_transport_t
{
    return stream_transport_t{
        std::make_shared<string_reader_t>(input, chunk),
        std::make_shared<string_writer_t>(),
        "test"
    };
}

template<typename F>
auto throws_protocol_error(F&& f) -> bool {
    try {
        f();
    } catch (const protocol_error&) {
        return true;
    }
    return false;
}

} // namespace

void test_encode_frame() {
    assert(encode_frame("{}") == "Content-Length: 2\r\n\r\n{}");
    assert(encode_frame("") == "Content-Length: 0\r\n\r\n");

    std::cout << "test_encode_frame: PASSED\n";
}

void test_reads_consecutive_frames() {
    // Three bytes per read splits headers and bodies
    auto transport = over(encode_frame(R"({"a":1})") + encode_frame(R"({"b":2})"), 3);

    assert(transport.read_message() == R"({"a":1})");
    assert(transport.read_message() == R"({"b":2})");
    assert(!transport.read_message());

    std::cout << "test_reads_consecutive_frames: PASSED\n";
}

void test_ignores_other_headers() {
    auto transport = over("Content-Type: application/json\r\nContent-Length: 4\r\n\r\ntrue");
    assert(transport.read_message() == "true");

    std::cout << "test_ignores_other_headers: PASSED\n";
}

void test_rejects_bad_framing() {
    auto missing = over("X-Other: 1\r\n\r\n{}");
    assert(throws_protocol_error([&] { missing.read_message(); }));

    auto malformed = over("garbage\r\n\r\n");
    assert(throws_protocol_error([&] { malformed.read_message(); }));

    auto bad_length = over("Content-Length: 12x\r\n\r\n{}");
    assert(throws_protocol_error([&] { bad_length.read_message(); }));

    auto truncated = over("Content-Length: 10\r\n\r\n{}");
    assert(throws_protocol_error([&] { truncated.read_message(); }));

    auto header_only = over("Content-Length: 2\r\n");
    assert(throws_protocol_error([&] { header_only.read_message(); }));

    std::cout << "test_rejects_bad_framing: PASSED\n";
}

void test_rejects_oversized_frames() {
    auto huge = over("Content-Length: 18446744073709551615\r\n\r\n{}");
    assert(throws_protocol_error([&] { huge.read_message(); }));

    auto overflow = over("Content-Length: 99999999999999999999999\r\n\r\n{}");
    assert(throws_protocol_error([&] { overflow.read_message(); }));

    auto just_over = over("Content-Length: " + std::to_string(max_frame_size + 1) + "\r\n\r\n");
    assert(throws_protocol_error([&] { just_over.read_message(); }));

    auto long_header = over("X-Padding: " + std::string(max_header_line, 'x') + "\r\n\r\n");
    assert(throws_protocol_error([&] { long_header.read_message(); }));

    std::cout << "test_rejects_oversized_frames: PASSED\n";
}

void test_writes_frames() {
    auto out = std::make_shared<string_writer_t>();
    auto transport = stream_transport_t{std::make_shared<string_reader_t>(""), out, "test"};

    transport.write_message(R"({"x":1})");
    transport.write_message("[]");
    assert(out->str() == encode_frame(R"({"x":1})") + encode_frame("[]"));

    transport.close();
    try {
        transport.write_message("{}");
        assert(false);
    } catch (const transport_error& e) {
        assert(std::string(e.what()) == "test: write failed");
    }

    std::cout << "test_writes_frames: PASSED\n";
}

void test_network_round_trip() {
    auto accepted = std::promise<std::shared_ptr<::dap::ReaderWriter>>{};
    auto server = ::dap::net::Server::create();
    auto port = start_on_free_port(*server, [&accepted](const std::shared_ptr<::dap::ReaderWriter>& rw) {
        accepted.set_value(rw);
    });
    assert(port > 0);

    auto client = ::dap::net::connect("localhost", port);
    assert(client);
    auto transport = stream_transport_t{accepted.get_future().get(), "connection"};

    // Split a frame across several writes
    auto frame = encode_frame(R"({"seq":1})") + encode_frame(R"({"seq":2})");
    assert(client->write(frame.data(), 5));
    assert(client->write(frame.data() + 5, 20));
    assert(client->write(frame.data() + 25, frame.size() - 25));

    assert(transport.read_message() == R"({"seq":1})");
    assert(transport.read_message() == R"({"seq":2})");
    transport.write_message("ok");

    auto client_side = stream_transport_t{client, "client"};
    assert(client_side.read_message() == "ok");

    client->close();
    assert(!transport.read_message());
    transport.close();
    server->stop();

    std::cout << "test_network_round_trip: PASSED\n";
}

void test_close_unblocks_reader() {
    auto accepted = std::promise<std::shared_ptr<::dap::ReaderWriter>>{};
    auto server = ::dap::net::Server::create();
    auto port = start_on_free_port(*server, [&accepted](const std::shared_ptr<::dap::ReaderWriter>& rw) {
        accepted.set_value(rw);
    });
    assert(port > 0);

    auto client = ::dap::net::connect("localhost", port);
    assert(client);
    auto transport = stream_transport_t{accepted.get_future().get(), "connection"};

    auto result = std::optional<std::string>{"pending"};
    auto reader = std::thread([&] { result = transport.read_message(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    transport.close();
    reader.join();
    assert(!result);

    client->close();
    server->stop();

    std::cout << "test_close_unblocks_reader: PASSED\n";
}

int main() {
    test_encode_frame();
    test_reads_consecutive_frames();
    test_ignores_other_headers();
    test_rejects_bad_framing();
    test_rejects_oversized_frames();
    test_writes_frames();
    test_network_round_trip();
    test_close_unblocks_reader();

    std::cout << "All transport tests passed!\n";
    return 0;
}
