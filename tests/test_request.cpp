#include <cassert>
#include <iostream>
#include <string>
#include "jsonnice/dap/request.hpp"

using namespace jsonnice;
using namespace jsonnice::dap;

template<typename F>
auto throws_protocol_error(F&& f) -> bool {
    try {
        f();
    } catch (const protocol_error&) {
        return true;
    }
    return false;
}

auto request(int seq, const std::string& command, json arguments = json::object()) -> json {
    return json{{"seq", seq}, {"type", "request"}, {"command", command}, {"arguments", arguments}};
}

void test_decode_initialize() {
    auto r = decode_request(request(1, "initialize", {{"clientID", "vscode"}, {"adapterID", "jsonnet"}}).dump());
    assert(r.seq == 1);
    assert(r.command == "initialize");
    const auto& body = std::get<req::initialize>(r.body);
    assert(body.client_id == "vscode");
    assert(body.adapter_id == "jsonnet");

    std::cout << "test_decode_initialize: PASSED\n";
}

void test_decode_launch_keeps_raw_arguments() {
    // A launch without a program is still a well-formed request
    auto r = decode_request(request(2, "launch", {{"noDebug", true}}));
    const auto& body = std::get<req::launch>(r.body);
    assert(!body.arguments.contains("program"));
    assert(body.arguments["noDebug"] == true);

    std::cout << "test_decode_launch_keeps_raw_arguments: PASSED\n";
}

void test_decode_set_breakpoints() {
    auto r = decode_request(request(3, "setBreakpoints", {
        {"source", {{"path", "/tmp/a.jsonnet"}}},
        {"breakpoints", json::array({json{{"line", 4}}, json{{"line", 7}, {"column", 3}}})},
    }));
    const auto& body = std::get<req::set_breakpoints>(r.body);
    assert(body.path == "/tmp/a.jsonnet");
    assert(body.breakpoints.size() == 2);
    assert(body.breakpoints[0].line == 4 && !body.breakpoints[0].column);
    assert(body.breakpoints[1].line == 7 && body.breakpoints[1].column == 3);

    // Deprecated "lines" form
    auto legacy = decode_request(request(4, "setBreakpoints", {
        {"source", {{"path", "b.jsonnet"}}},
        {"lines", json::array({1, 2})},
    }));
    assert(std::get<req::set_breakpoints>(legacy.body).breakpoints.size() == 2);

    std::cout << "test_decode_set_breakpoints: PASSED\n";
}

void test_decode_control_requests() {
    assert(std::holds_alternative<req::resume>(decode_request(request(5, "continue", {{"threadId", 1}})).body));
    assert(std::holds_alternative<req::next>(decode_request(request(6, "next")).body));
    assert(std::holds_alternative<req::step_in>(decode_request(request(7, "stepIn")).body));
    assert(std::get<req::evaluate>(decode_request(request(8, "evaluate", {{"expression", "x"}})).body).expression == "x");
    assert(std::get<req::variables>(decode_request(request(9, "variables", {{"variablesReference", 1000}})).body).variables_reference == 1000);

    // Arguments may be omitted entirely
    auto bare = json{{"seq", 10}, {"type", "request"}, {"command", "threads"}};
    assert(std::holds_alternative<req::threads>(decode_request(bare).body));

    std::cout << "test_decode_control_requests: PASSED\n";
}

void test_decode_unsupported() {
    auto r = decode_request(request(11, "setExpression", {{"expression", "x"}, {"value", "1"}}));
    assert(r.command == "setExpression");
    assert(std::get<req::unsupported>(r.body).name == "SetExpression");

    for (const auto& command : unsupported_commands()) {
        assert(std::holds_alternative<req::unsupported>(decode_request(request(12, command)).body));
    }
    assert(unsupported_commands().size() >= 20);

    std::cout << "test_decode_unsupported: PASSED\n";
}

void test_decode_rejects_malformed() {
    assert(throws_protocol_error([] { decode_request(std::string("{not json")); }));
    assert(throws_protocol_error([] { decode_request(std::string("[1, 2]")); }));
    assert(throws_protocol_error([] { decode_request(json{{"seq", 1}, {"type", "response"}, {"command", "next"}}); }));
    assert(throws_protocol_error([] { decode_request(json{{"type", "request"}, {"command", "next"}}); }));
    assert(throws_protocol_error([] { decode_request(json{{"seq", 1}, {"type", "request"}}); }));
    assert(throws_protocol_error([] { decode_request(request(1, "fooBar")); }));
    assert(throws_protocol_error([] { decode_request(request(1, "evaluate", {{"expression", 12}})); }));
    assert(throws_protocol_error([] { decode_request(request(1, "setBreakpoints", {{"breakpoints", json::array()}})); }));

    std::cout << "test_decode_rejects_malformed: PASSED\n";
}

void test_error_response_shape() {
    auto r = unsupported_response(4, "setExpression", "SetExpressionRequest is not yet supported");
    assert(r["type"] == "response");
    assert(r["request_seq"] == 4);
    assert(r["success"] == false);
    assert(r["message"] == "unsupported");
    assert(r["body"]["error"]["id"] == error_id::unsupported);
    assert(r["body"]["error"]["format"] == "SetExpressionRequest is not yet supported");

    auto f = failed_response(5, "launch", "Invalid launch arguments");
    assert(f["message"] == "failed");
    assert(f["body"]["error"]["id"] == error_id::failed);

    std::cout << "test_error_response_shape: PASSED\n";
}

int main() {
    test_decode_initialize();
    test_decode_launch_keeps_raw_arguments();
    test_decode_set_breakpoints();
    test_decode_control_requests();
    test_decode_unsupported();
    test_decode_rejects_malformed();
    test_error_response_shape();

    std::cout << "All request tests passed!\n";
    return 0;
}
