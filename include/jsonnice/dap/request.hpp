#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "protocol.hpp"
#include "../error.hpp"

namespace jsonnice::dap {

// =============================================================================
// Request argument structs
// =============================================================================

namespace req {

struct initialize {
    std::string client_id;
    std::string adapter_id;
};

/// Arguments are kept raw: a malformed launch configuration is answered with
/// an error response rather than treated as a protocol violation.
struct launch {
    json arguments;
};

struct disconnect {};

struct source_breakpoint {
    int line;
    std::optional<int> column;
};

struct set_breakpoints {
    std::string path;
    std::vector<source_breakpoint> breakpoints;
};

struct set_exception_breakpoints {
    std::vector<std::string> filters;
};

struct resume {
    int thread_id;
};

struct next {
    int thread_id;
};

struct step_in {
    int thread_id;
};

struct stack_trace {
    int thread_id;
};

struct scopes {
    int frame_id;
};

struct variables {
    int variables_reference;
};

struct evaluate {
    std::string expression;
};

struct threads {};

/// A standard debug adapter request this bridge acknowledges but does not
/// implement. name is the capitalized command ("SetExpression").
struct unsupported {
    std::string name;
};

} // namespace req

// =============================================================================
// request_t - a decoded inbound request
// =============================================================================

using request_body_t = std::variant<
    req::initialize,
    req::launch,
    req::disconnect,
    req::set_breakpoints,
    req::set_exception_breakpoints,
    req::resume,
    req::next,
    req::step_in,
    req::stack_trace,
    req::scopes,
    req::variables,
    req::evaluate,
    req::threads,
    req::unsupported
>;

struct request_t {
    int seq = 0;
    std::string command;
    request_body_t body;
};

/// Decode one framed message. Throws protocol_error for anything that is not
/// a well-formed request with a standard command.
auto decode_request(const std::string& text) -> request_t;
auto decode_request(const json& message) -> request_t;

/// Commands of the standard protocol that decode to req::unsupported.
auto unsupported_commands() -> const std::vector<std::string>&;

} // namespace jsonnice::dap

// =============================================================================
// Include implementations for header-only mode
// =============================================================================

#ifndef JSONNICE_SEPARATE_COMPILATION
#include "request.ipp"
#endif
