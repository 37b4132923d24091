#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace jsonnice::dap {

using json = nlohmann::json;

// =============================================================================
// Error response identifiers
//
// Every failed response carries success=false, a stable tag in "message" and
// a fixed id in body.error.id; body.error.format holds the detail text.
// =============================================================================

namespace error_id {
    inline constexpr int unsupported = 12345;
    inline constexpr int failed      = 12346;
    inline constexpr int cancelled   = 12347;
} // namespace error_id

namespace error_tag {
    inline constexpr const char* unsupported = "unsupported";
    inline constexpr const char* failed      = "failed";
    inline constexpr const char* cancelled   = "cancelled";
} // namespace error_tag

// The debugger has a single thread of evaluation.
inline constexpr int main_thread_id = 1;
inline constexpr int local_scope_reference = 1000;

// =============================================================================
// Message construction
//
// Outbound "seq" is left at 0 here; the output writer numbers messages as it
// writes them.
// =============================================================================

inline auto make_event(const std::string& event, json body = nullptr) -> json {
    auto message = json{
        {"seq", 0},
        {"type", "event"},
        {"event", event},
    };
    if (!body.is_null()) {
        message["body"] = std::move(body);
    }
    return message;
}

inline auto make_response(int request_seq, const std::string& command, json body = nullptr) -> json {
    auto message = json{
        {"seq", 0},
        {"type", "response"},
        {"request_seq", request_seq},
        {"command", command},
        {"success", true},
    };
    if (!body.is_null()) {
        message["body"] = std::move(body);
    }
    return message;
}

inline auto make_error_response(int request_seq, const std::string& command,
                                const char* tag, int id, const std::string& detail) -> json {
    auto message = make_response(request_seq, command);
    message["success"] = false;
    message["message"] = tag;
    message["body"] = json{{"error", json{{"id", id}, {"format", detail}}}};
    return message;
}

inline auto unsupported_response(int request_seq, const std::string& command, const std::string& detail) -> json {
    return make_error_response(request_seq, command, error_tag::unsupported, error_id::unsupported, detail);
}

inline auto failed_response(int request_seq, const std::string& command, const std::string& detail) -> json {
    return make_error_response(request_seq, command, error_tag::failed, error_id::failed, detail);
}

inline auto cancelled_response(int request_seq, const std::string& command) -> json {
    return make_error_response(request_seq, command, error_tag::cancelled, error_id::cancelled,
                               "session is shutting down");
}

// =============================================================================
// Events
// =============================================================================

inline auto initialized_event() -> json {
    return make_event("initialized");
}

inline auto stopped_event(const std::string& reason, const std::string& text = {}) -> json {
    auto body = json{
        {"reason", reason},
        {"threadId", main_thread_id},
        {"allThreadsStopped", true},
    };
    if (!text.empty()) {
        body["text"] = text;
    }
    return make_event("stopped", std::move(body));
}

inline auto terminated_event() -> json {
    return make_event("terminated");
}

inline auto output_event(const std::string& output, const std::string& category = "stdout") -> json {
    return make_event("output", json{{"category", category}, {"output", output}});
}

// =============================================================================
// Capabilities advertised in the initialize response (all optional features
// are off)
// =============================================================================

inline auto capabilities() -> json {
    auto body = json::object();
    for (const auto* name : {
        "supportsConfigurationDoneRequest",
        "supportsFunctionBreakpoints",
        "supportsConditionalBreakpoints",
        "supportsHitConditionalBreakpoints",
        "supportsEvaluateForHovers",
        "supportsStepBack",
        "supportsSetVariable",
        "supportsRestartFrame",
        "supportsGotoTargetsRequest",
        "supportsStepInTargetsRequest",
        "supportsCompletionsRequest",
        "supportsModulesRequest",
        "supportsRestartRequest",
        "supportsExceptionOptions",
        "supportsValueFormattingOptions",
        "supportsExceptionInfoRequest",
        "supportTerminateDebuggee",
        "supportsDelayedStackTraceLoading",
        "supportsLoadedSourcesRequest",
        "supportsLogPoints",
        "supportsTerminateThreadsRequest",
        "supportsSetExpression",
        "supportsTerminateRequest",
        "supportsDataBreakpoints",
        "supportsReadMemoryRequest",
        "supportsDisassembleRequest",
        "supportsCancelRequest",
        "supportsBreakpointLocationsRequest",
    }) {
        body[name] = false;
    }
    body["exceptionBreakpointFilters"] = json::array();
    body["completionTriggerCharacters"] = json::array();
    body["additionalModuleColumns"] = json::array();
    body["supportedChecksumAlgorithms"] = json::array();
    return body;
}

} // namespace jsonnice::dap
