// request.ipp - request decoding

#ifdef JSONNICE_SEPARATE_COMPILATION
#define JSONNICE_INLINE
#else
#define JSONNICE_INLINE inline
#endif

#include <algorithm>
#include <cctype>
#include <map>

namespace jsonnice::dap {

namespace detail {

using decoder_fn = request_body_t (*)(const json& args);

JSONNICE_INLINE auto thread_id(const json& args) -> int {
    return args.value("threadId", main_thread_id);
}

JSONNICE_INLINE auto decode_set_breakpoints(const json& args) -> request_body_t {
    auto r = req::set_breakpoints{};
    r.path = args.at("source").value("path", std::string{});
    if (args.contains("breakpoints")) {
        for (const auto& b : args.at("breakpoints")) {
            auto sb = req::source_breakpoint{b.at("line").get<int>(), std::nullopt};
            if (b.contains("column")) {
                sb.column = b.at("column").get<int>();
            }
            r.breakpoints.push_back(sb);
        }
    } else if (args.contains("lines")) {
        // Deprecated form: bare line numbers
        for (const auto& line : args.at("lines")) {
            r.breakpoints.push_back(req::source_breakpoint{line.get<int>(), std::nullopt});
        }
    }
    return r;
}

JSONNICE_INLINE auto decoders() -> const std::map<std::string, decoder_fn>& {
    static const auto table = std::map<std::string, decoder_fn>{
        {"initialize", [](const json& a) -> request_body_t {
            return req::initialize{a.value("clientID", std::string{}), a.value("adapterID", std::string{})};
        }},
        {"launch", [](const json& a) -> request_body_t { return req::launch{a}; }},
        {"disconnect", [](const json&) -> request_body_t { return req::disconnect{}; }},
        {"setBreakpoints", decode_set_breakpoints},
        {"setExceptionBreakpoints", [](const json& a) -> request_body_t {
            return req::set_exception_breakpoints{a.value("filters", std::vector<std::string>{})};
        }},
        {"continue", [](const json& a) -> request_body_t { return req::resume{thread_id(a)}; }},
        {"next", [](const json& a) -> request_body_t { return req::next{thread_id(a)}; }},
        {"stepIn", [](const json& a) -> request_body_t { return req::step_in{thread_id(a)}; }},
        {"stackTrace", [](const json& a) -> request_body_t { return req::stack_trace{thread_id(a)}; }},
        {"scopes", [](const json& a) -> request_body_t { return req::scopes{a.value("frameId", 0)}; }},
        {"variables", [](const json& a) -> request_body_t {
            return req::variables{a.at("variablesReference").get<int>()};
        }},
        {"evaluate", [](const json& a) -> request_body_t {
            return req::evaluate{a.at("expression").get<std::string>()};
        }},
        {"threads", [](const json&) -> request_body_t { return req::threads{}; }},
    };
    return table;
}

JSONNICE_INLINE auto capitalize(std::string s) -> std::string {
    if (!s.empty()) {
        s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    }
    return s;
}

} // namespace detail

JSONNICE_INLINE auto unsupported_commands() -> const std::vector<std::string>& {
    static const auto commands = std::vector<std::string>{
        "attach",
        "terminate",
        "restart",
        "setFunctionBreakpoints",
        "configurationDone",
        "stepOut",
        "stepBack",
        "reverseContinue",
        "restartFrame",
        "goto",
        "pause",
        "setVariable",
        "setExpression",
        "source",
        "terminateThreads",
        "stepInTargets",
        "gotoTargets",
        "completions",
        "exceptionInfo",
        "loadedSources",
        "dataBreakpointInfo",
        "setDataBreakpoints",
        "readMemory",
        "disassemble",
        "cancel",
        "breakpointLocations",
    };
    return commands;
}

JSONNICE_INLINE auto decode_request(const std::string& text) -> request_t {
    auto message = json{};
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        throw protocol_error(std::string("invalid JSON: ") + e.what());
    }
    return decode_request(message);
}

JSONNICE_INLINE auto decode_request(const json& message) -> request_t {
    if (!message.is_object()) {
        throw protocol_error("message is not an object");
    }
    if (!message.contains("type") || message["type"] != "request") {
        throw protocol_error("expected a request, got: " + message.dump());
    }
    if (!message.contains("seq") || !message["seq"].is_number_integer()) {
        throw protocol_error("request without integer seq");
    }
    if (!message.contains("command") || !message["command"].is_string()) {
        throw protocol_error("request without command");
    }

    auto request = request_t{};
    request.seq = message["seq"].get<int>();
    request.command = message["command"].get<std::string>();
    auto args = message.contains("arguments") ? message["arguments"] : json::object();

    const auto& table = detail::decoders();
    if (auto it = table.find(request.command); it != table.end()) {
        try {
            request.body = it->second(args);
        } catch (const json::exception& e) {
            throw protocol_error("invalid arguments for " + request.command + ": " + e.what());
        }
        return request;
    }

    const auto& unsupported = unsupported_commands();
    if (std::find(unsupported.begin(), unsupported.end(), request.command) != unsupported.end()) {
        request.body = req::unsupported{detail::capitalize(request.command)};
        return request;
    }

    throw protocol_error("unknown command: " + request.command);
}

} // namespace jsonnice::dap

#undef JSONNICE_INLINE
