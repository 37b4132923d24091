#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "jsonnice/options.hpp"

using namespace jsonnice;

namespace {

using args_t = std::vector<std::string>;

auto parse(const args_t& args) -> std::pair<parse_result_t, options_t> {
    auto options = options_t{};
    auto result = parse_options(args, options);
    return {result, options};
}

} // namespace

void test_simplify_args() {
    assert((simplify_args({"-ed", "x"}) == args_t{"-e", "-d", "x"}));
    assert((simplify_args({"--exec", "-J", "lib"}) == args_t{"--exec", "-J", "lib"}));
    assert((simplify_args({"-e", "--", "-abc"}) == args_t{"-e", "--", "-abc"}));
    assert((simplify_args({"-"}) == args_t{"-"}));

    std::cout << "test_simplify_args: PASSED\n";
}

void test_parse_statuses() {
    assert(parse({"-h"}).first.status == parse_status::success_usage);
    assert(parse({"--version"}).first.status == parse_status::success);
    assert(parse({"-v"}).first.status == parse_status::success);

    auto [none, _1] = parse({});
    assert(none.status == parse_status::failure_usage);
    assert(none.error == "must give filename");

    auto [code, _2] = parse({"-e"});
    assert(code.status == parse_status::failure_usage);
    assert(code.error == "must give code");

    auto [two, _3] = parse({"a.jsonnet", "b.jsonnet"});
    assert(two.status == parse_status::failure_usage);
    assert(two.error == "only one filename is allowed");

    auto [unknown, _4] = parse({"--frobnicate"});
    assert(unknown.status == parse_status::failure);
    assert(unknown.error == "unrecognized argument: --frobnicate");

    std::cout << "test_parse_statuses: PASSED\n";
}

void test_parse_repl_options() {
    auto [result, options] = parse({"-J", "lib", "--jpath", "vendor", "-l", "debug", "main.jsonnet"});
    assert(result.status == parse_status::proceed);
    assert(options.input_file == "main.jsonnet");
    assert((options.jpaths == args_t{"lib", "vendor"}));
    assert(options.level == log_level::debug);
    assert(!options.dap);

    // A program that starts with a dash
    auto [dashed, dashed_options] = parse({"-e", "--", "-1"});
    assert(dashed.status == parse_status::proceed);
    assert(dashed_options.filename_is_code);
    assert(dashed_options.input_file == "-1");

    std::cout << "test_parse_repl_options: PASSED\n";
}

void test_parse_dap_options() {
    auto [result, options] = parse({"-d"});
    assert(result.status == parse_status::proceed);
    assert(options.dap);
    assert(options.port == default_dap_port);

    auto [stdio, stdio_options] = parse({"-ds", "-p", "4711"});
    assert(stdio.status == parse_status::proceed);
    assert(stdio_options.dap && stdio_options.stdin_session);
    assert(stdio_options.port == 4711);

    auto [bad_port, _1] = parse({"-d", "-p", "70000"});
    assert(bad_port.status == parse_status::failure);
    assert(bad_port.error == "invalid port 70000");

    auto [text_port, _2] = parse({"-d", "-p", "http"});
    assert(text_port.error == "invalid port http");

    std::cout << "test_parse_dap_options: PASSED\n";
}

void test_parse_argument_errors() {
    auto [empty_jpath, _1] = parse({"-J", "", "a.jsonnet"});
    assert(empty_jpath.status == parse_status::failure);
    assert(empty_jpath.error == "-J argument was empty string");

    auto [missing, _2] = parse({"a.jsonnet", "-J"});
    assert(missing.status == parse_status::failure);
    assert(missing.error == "Expected another commandline argument.");

    auto [bad_level, _3] = parse({"-l", "verbose", "a.jsonnet"});
    assert(bad_level.status == parse_status::failure);
    assert(bad_level.error == "invalid log level verbose. Allowed: debug,info,warn,error");

    std::cout << "test_parse_argument_errors: PASSED\n";
}

void test_log_level_strings() {
    for (auto level : {log_level::debug, log_level::info, log_level::warn, log_level::error}) {
        assert(from_string(std::type_identity<log_level>{}, to_string(level)) == level);
    }

    std::cout << "test_log_level_strings: PASSED\n";
}

void test_read_input() {
    auto options = options_t{};
    options.filename_is_code = true;
    options.input_file = "{ a: 1 }";
    auto code = read_input(options);
    assert(code.name == "<cmdline>");
    assert(code.text == "{ a: 1 }");

    options = options_t{};
    options.input_file = "-";
    auto in = std::istringstream{"local x = 1;\nx\n"};
    auto piped = read_input(options, in);
    assert(piped.name == "<stdin>");
    assert(piped.text == "local x = 1;\nx\n");

    auto path = (std::filesystem::temp_directory_path() / "options_input.jsonnet").string();
    std::ofstream{path} << "{}\n";
    options.input_file = path;
    auto file = read_input(options);
    assert(file.name == path);
    assert(file.text == "{}\n");

    options.input_file = "/nonexistent/missing.jsonnet";
    try {
        read_input(options);
        assert(false);
    } catch (const config_error& e) {
        assert(std::string(e.what()).starts_with("Opening input file: /nonexistent/missing.jsonnet: "));
    }

    options.input_file = std::filesystem::temp_directory_path().string();
    try {
        read_input(options);
        assert(false);
    } catch (const config_error& e) {
        assert(std::string(e.what()).starts_with("Reading input file: "));
    }

    std::cout << "test_read_input: PASSED\n";
}

void test_usage_mentions_every_option() {
    auto out = std::ostringstream{};
    print_usage(out);
    auto text = out.str();
    assert(text.starts_with("jsonnice version "));
    for (const auto* flag : {"--exec", "--jpath", "--dap", "--stdin", "--port", "--log-level", "--version"}) {
        assert(text.find(flag) != std::string::npos);
    }

    std::cout << "test_usage_mentions_every_option: PASSED\n";
}

int main() {
    test_simplify_args();
    test_parse_statuses();
    test_parse_repl_options();
    test_parse_dap_options();
    test_parse_argument_errors();
    test_log_level_strings();
    test_read_input();
    test_usage_mentions_every_option();

    std::cout << "All options tests passed!\n";
    return 0;
}
