// jsonnice.cpp - command-line entry point

#include <filesystem>
#include <iostream>
#include "jsonnice/jsonnice.hpp"

using namespace jsonnice;

namespace {

auto make_engine() -> std::unique_ptr<debugger::engine_facade_t> {
    return std::make_unique<debugger::line_engine_t>();
}

auto run_dap(const options_t& options) -> int {
    if (options.stdin_session) {
        jsonnice::dap::run_stdio(make_engine());
        return 0;
    }

    auto server = jsonnice::dap::server_t{make_engine};
    server.listen(options.port);
    auto guard = signal::interrupt_guard_t{};
    server.run([&guard] { return guard.is_interrupted(); });
    return 0;
}

auto run_repl(options_t options) -> int {
    auto input = input_t{};
    try {
        input = read_input(options);
    } catch (const config_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    if (!options.filename_is_code && options.input_file != "-") {
        auto dir = std::filesystem::path(input.name).parent_path().string();
        options.jpaths.push_back(dir.empty() ? "." : dir);
    }

    auto engine = debugger::line_engine_t{};
    auto repl = repl::repl_session_t{
        engine,
        repl::program_source_t{input.name, input.text, options.jpaths}
    };
    repl.run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = options_t{};
    auto result = parse_options(std::vector<std::string>(argv + 1, argv + argc), options);
    if (!result.error.empty()) {
        std::cerr << "ERROR: " << result.error << "\n";
    }

    switch (result.status) {
        case parse_status::proceed:
            break;
        case parse_status::success_usage:
            print_usage(std::cout);
            return 0;
        case parse_status::failure_usage:
            if (!result.error.empty()) {
                std::cerr << "\n";
            }
            print_usage(std::cerr);
            return 1;
        case parse_status::success:
            print_version(std::cout);
            return 0;
        case parse_status::failure:
            return 1;
    }

    log::setup(options.level);

    try {
        if (options.dap) {
            return run_dap(options);
        }
        return run_repl(std::move(options));
    } catch (const std::exception& e) {
        spdlog::error("jsonnice terminated: {}", e.what());
        return 1;
    }
}
