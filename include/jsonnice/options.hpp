#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "log.hpp"

namespace jsonnice {

inline constexpr const char* version = "0.3.0";
inline constexpr uint16_t default_dap_port = 54321;

// =============================================================================
// Command-line options
// =============================================================================

struct options_t {
    std::string input_file;
    bool filename_is_code = false;
    bool dap = false;
    bool stdin_session = false;
    std::vector<std::string> jpaths;
    log_level level = log_level::error;
    uint16_t port = default_dap_port;
};

enum class parse_status {
    proceed,
    success_usage,
    failure_usage,
    success,
    failure
};

struct parse_result_t {
    parse_status status = parse_status::proceed;
    std::string error;
};

/// Expand "-abc" into "-a -b -c" for every argument before the first "--".
auto simplify_args(const std::vector<std::string>& args) -> std::vector<std::string>;

/// Fill `options` from argv (program name excluded). A "success" status
/// means --version was given.
auto parse_options(const std::vector<std::string>& args, options_t& options) -> parse_result_t;

void print_version(std::ostream& os);
void print_usage(std::ostream& os);

// =============================================================================
// Program input
// =============================================================================

struct input_t {
    std::string name;
    std::string text;
};

/// Read the program named by the options: inline code, "-" for standard
/// input, or a file. Throws config_error("Opening input file: ...").
auto read_input(const options_t& options, std::istream& in = std::cin) -> input_t;

} // namespace jsonnice

// =============================================================================
// Include implementations for header-only mode
// =============================================================================

#ifndef JSONNICE_SEPARATE_COMPILATION
#include "options.ipp"
#endif
