// options.ipp - implementation file for command-line options

#ifdef JSONNICE_SEPARATE_COMPILATION
#define JSONNICE_INLINE
#else
#define JSONNICE_INLINE inline
#endif

#include <cerrno>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace jsonnice {

JSONNICE_INLINE void print_version(std::ostream& os) {
    os << "jsonnice version " << version << "\n";
}

JSONNICE_INLINE void print_usage(std::ostream& os) {
    print_version(os);
    os << "\n";
    os << "jsonnice {<option>} { <filename> }\n";
    os << "\n";
    os << "Available options:\n";
    os << "  -h / --help                This message\n";
    os << "  -e / --exec                Treat filename as code\n";
    os << "  -J / --jpath <dir>         Specify an additional library search dir\n";
    os << "  -d / --dap                 Start a debug-adapter-protocol server\n";
    os << "  -s / --stdin               Start a debug-adapter-protocol session using stdin/stdout for communication\n";
    os << "  -p / --port <port>         Port for the debug-adapter-protocol server (default " << default_dap_port << ")\n";
    os << "  -l / --log-level <level>   Set the log level. Allowed values: debug,info,warn,error\n";
    os << "  --version                  Print version\n";
    os << "\n";
    os << "In all cases:\n";
    os << "  Multichar options are expanded e.g. -abc becomes -a -b -c.\n";
    os << "  The -- option suppresses option processing for subsequent arguments.\n";
    os << "  Note that since filenames and jsonnet programs can begin with -, it is\n";
    os << "  advised to use -- if the argument is unknown, e.g. jsonnice -- \"$FILENAME\".\n";
}

JSONNICE_INLINE auto simplify_args(const std::vector<std::string>& args) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(args.size() * 2);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--") {
            result.insert(result.end(), args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
            break;
        }
        if (arg.size() > 2 && arg[0] == '-' && arg[1] != '-') {
            for (std::size_t j = 1; j < arg.size(); ++j) {
                result.push_back(std::string("-") + arg[j]);
            }
        } else {
            result.push_back(arg);
        }
    }
    return result;
}

JSONNICE_INLINE auto parse_options(const std::vector<std::string>& given, options_t& options) -> parse_result_t {
    auto args = simplify_args(given);
    auto remaining = std::vector<std::string>{};

    auto next_arg = [&args](std::size_t& i) -> const std::string& {
        if (++i >= args.size()) {
            throw config_error("Expected another commandline argument.");
        }
        return args[i];
    };

    try {
        for (std::size_t i = 0; i < args.size(); ++i) {
            const auto& arg = args[i];
            if (arg == "-h" || arg == "--help") {
                return {parse_status::success_usage, {}};
            } else if (arg == "-v" || arg == "--version") {
                return {parse_status::success, {}};
            } else if (arg == "-e" || arg == "--exec") {
                options.filename_is_code = true;
            } else if (arg == "-s" || arg == "--stdin") {
                options.stdin_session = true;
            } else if (arg == "-d" || arg == "--dap") {
                options.dap = true;
            } else if (arg == "--") {
                remaining.insert(remaining.end(), args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            } else if (arg == "-J" || arg == "--jpath") {
                const auto& dir = next_arg(i);
                if (dir.empty()) {
                    return {parse_status::failure, "-J argument was empty string"};
                }
                options.jpaths.push_back(dir);
            } else if (arg == "-p" || arg == "--port") {
                const auto& text = next_arg(i);
                auto port = 0u;
                auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
                if (ec != std::errc{} || end != text.data() + text.size() || port > 65535) {
                    return {parse_status::failure, "invalid port " + text};
                }
                options.port = static_cast<uint16_t>(port);
            } else if (arg == "-l" || arg == "--log-level") {
                const auto& level = next_arg(i);
                if (level.empty()) {
                    return {parse_status::failure, "no log level specified"};
                }
                options.level = from_string(std::type_identity<log_level>{}, level);
            } else if (arg.size() > 1 && arg[0] == '-') {
                return {parse_status::failure, "unrecognized argument: " + arg};
            } else {
                remaining.push_back(arg);
            }
        }
    } catch (const config_error& e) {
        return {parse_status::failure, e.what()};
    }

    if (options.dap) {
        return {parse_status::proceed, {}};
    }

    auto want = std::string(options.filename_is_code ? "code" : "filename");
    if (remaining.empty()) {
        return {parse_status::failure_usage, "must give " + want};
    }
    if (remaining.size() != 1) {
        return {parse_status::failure_usage, "only one " + want + " is allowed"};
    }
    options.input_file = remaining.front();
    return {parse_status::proceed, {}};
}

JSONNICE_INLINE auto read_input(const options_t& options, std::istream& in) -> input_t {
    if (options.filename_is_code) {
        return {"<cmdline>", options.input_file};
    }

    auto text = std::ostringstream{};
    if (options.input_file == "-") {
        text << in.rdbuf();
        if (in.bad()) {
            throw config_error("Reading input file: <stdin>: read failed");
        }
        return {"<stdin>", text.str()};
    }

    if (std::filesystem::is_directory(options.input_file)) {
        auto reason = std::make_error_code(std::errc::is_a_directory).message();
        throw config_error("Reading input file: " + options.input_file + ": " + reason);
    }
    auto file = std::ifstream{options.input_file, std::ios::binary};
    if (!file) {
        auto reason = std::error_code{errno, std::generic_category()}.message();
        throw config_error("Opening input file: " + options.input_file + ": " + reason);
    }
    text << file.rdbuf();
    return {options.input_file, text.str()};
}

} // namespace jsonnice

#undef JSONNICE_INLINE
