//! # docmd CLI Driver Implementation
//!
//! ## Return Codes
//!
//! | Code | Meaning                                   |
//! |------|-------------------------------------------|
//! | 0    | Success                                   |
//! | 1    | Bad option, or input could not be read    |

#include "driver.hpp"

#include "doc/hover.hpp"
#include "doc/html_markup.hpp"
#include "log/log.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>

namespace docmd::cli {

namespace {

auto parse_depth(std::string_view value) -> std::optional<size_t> {
    size_t depth = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
    if (ec != std::errc() || ptr != value.data() + value.size() || depth == 0) {
        return std::nullopt;
    }
    return depth;
}

struct InputError {
    std::string message;
};

auto read_input(const CliOptions& options, std::istream& in) -> Result<std::string, InputError> {
    std::ostringstream buffer;
    if (!options.input_file) {
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::ifstream file(*options.input_file, std::ios::binary);
    if (!file) {
        return InputError{"cannot open '" + *options.input_file + "'"};
    }
    buffer << file.rdbuf();
    if (file.bad()) {
        return InputError{"error reading '" + *options.input_file + "'"};
    }
    return buffer.str();
}

} // namespace

void print_usage(std::ostream& out) {
    out << "docmd " << VERSION << "\n\n";
    out << "Usage: docmd [options] [FILE]\n\n";
    out << "Reads documentation comment text from FILE (or stdin) and prints Markdown.\n\n";
    out << "Options:\n";
    out << "  --signature=<text>   Print a hover: the fenced signature, then the docs\n";
    out << "  --language=<lang>    Fence language for --signature (default: java)\n";
    out << "  --max-depth=<n>      Maximum directive and markup nesting depth\n";
    out << "  --log-level=<level>  trace, debug, info, warn, error, fatal, off\n";
    out << "  --log-filter=<spec>  Per-module levels, e.g. markup=debug,*=warn\n";
    out << "  --log-file=<path>    Also write logs to a file\n";
    out << "  --log-format=<fmt>   text or json\n";
    out << "  -v, -vv, -vvv        More log output\n";
    out << "  -q, --quiet          Only log errors\n";
    out << "  -h, --help           Show this help\n";
    out << "  -V, --version        Show the version\n\n";
    out << "Environment:\n";
    out << "  DOCMD_LOG            Log filter used when --log-filter is not given\n";
}

void print_version(std::ostream& out) {
    out << "docmd " << VERSION << "\n";
}

auto parse_cli_options(const std::vector<std::string>& args) -> Result<CliOptions> {
    CliOptions options;

    for (const auto& arg_str : args) {
        std::string_view arg = arg_str;

        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.show_version = true;
        } else if (arg.starts_with("--signature=")) {
            options.signature = std::string(arg.substr(12));
        } else if (arg.starts_with("--language=")) {
            options.language = std::string(arg.substr(11));
        } else if (arg.starts_with("--max-depth=")) {
            auto depth = parse_depth(arg.substr(12));
            if (!depth) {
                return std::string("invalid --max-depth value '") + std::string(arg.substr(12)) +
                       "'";
            }
            options.render.max_directive_depth = *depth;
            options.render.max_markup_depth = *depth;
        } else if (arg.starts_with("-") && arg != "-") {
            return "unknown option '" + arg_str + "'";
        } else if (options.input_file) {
            return "unexpected argument '" + arg_str + "'";
        } else if (arg != "-") {
            options.input_file = arg_str;
        }
    }

    return options;
}

auto run(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err)
    -> int {
    auto input = read_input(options, in);
    if (is_err(input)) {
        DOCMD_LOG_ERROR("cli", unwrap_err(input).message);
        err << "error: " << unwrap_err(input).message << "\n";
        return 1;
    }

    DOCMD_LOG_DEBUG("cli", "Rendering " << unwrap(input).size() << " bytes");
    auto markdown = doc::raw_text_to_markdown(unwrap(input), options.render);

    if (options.signature) {
        auto hover = doc::compose_hover(*options.signature, markdown, options.language);
        out << hover.value << "\n";
    } else {
        out << markdown << "\n";
    }
    return 0;
}

} // namespace docmd::cli

int docmd_main(int argc, char* argv[]) {
    using namespace docmd;

    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = cli::parse_cli_options(args);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n\n";
        cli::print_usage(std::cerr);
        return 1;
    }

    const auto& options = unwrap(parsed);
    if (options.show_help) {
        cli::print_usage(std::cout);
        return 0;
    }
    if (options.show_version) {
        cli::print_version(std::cout);
        return 0;
    }

    int code = cli::run(options, std::cin, std::cout, std::cerr);
    log::Logger::instance().flush();
    return code;
}
