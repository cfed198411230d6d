//! # docmd CLI Driver
//!
//! Argument handling and I/O for the `docmd` executable. Kept apart from
//! `main.cpp` so tests can drive it with in-memory streams.

#ifndef DOCMD_CLI_DRIVER_HPP
#define DOCMD_CLI_DRIVER_HPP

#include "common.hpp"
#include "doc/render_options.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace docmd::cli {

/// Parsed (non-logging) command-line options.
struct CliOptions {
    std::optional<std::string> input_file;  ///< Reads stdin when unset
    std::optional<std::string> signature;   ///< Wrap the output as a hover
    std::string language = "java";          ///< Fence language for hovers
    doc::RenderOptions render;
    bool show_help = false;
    bool show_version = false;
};

/// Parses `args` (program name excluded). Logging options are skipped.
///
/// @returns The options, or an error message for an unknown or malformed option.
[[nodiscard]] auto parse_cli_options(const std::vector<std::string>& args)
    -> Result<CliOptions>;

/// Runs one conversion: reads raw comment text from `options.input_file` or
/// `in`, writes Markdown to `out` and problems to `err`.
///
/// @returns Process exit code (0 on success, 1 on failure).
auto run(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err)
    -> int;

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace docmd::cli

/// Entry point used by `main()`.
int docmd_main(int argc, char* argv[]);

#endif // DOCMD_CLI_DRIVER_HPP
