//! # CLI Command Dispatcher
//!
//! Parses the command line, configures logging and routes to a command.
//!
//! ## Architecture
//!
//! ```text
//! cuke_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ lex            → run_lex()
//!   ├─ parse          → run_parse()
//!   ├─ expand         → run_expand()
//!   ├─ match          → run_match()
//!   └─ check          → run_check()
//! ```
//!
//! ## Global Flags
//!
//! - `--verbose`: doc strings, tables and per-step match details
//! - `--no-color`: plain diagnostics
//! - `-v`, `-q`, `--log-*`: logging, see `log::parse_log_options`
//! - `--`: ends the flags, e.g. `cuke match -- "{int}" "-5"`

#include "cli/driver.hpp"
#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "commands/cmd_match.hpp"
#include "commands/cmd_parse.hpp"
#include "cuke/log/log.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace cuke::cli {

namespace {

constexpr std::string_view STEPS_FLAG = "--steps=";

} // namespace

/// Main entry point for the cuke CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                          |
/// |------|--------------------------------------------------|
/// | 0    | Success                                          |
/// | 1    | Parse or compile error, no match, undefined step |
int cuke_main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    auto args = split_command_args(argc, argv);

    bool verbose = false;
    std::string steps_path;
    for (std::string_view flag : args.flags) {
        if (flag == "--verbose") {
            verbose = true;
        } else if (flag.starts_with(STEPS_FLAG)) {
            steps_path = std::string(flag.substr(STEPS_FLAG.size()));
        }
    }

    auto log_config = log::parse_log_options(args.option_argc, argv);
    log::Logger::init(log_config);
    get_diagnostic_emitter().set_color_enabled(log_config.colors && terminal_supports_colors());
    CUKE_LOG_DEBUG("cli", "Command '" << command << "'");

    if (command == "lex") {
        if (args.positional.size() != 1) {
            std::cerr << "Usage: cuke lex <file.feature>\n";
            return 1;
        }
        return run_lex(args.positional[0]);
    }

    if (command == "parse") {
        if (args.positional.size() != 1) {
            std::cerr << "Usage: cuke parse <file.feature> [--verbose]\n";
            return 1;
        }
        return run_parse(args.positional[0], verbose);
    }

    if (command == "expand") {
        if (args.positional.size() != 1) {
            std::cerr << "Usage: cuke expand <file.feature> [--verbose]\n";
            return 1;
        }
        return run_expand(args.positional[0], verbose);
    }

    if (command == "match") {
        if (args.positional.size() != 2) {
            std::cerr << "Usage: cuke match <pattern> <text> [--verbose]\n";
            return 1;
        }
        return run_match(args.positional[0], args.positional[1], verbose);
    }

    if (command == "check") {
        if (args.positional.size() != 1 || steps_path.empty()) {
            std::cerr << "Usage: cuke check --steps=<file> <file.feature> [--verbose]\n";
            return 1;
        }
        return run_check(args.positional[0], steps_path, verbose);
    }

    std::cerr << "Error: Unknown command '" << command << "'\n";
    std::string similar = find_similar(command, {"lex", "parse", "expand", "match", "check"});
    if (!similar.empty()) {
        std::cerr << "Did you mean '" << similar << "'?\n";
    }
    std::cerr << "Run 'cuke --help' for usage information.\n";
    return 1;
}

} // namespace cuke::cli
