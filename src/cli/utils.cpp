//! # CLI Utilities

#include "cli/utils.hpp"

#include "cuke/common.hpp"
#include "cuke/gherkin/lexer.hpp"

#include <iostream>

namespace cuke::cli {

CommandArgs split_command_args(int argc, char* argv[]) {
    CommandArgs args{.positional = {}, .flags = {}, .option_argc = argc};
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--") {
            args.option_argc = i;
            for (int j = i + 1; j < argc; ++j) {
                args.positional.emplace_back(argv[j]);
            }
            break;
        }
        bool is_flag = arg.size() > 1 && arg[0] == '-' && !(arg[1] >= '0' && arg[1] <= '9');
        if (is_flag) {
            args.flags.emplace_back(arg);
        } else {
            args.positional.emplace_back(arg);
        }
    }
    return args;
}

std::vector<StepPattern> split_step_patterns(std::string_view content) {
    std::vector<StepPattern> patterns;
    uint32_t line = 0;
    size_t start = 0;

    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        std::string_view raw = content.substr(start, end - start);
        start = end + 1;
        ++line;

        std::string_view text = gherkin::trim(raw);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        patterns.push_back(StepPattern{
            .text = std::string(text),
            .line = line,
            .indent = static_cast<uint32_t>(gherkin::leading_whitespace(raw))});
    }
    return patterns;
}

void print_usage() {
    std::cout << "cuke " << VERSION << "\n\n";
    std::cout << "Usage: cuke <command> [options] [--] <args>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  lex <file>                    Print the line tokens of a feature file\n";
    std::cout << "  parse <file>                  Print the document tree\n";
    std::cout << "  expand <file>                 Print concrete scenarios after expansion\n";
    std::cout << "  match <pattern> <text>        Match step text against an expression\n";
    std::cout << "  check --steps=<file> <file>   Report steps with no matching pattern\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h             Show this help\n";
    std::cout << "  --version, -V          Show version\n";
    std::cout << "  --verbose              Show doc strings, tables and match details\n";
    std::cout << "  --no-color             Disable colored output\n";
    std::cout << "  -v, -vv, -vvv, -q      Log at info, debug, trace, or errors only\n";
    std::cout << "  --log-level=<level>    trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=<spec>    Per-module levels, e.g. gherkin=debug,*=warn\n";
    std::cout << "  --log-file=<path>      Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>     text or json\n";
    std::cout << "  --                     Treat every later argument as data\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  CUKE_LOG               Log filter used when --log-filter is absent\n";
}

void print_version() {
    std::cout << "cuke " << VERSION << "\n";
}

} // namespace cuke::cli
