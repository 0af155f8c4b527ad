//! # CLI Utilities Interface
//!
//! | Function               | Description                            |
//! |------------------------|----------------------------------------|
//! | `split_command_args()` | Separate flags from command arguments  |
//! | `split_step_patterns()`| Extract the patterns of a steps file   |
//! | `print_usage()`        | Print CLI help text                    |
//! | `print_version()`      | Print version                          |

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cuke::cli {

/// The arguments that follow the command name.
struct CommandArgs {
    std::vector<std::string> positional;
    std::vector<std::string> flags;
    int option_argc; ///< Number of argv entries before `--`, for option parsers
};

/// Splits `argv[2..]` into flags and positional arguments. A lone `-` and
/// negative numbers are positional. Everything after `--` is positional.
CommandArgs split_command_args(int argc, char* argv[]);

/// One pattern line of a steps file.
struct StepPattern {
    std::string text;
    uint32_t line;   ///< 1-based
    uint32_t indent; ///< Bytes of whitespace before the pattern
};

/// One entry per pattern line, skipping blank lines and `#` comments.
std::vector<StepPattern> split_step_patterns(std::string_view content);

// Help text
void print_usage();
void print_version();

} // namespace cuke::cli
