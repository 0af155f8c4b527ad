//! # CLI Driver Interface
//!
//! Entry point called from `main()`.

#pragma once

namespace cuke::cli {

/// Runs the command named by `argv[1]` and returns the process exit code.
int cuke_main(int argc, char* argv[]);

} // namespace cuke::cli
