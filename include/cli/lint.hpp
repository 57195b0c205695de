//! # strictjson-lint Driver
//!
//! Validates JSON files with the guarded structural parser under a chosen
//! profile.
//!
//! ## Usage
//!
//! ```bash
//! strictjson-lint [--profile=NAME] [--config=PATH] [log options] FILE...
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Every file is valid |
//! | 1 | At least one file is invalid or unreadable |
//! | 2 | Usage or configuration error |

#pragma once

#include "common.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace strictjson::cli {

constexpr int EXIT_VALID = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

/// Parsed command line of the lint tool.
struct LintOptions {
    std::string profile;
    std::string config_path;
    std::vector<std::string> files;
    bool show_help = false;
    bool show_version = false;
};

/// Parses lint arguments; logging options are skipped here and handled by
/// `log::parse_log_options`.
[[nodiscard]] auto parse_lint_args(int argc, char* argv[]) -> Result<LintOptions, std::string>;

/// Lints every file in `options`, writing one line per file to `out` and
/// configuration problems to `err`. Returns the process exit code.
[[nodiscard]] auto run_lint(const LintOptions& options, std::ostream& out, std::ostream& err)
    -> int;

/// Full entry point: logging setup, argument parsing, linting.
auto lint_main(int argc, char* argv[]) -> int;

} // namespace strictjson::cli
