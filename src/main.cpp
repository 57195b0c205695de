//! # strictjson-lint Entry Point
//!
//! Delegates to the lint driver in `cli/lint.hpp`.

#include "cli/lint.hpp"

int main(int argc, char* argv[]) {
    return strictjson::cli::lint_main(argc, argv);
}
