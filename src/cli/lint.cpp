//! # strictjson-lint Driver Implementation

#include "cli/lint.hpp"

#include "config/decoder_config.hpp"
#include "decoder.hpp"
#include "log/log.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string_view>

namespace strictjson::cli {

namespace {

void print_usage(std::ostream& out) {
    out << "Usage: strictjson-lint [options] FILE...\n"
        << "\n"
        << "Options:\n"
        << "  --profile=NAME     development, staging, production, or a config file profile\n"
        << "  --config=PATH      Read limits and profiles from a TOML config file\n"
        << "  --log-level=LEVEL  trace, debug, info, warn, error, off\n"
        << "  --log-filter=SPEC  Per-module levels, e.g. lint=debug,*=warn\n"
        << "  -v, -vv, -vvv      Increase verbosity\n"
        << "  -q                 Only log errors\n"
        << "  --help             Show this message\n"
        << "  --version          Show the version\n";
}

auto read_file(const std::string& path, std::string& content) -> bool {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    content.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return !file.bad();
}

} // anonymous namespace

auto parse_lint_args(int argc, char* argv[]) -> Result<LintOptions, std::string> {
    LintOptions options;
    bool only_files = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (only_files) {
            options.files.emplace_back(arg);
        } else if (arg == "--") {
            only_files = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else if (arg.starts_with("--profile=")) {
            options.profile = std::string(arg.substr(10));
        } else if (arg.starts_with("--config=")) {
            options.config_path = std::string(arg.substr(9));
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "unknown option '" + std::string(arg) + "'";
        } else {
            options.files.emplace_back(arg);
        }
    }

    if (options.files.empty() && !options.show_help && !options.show_version) {
        return std::string("no input files");
    }
    return options;
}

auto run_lint(const LintOptions& options, std::ostream& out, std::ostream& err) -> int {
    auto requested = config::requested_profile(options.profile);
    std::string profile = requested.value_or(config::DEFAULT_PROFILE);

    std::optional<config::DecoderConfig> selected;
    if (!options.config_path.empty()) {
        std::string error;
        auto file = config::ConfigFile::load(options.config_path, &error);
        if (!file) {
            err << "error: " << options.config_path << ": " << error << "\n";
            return EXIT_USAGE;
        }
        // Without a requested profile the file's [decoder] section applies.
        if (!requested) {
            profile = "decoder";
        }
        selected = file->resolve(requested.value_or(""));
    } else {
        selected = config::DecoderConfig::for_profile(profile);
    }

    if (!selected) {
        err << "error: unknown profile '" << profile << "'\n";
        return EXIT_USAGE;
    }
    if (auto problem = selected->validate()) {
        err << "error: profile '" << profile << "': " << *problem << "\n";
        return EXIT_USAGE;
    }

    STRICTJSON_LOG_INFO("lint", "Linting " << options.files.size() << " files with profile '"
                                           << profile << "'");

    int exit_code = EXIT_VALID;
    for (const auto& path : options.files) {
        std::string content;
        if (!read_file(path, content)) {
            out << path << ": cannot read file\n";
            exit_code = EXIT_INVALID;
            continue;
        }

        auto result = parse_document(content, *selected);
        if (is_ok(result)) {
            out << path << ": OK\n";
        } else {
            out << path << ": " << unwrap_err(result).to_string() << "\n";
            exit_code = EXIT_INVALID;
        }
    }
    return exit_code;
}

auto lint_main(int argc, char* argv[]) -> int {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = parse_lint_args(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n\n";
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    const LintOptions& options = unwrap(parsed);
    if (options.show_help) {
        print_usage(std::cout);
        return EXIT_VALID;
    }
    if (options.show_version) {
        std::cout << "strictjson-lint " << VERSION << "\n";
        return EXIT_VALID;
    }

    int code = run_lint(options, std::cout, std::cerr);
    log::Logger::instance().flush();
    return code;
}

} // namespace strictjson::cli
