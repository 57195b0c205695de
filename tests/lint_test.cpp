//! # Lint Driver Tests
//!
//! Argument parsing and end-to-end runs of the lint driver over temporary
//! files.

#include "cli/lint.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace strictjson;
using namespace strictjson::cli;

namespace {

auto parse_args(std::vector<std::string> args) -> Result<LintOptions, std::string> {
    args.insert(args.begin(), "strictjson-lint");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_lint_args(static_cast<int>(argv.size()), argv.data());
}

/// Temporary directory with helpers for writing input files.
class LintRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("strictjson_lint_" + std::string(::testing::UnitTest::GetInstance()
                                                     ->current_test_info()
                                                     ->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    auto write_file(const std::string& name, const std::string& content) -> std::string {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

} // anonymous namespace

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(LintArgsTest, FilesAndOptions) {
    auto result = parse_args({"--profile=staging", "--config=lint.toml", "a.json", "b.json"});
    ASSERT_TRUE(is_ok(result));
    const auto& options = unwrap(result);
    EXPECT_EQ(options.profile, "staging");
    EXPECT_EQ(options.config_path, "lint.toml");
    EXPECT_EQ(options.files, (std::vector<std::string>{"a.json", "b.json"}));
}

TEST(LintArgsTest, LogOptionsAreSkipped) {
    auto result = parse_args({"-vv", "--log-filter=lint=debug", "a.json"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).files, (std::vector<std::string>{"a.json"}));
}

TEST(LintArgsTest, DoubleDashEndsOptions) {
    auto result = parse_args({"--", "--odd-name.json"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).files, (std::vector<std::string>{"--odd-name.json"}));
}

TEST(LintArgsTest, HelpAndVersionNeedNoFiles) {
    auto help = parse_args({"--help"});
    ASSERT_TRUE(is_ok(help));
    EXPECT_TRUE(unwrap(help).show_help);

    auto version = parse_args({"--version"});
    ASSERT_TRUE(is_ok(version));
    EXPECT_TRUE(unwrap(version).show_version);
}

TEST(LintArgsTest, Errors) {
    auto none = parse_args({});
    ASSERT_TRUE(is_err(none));
    EXPECT_EQ(unwrap_err(none), "no input files");

    auto unknown = parse_args({"--fast", "a.json"});
    ASSERT_TRUE(is_err(unknown));
    EXPECT_EQ(unwrap_err(unknown), "unknown option '--fast'");
}

// ============================================================================
// Runs
// ============================================================================

TEST_F(LintRunTest, AllValid) {
    LintOptions options;
    options.files = {write_file("a.json", R"({"a": [1, 2]})"), write_file("b.json", "[]")};

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_lint(options, out, err), EXIT_VALID);
    EXPECT_EQ(out.str(), options.files[0] + ": OK\n" + options.files[1] + ": OK\n");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(LintRunTest, ReportsEachInvalidFile) {
    LintOptions options;
    options.files = {write_file("good.json", "{}"), write_file("bad.json", R"({"a": 1,})"),
                     (dir_ / "missing.json").string()};

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_lint(options, out, err), EXIT_INVALID);

    std::string report = out.str();
    EXPECT_NE(report.find(options.files[0] + ": OK"), std::string::npos);
    EXPECT_NE(report.find(options.files[1] + ": [P001] line 1, column 9: trailing comma in object"),
              std::string::npos);
    EXPECT_NE(report.find(options.files[2] + ": cannot read file"), std::string::npos);
}

TEST_F(LintRunTest, ProfileLimitsApply) {
    LintOptions options;
    options.files = {write_file("deep.json", R"({"a": {"b": {"c": 1}}})")};
    options.config_path = write_file("lint.toml", "[profile.shallow]\nmax_nesting_depth = 2\n");

    std::ostringstream out;
    std::ostringstream err;

    options.profile = "shallow";
    EXPECT_EQ(run_lint(options, out, err), EXIT_INVALID);
    EXPECT_NE(out.str().find("[G002]"), std::string::npos);

    out.str("");
    options.profile = "development";
    EXPECT_EQ(run_lint(options, out, err), EXIT_VALID);
}

TEST_F(LintRunTest, DecoderSectionAppliesWithoutProfile) {
    unsetenv("STRICTJSON_PROFILE");

    LintOptions options;
    options.files = {write_file("nested.json", "[[[[1]]]]")};
    options.config_path = write_file("lint.toml", "[decoder]\nmax_nesting_depth = 2\n");

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_lint(options, out, err), EXIT_INVALID);
    EXPECT_NE(out.str().find("[G002]"), std::string::npos);

    out.str("");
    options.profile = "production";
    EXPECT_EQ(run_lint(options, out, err), EXIT_VALID);
}

TEST_F(LintRunTest, UnknownProfileIsUsageError) {
    LintOptions options;
    options.files = {write_file("a.json", "{}")};
    options.profile = "nightly";

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_lint(options, out, err), EXIT_USAGE);
    EXPECT_EQ(err.str(), "error: unknown profile 'nightly'\n");
    EXPECT_TRUE(out.str().empty());
}

TEST_F(LintRunTest, BadConfigIsUsageError) {
    LintOptions options;
    options.files = {write_file("a.json", "{}")};
    options.config_path = write_file("lint.toml", "[decoder]\nmax_depth = 3\n");

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(run_lint(options, out, err), EXIT_USAGE);
    EXPECT_NE(err.str().find("Line 2: Unknown key 'max_depth'"), std::string::npos);
}
