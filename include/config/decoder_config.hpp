//! # Decoder Configuration
//!
//! Limits, unknown-field policy and timeout for one `StrictDecoder`, with
//! built-in environment profiles and a small TOML config file format.
//!
//! ## Profiles
//!
//! | Profile | Payload | Depth | Array elements | String length |
//! |---------|---------|-------|----------------|---------------|
//! | `development` | 50 MiB | 10 | 100,000 | 10 MiB |
//! | `staging` | 10 MiB | 10 | 10,000 | 1 MiB |
//! | `production` | 10 MiB | 10 | 10,000 | 1 MiB |
//!
//! Unknown fields are rejected in every profile.
//!
//! ## Config File
//!
//! ```toml
//! # strictjson.toml
//! [decoder]
//! max_payload_bytes = 1048576
//! unknown_field_policy = "reject"
//!
//! [profile.development]
//! max_array_elements = 500000
//! timeout_ms = 2000
//! ```
//!
//! A `[profile.<name>]` section starts from the built-in profile of the
//! same name, or from `[decoder]` for other names, and overrides the keys
//! it lists. `[decoder]` must come before any profile section that relies
//! on it.

#pragma once

#include "bind/binder.hpp"
#include "json/json_limits.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace strictjson::config {

/// Environment variable naming the active profile.
constexpr const char* PROFILE_ENV_VAR = "STRICTJSON_PROFILE";

/// Profile used when nothing else selects one.
constexpr const char* DEFAULT_PROFILE = "production";

/// Everything a `StrictDecoder` needs besides the schema.
struct DecoderConfig {
    json::LimitConfig limits;
    bind::UnknownFieldPolicy unknown_fields = bind::UnknownFieldPolicy::Reject;

    /// Per-call deadline; unset means no timeout.
    std::optional<std::chrono::milliseconds> timeout;

    /// The production profile.
    [[nodiscard]] static auto defaults() -> DecoderConfig;

    [[nodiscard]] static auto development() -> DecoderConfig;
    [[nodiscard]] static auto staging() -> DecoderConfig;
    [[nodiscard]] static auto production() -> DecoderConfig;

    /// Returns the built-in profile called `name`, if there is one.
    [[nodiscard]] static auto for_profile(std::string_view name) -> std::optional<DecoderConfig>;

    /// Returns an error message if the configuration is unusable.
    [[nodiscard]] auto validate() const -> std::optional<std::string>;

    /// Binder settings derived from this configuration.
    [[nodiscard]] auto bind_options() const -> bind::BindOptions;

    [[nodiscard]] auto operator==(const DecoderConfig& other) const -> bool = default;
};

/// Returns the profile somebody asked for: `explicit_name` if non-empty,
/// then the `STRICTJSON_PROFILE` environment variable. Empty when neither
/// names one.
[[nodiscard]] auto requested_profile(std::string_view explicit_name) -> std::optional<std::string>;

/// Chooses a profile name: `requested_profile()`, then `production`.
[[nodiscard]] auto select_profile(std::string_view explicit_name) -> std::string;

// ============================================================================
// Config File
// ============================================================================

/// A parsed config file.
struct ConfigFile {
    /// The `[decoder]` section (built-in defaults when absent).
    DecoderConfig decoder = DecoderConfig::defaults();

    /// `[profile.<name>]` sections, fully resolved.
    std::map<std::string, DecoderConfig> profiles;

    /// Returns the configuration for `name`: the file's own profile
    /// section, else the built-in profile, else `std::nullopt`. An empty
    /// name selects `[decoder]`.
    [[nodiscard]] auto resolve(std::string_view name) const -> std::optional<DecoderConfig>;

    /// Reads and parses `path`. On failure returns `std::nullopt` and,
    /// when `error` is non-null, stores a line-tagged message in it.
    [[nodiscard]] static auto load(const std::filesystem::path& path, std::string* error = nullptr)
        -> std::optional<ConfigFile>;
};

/// Parser for the config file subset of TOML: sections, `key = value`
/// lines with integer or double-quoted string values, and `#` comments.
class ConfigParser {
public:
    explicit ConfigParser(std::string_view content);

    [[nodiscard]] auto parse() -> std::optional<ConfigFile>;

    /// The error from the last failed `parse()`, e.g. `Line 3: unknown key 'foo'`.
    [[nodiscard]] auto error() const -> const std::string& {
        return error_message_;
    }

private:
    std::string_view content_;
    size_t pos_ = 0;
    size_t line_ = 1;
    std::string error_message_;

    [[nodiscard]] auto peek() const -> char {
        return pos_ < content_.size() ? content_[pos_] : '\0';
    }
    [[nodiscard]] auto is_eof() const -> bool {
        return pos_ >= content_.size();
    }
    auto advance() -> char;

    /// Skips blanks on the current line.
    void skip_blanks();
    /// Skips whitespace, newlines and comments.
    void skip_trivia();
    auto expect_line_end() -> bool;

    auto parse_identifier() -> std::string;
    auto parse_section_header() -> std::optional<std::string>;
    auto parse_string() -> std::optional<std::string>;
    auto parse_integer() -> std::optional<size_t>;
    auto parse_entry(DecoderConfig& target) -> bool;

    void set_error(const std::string& message);
};

} // namespace strictjson::config
