//! # Structural Parser
//!
//! Recursive-descent parser from tokens to a `JsonValue` tree. It enforces
//! the grammar strictly and applies every limit from the `LimitGuard` while
//! the tree is still being built.
//!
//! ## Rejected Structures
//!
//! - Trailing commas in objects and arrays
//! - Duplicate keys in one object (`DuplicateField`, reported at the second key)
//! - Non-string object keys
//! - Any content after the root value
//! - Empty input
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"name": "Ada", "tags": ["x"]})", LimitConfig{});
//! if (is_ok(result)) {
//!     const JsonValue& root = unwrap(result);
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#pragma once

#include "common.hpp"
#include "common/cancellation.hpp"
#include "json/json_error.hpp"
#include "json/json_lexer.hpp"
#include "json/json_limits.hpp"
#include "json/json_value.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace strictjson::json {

/// Strict JSON parser.
///
/// One parser handles one input; it is not reusable and not thread-safe.
/// Independent parsers on separate threads share nothing.
class JsonParser {
public:
    /// Tokens processed between cancellation polls.
    static constexpr size_t CANCEL_POLL_INTERVAL = 256;

    /// Creates a parser over `input`. `cancel` may be null.
    JsonParser(std::string_view input, const LimitConfig& limits,
               const CancellationToken* cancel = nullptr);

    /// Parses the whole input into a single root value.
    ///
    /// # Returns
    ///
    /// `Ok(JsonValue)` on success, `Err(DecodeError)` with the first
    /// violation found otherwise.
    [[nodiscard]] auto parse() -> Result<JsonValue, DecodeError>;

private:
    std::string_view input_;
    LimitGuard guard_;
    JsonLexer lexer_;
    JsonToken current_;
    const CancellationToken* cancel_;
    size_t token_count_ = 0;
    std::optional<DecodeError> interrupted_;

    /// Path of the value currently being parsed, e.g. `items[2].name`.
    std::string path_;

    void advance();
    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool;

    /// Returns `true` (and records a `Cancelled` error) once the token fires.
    auto poll_cancelled() -> bool;

    /// Converts the current `Error` token into its `DecodeError`.
    [[nodiscard]] auto token_error() const -> DecodeError;

    /// Creates a `SyntaxError` at the current token.
    [[nodiscard]] auto unexpected(const std::string& msg, const std::string& expected) const
        -> DecodeError;

    auto parse_value() -> Result<JsonValue, DecodeError>;
    auto parse_object() -> Result<JsonValue, DecodeError>;
    auto parse_array() -> Result<JsonValue, DecodeError>;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Parses `input` with the given limits.
///
/// This is the main entry point of the parsing stage; the payload size is
/// checked before any byte is tokenized.
[[nodiscard]] auto parse_json(std::string_view input, const LimitConfig& limits,
                              const CancellationToken* cancel = nullptr)
    -> Result<JsonValue, DecodeError>;

/// Joins a parent path and an object key: `("a", "b")` gives `a.b`.
[[nodiscard]] auto join_path(const std::string& parent, std::string_view key) -> std::string;

/// Joins a parent path and an array index: `("a", 2)` gives `a[2]`.
[[nodiscard]] auto index_path(const std::string& parent, size_t index) -> std::string;

} // namespace strictjson::json
