//! # JSON Tokenizer
//!
//! This module provides the strict tokenizer that turns raw bytes into JSON
//! tokens. It accepts exactly the RFC 8259 lexical forms, minus exponent
//! notation, and validates UTF-8 as it goes.
//!
//! ## Accepted Forms
//!
//! | Token | Description | Example |
//! |-------|-------------|---------|
//! | `LBrace` / `RBrace` | Object delimiters | `{` `}` |
//! | `LBracket` / `RBracket` | Array delimiters | `[` `]` |
//! | `Colon` | Key-value separator | `:` |
//! | `Comma` | Element separator | `,` |
//! | `String` | Double-quoted string | `"café"` |
//! | `Number` | `-?(0|[1-9][0-9]*)(\.[0-9]+)?` | `-12.50` |
//! | `True` / `False` / `Null` | Lowercase literals | `true` |
//!
//! ## Rejected Forms
//!
//! Single quotes, unquoted keys, comments, leading zeros (`012`), exponents
//! (`1e5`), a leading `+` or `.`, uppercase literals, raw control characters
//! inside strings, unpaired surrogate escapes, and any invalid UTF-8 byte
//! sequence. Each produces an `Error` token and a `LexError` (or
//! `StringTooLong` when a string outgrows the limit guard).
//!
//! ## Example
//!
//! ```cpp
//! LimitConfig limits;
//! LimitGuard guard(limits);
//! JsonLexer lexer(R"({"key": 42})", guard);
//! while (true) {
//!     JsonToken tok = lexer.next_token();
//!     if (tok.kind == JsonTokenKind::Eof || tok.kind == JsonTokenKind::Error) break;
//! }
//! ```

#pragma once

#include "json/json_error.hpp"
#include "json/json_limits.hpp"
#include "json/json_value.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace strictjson::json {

// ============================================================================
// Token Types
// ============================================================================

/// Token types produced by the tokenizer.
enum class JsonTokenKind : uint8_t {
    // Structural tokens
    LBrace,   ///< `{` - Start of object
    RBrace,   ///< `}` - End of object
    LBracket, ///< `[` - Start of array
    RBracket, ///< `]` - End of array
    Colon,    ///< `:` - Key-value separator
    Comma,    ///< `,` - Element separator

    // Value tokens
    String, ///< `"..."` - String literal
    Number, ///< `123`, `-4.5` - Number literal
    True,   ///< `true`
    False,  ///< `false`
    Null,   ///< `null`

    // Special tokens
    Eof,  ///< End of input
    Error ///< Tokenizer error (see `JsonLexer::error()`)
};

/// Returns a short description of a token kind for error messages.
[[nodiscard]] auto token_kind_name(JsonTokenKind kind) -> const char*;

/// A token produced by the tokenizer.
struct JsonToken {
    /// The type of this token.
    JsonTokenKind kind = JsonTokenKind::Eof;

    /// The original text of this token (view into the input).
    std::string_view lexeme;

    /// Where this token starts.
    SourcePos pos;

    /// For `String` tokens: the unescaped content.
    std::string string_value;

    /// For `Number` tokens: the validated number text.
    JsonNumber number_value;
};

// ============================================================================
// Lexer
// ============================================================================

/// Strict JSON tokenizer.
///
/// Produces one token per `next_token()` call. The sequence is finite and
/// not restartable; after an `Error` token the lexer stays in the error
/// state and keeps returning `Error`.
///
/// The lexer borrows `input` and `guard`; both must outlive it.
class JsonLexer {
public:
    JsonLexer(std::string_view input, const LimitGuard& guard);

    /// Returns the next token from the input.
    auto next_token() -> JsonToken;

    /// Returns the error behind the most recent `Error` token.
    [[nodiscard]] auto error() const -> const std::optional<DecodeError>& {
        return error_;
    }

    /// Current byte offset into the input.
    [[nodiscard]] auto offset() const -> size_t {
        return pos_;
    }

private:
    std::string_view input_;
    const LimitGuard& guard_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    std::optional<DecodeError> error_;

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_at(size_t ahead) const -> char;
    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    [[nodiscard]] auto here() const -> SourcePos {
        return SourcePos{line_, column_, pos_};
    }

    auto advance() -> char;
    void skip_whitespace();

    auto make_token(JsonTokenKind kind, size_t start_pos, SourcePos start) -> JsonToken;
    auto fail(ErrorKind kind, std::string msg, SourcePos at, std::string hint = {}) -> JsonToken;
    auto string_too_long(size_t length, SourcePos start) -> JsonToken;

    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_literal() -> JsonToken;

    /// Reads the four hex digits of a `\u` escape; returns `std::nullopt` on bad input.
    auto read_hex4() -> std::optional<uint32_t>;

    /// Copies one multi-byte UTF-8 sequence into `out`. Returns `false` if
    /// the bytes at the current position are not well-formed UTF-8.
    auto copy_utf8_sequence(std::string& out) -> bool;
};

} // namespace strictjson::json
