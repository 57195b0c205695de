//! # Decode Error Types
//!
//! This module provides the single error type returned by every stage of the
//! decoding pipeline: lexing, limit checks, parsing, schema registration and
//! binding.
//!
//! ## Features
//!
//! - **Closed taxonomy**: `ErrorKind` enumerates every failure the pipeline can report
//! - **Location tracking**: Line, column, and byte offset of the offending input
//! - **Field paths**: Dotted/indexed path such as `order.items[2].sku`
//! - **Expected vs. found**: Both sides of a mismatch, plus a remediation hint
//! - **Stable codes**: Each kind maps to a short code (`L001`, `B003`, ...)
//!
//! ## Error Codes
//!
//! | Code | Kind | Stage |
//! |------|------|-------|
//! | `L001` | `LexError` | Tokenizer |
//! | `P001` | `SyntaxError` | Parser |
//! | `P002` | `DuplicateField` | Parser |
//! | `G001` | `PayloadTooLarge` | Limit guard |
//! | `G002` | `NestingTooDeep` | Limit guard / binder |
//! | `G003` | `ArrayTooLarge` | Limit guard |
//! | `G004` | `StringTooLong` | Limit guard |
//! | `B001` | `TypeMismatch` | Binder |
//! | `B002` | `UnexpectedNull` | Binder |
//! | `B003` | `MissingRequiredField` | Binder |
//! | `B004` | `UnknownField` | Binder |
//! | `B005` | `InvalidDateFormat` | Binder |
//! | `S001` | `SchemaError` | Registry |
//! | `C001` | `Cancelled` | Any |
//!
//! ## Example
//!
//! ```cpp
//! auto error = DecodeError::make(ErrorKind::TypeMismatch, "wrong type for field")
//!                  .at(SourcePos{1, 9, 8})
//!                  .with_path("age")
//!                  .expected_found("integer", "string")
//!                  .with_hint("remove the quotes around the numeric value");
//! std::cerr << error.to_string() << std::endl;
//! // [B001] line 1, column 9: wrong type for field (at 'age'): expected integer, found string;
//! // hint: remove the quotes around the numeric value
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace strictjson::json {

/// A position in the input buffer.
///
/// `line` and `column` are 1-based; `offset` is the 0-based byte offset.
/// A default-constructed position (`line == 0`) means "unknown".
struct SourcePos {
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    [[nodiscard]] auto is_known() const -> bool {
        return line > 0;
    }
};

/// Every failure the decoding pipeline can report.
enum class ErrorKind : uint8_t {
    LexError,             ///< Malformed token, invalid UTF-8, forbidden number form
    SyntaxError,          ///< Grammar violation, trailing content after the root value
    DuplicateField,       ///< The same key appears twice in one object
    PayloadTooLarge,      ///< Input exceeds `max_payload_bytes`
    NestingTooDeep,       ///< Structural or schema depth exceeds `max_nesting_depth`
    ArrayTooLarge,        ///< Array exceeds `max_array_elements`
    StringTooLong,        ///< Decoded string exceeds `max_string_length`
    TypeMismatch,         ///< Value present but of the wrong JSON kind or out of range
    UnexpectedNull,       ///< Explicit `null` on a non-nullable field
    MissingRequiredField, ///< Required field absent
    UnknownField,         ///< Key with no declared field (strict mode)
    InvalidDateFormat,    ///< Timestamp text not in `YYYY-MM-DDTHH:mm:ss(.fff)?Z` form
    SchemaError,          ///< Registration-time schema defect
    Cancelled             ///< Caller-requested abort or deadline reached
};

/// Coarse grouping of error kinds.
enum class ErrorCategory : uint8_t {
    Lexical,
    Syntax,
    Limit,
    Binding,
    Schema,
    Cancellation
};

/// Returns the kind name, e.g. `"TypeMismatch"`.
[[nodiscard]] auto kind_name(ErrorKind kind) -> const char*;

/// Returns the stable short code for a kind, e.g. `"B001"`.
[[nodiscard]] auto error_code(ErrorKind kind) -> const char*;

/// Returns the category a kind belongs to.
[[nodiscard]] auto category_of(ErrorKind kind) -> ErrorCategory;

/// An error produced by any stage of the decoding pipeline.
///
/// Built with `make()` and refined with the chaining setters. All fields
/// other than `kind` and `message` are optional and omitted from
/// `to_string()` when empty.
struct DecodeError {
    /// What went wrong.
    ErrorKind kind = ErrorKind::SyntaxError;

    /// Human-readable error description.
    std::string message;

    /// Field path of the offending value (empty at the document root).
    std::string path;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset in input where the error occurred.
    size_t offset = 0;

    /// Description of what the schema or grammar expected.
    std::string expected;

    /// Description of what was actually found.
    std::string actual;

    /// One-line remediation suggestion.
    std::string hint;

    /// Creates an error with kind and message only.
    static auto make(ErrorKind kind, std::string msg) -> DecodeError {
        DecodeError error;
        error.kind = kind;
        error.message = std::move(msg);
        return error;
    }

    /// Creates an error with full location information.
    static auto make(ErrorKind kind, std::string msg, SourcePos pos) -> DecodeError {
        DecodeError error = make(kind, std::move(msg));
        error.line = pos.line;
        error.column = pos.column;
        error.offset = pos.offset;
        return error;
    }

    auto at(SourcePos pos) && -> DecodeError&& {
        line = pos.line;
        column = pos.column;
        offset = pos.offset;
        return std::move(*this);
    }

    auto with_path(std::string p) && -> DecodeError&& {
        path = std::move(p);
        return std::move(*this);
    }

    auto expected_found(std::string exp, std::string found) && -> DecodeError&& {
        expected = std::move(exp);
        actual = std::move(found);
        return std::move(*this);
    }

    auto with_hint(std::string h) && -> DecodeError&& {
        hint = std::move(h);
        return std::move(*this);
    }

    [[nodiscard]] auto code() const -> const char* {
        return error_code(kind);
    }

    [[nodiscard]] auto category() const -> ErrorCategory {
        return category_of(kind);
    }

    [[nodiscard]] auto position() const -> SourcePos {
        return SourcePos{line, column, offset};
    }

    /// Formats the error as a single human-readable line.
    ///
    /// Layout: `[CODE] line L, column C: message (at 'path'): expected X, found Y; hint: H`
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace strictjson::json
