//! # Structural Parser Implementation

#include "json/json_parser.hpp"

#include <utility>

namespace strictjson::json {

auto join_path(const std::string& parent, std::string_view key) -> std::string {
    if (parent.empty()) {
        return std::string(key);
    }
    std::string path = parent;
    path += '.';
    path += key;
    return path;
}

auto index_path(const std::string& parent, size_t index) -> std::string {
    return parent + "[" + std::to_string(index) + "]";
}

JsonParser::JsonParser(std::string_view input, const LimitConfig& limits,
                       const CancellationToken* cancel)
    : input_(input), guard_(limits), lexer_(input, guard_), cancel_(cancel) {
    advance();
}

// ============================================================================
// Token Helpers
// ============================================================================

void JsonParser::advance() {
    current_ = lexer_.next_token();
    ++token_count_;
    if (token_count_ % CANCEL_POLL_INTERVAL == 0) {
        poll_cancelled();
    }
}

auto JsonParser::check(JsonTokenKind kind) const -> bool {
    return current_.kind == kind;
}

auto JsonParser::poll_cancelled() -> bool {
    if (interrupted_) {
        return true;
    }
    if (cancel_ == nullptr || !cancel_->is_cancelled()) {
        return false;
    }
    interrupted_ = DecodeError::make(ErrorKind::Cancelled, "decoding was cancelled", current_.pos)
                       .with_path(path_);
    current_.kind = JsonTokenKind::Error;
    return true;
}

auto JsonParser::token_error() const -> DecodeError {
    if (interrupted_) {
        return *interrupted_;
    }
    if (lexer_.error()) {
        DecodeError error = *lexer_.error();
        if (error.path.empty()) {
            error.path = path_;
        }
        return error;
    }
    return DecodeError::make(ErrorKind::LexError, "invalid token", current_.pos).with_path(path_);
}

auto JsonParser::unexpected(const std::string& msg, const std::string& expected) const
    -> DecodeError {
    if (current_.kind == JsonTokenKind::Error) {
        return token_error();
    }
    return DecodeError::make(ErrorKind::SyntaxError, msg, current_.pos)
        .with_path(path_)
        .expected_found(expected, token_kind_name(current_.kind));
}

// ============================================================================
// Grammar
// ============================================================================

auto JsonParser::parse() -> Result<JsonValue, DecodeError> {
    if (check(JsonTokenKind::Eof)) {
        return DecodeError::make(ErrorKind::SyntaxError, "empty input", current_.pos)
            .expected_found("a JSON value", "end of input");
    }

    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }

    if (!check(JsonTokenKind::Eof)) {
        return unexpected("unexpected content after the root value", "end of input");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, DecodeError> {
    SourcePos pos = current_.pos;

    switch (current_.kind) {
    case JsonTokenKind::Null:
        advance();
        return JsonValue::null_at(pos);

    case JsonTokenKind::True:
        advance();
        return JsonValue(true, pos);

    case JsonTokenKind::False:
        advance();
        return JsonValue(false, pos);

    case JsonTokenKind::Number: {
        JsonNumber number = std::move(current_.number_value);
        advance();
        return JsonValue(std::move(number), pos);
    }

    case JsonTokenKind::String: {
        std::string value = std::move(current_.string_value);
        advance();
        return JsonValue(std::move(value), pos);
    }

    case JsonTokenKind::LBrace:
        return parse_object();

    case JsonTokenKind::LBracket:
        return parse_array();

    case JsonTokenKind::Error:
        return token_error();

    case JsonTokenKind::Eof:
        return unexpected("unexpected end of input", "a JSON value");

    default:
        return unexpected("unexpected token", "a JSON value");
    }
}

/// Parses a JSON object (`{...}`).
///
/// Expects the current token to be `{`. Each key is checked against the
/// keys seen so far; the first repeat fails with `DuplicateField`.
auto JsonParser::parse_object() -> Result<JsonValue, DecodeError> {
    SourcePos pos = current_.pos;
    if (poll_cancelled()) {
        return token_error();
    }
    if (auto err = guard_.enter_scope(pos, path_)) {
        return std::move(*err);
    }
    advance(); // Skip '{'

    JsonObject obj;
    const std::string parent = path_;

    if (check(JsonTokenKind::RBrace)) {
        advance();
        guard_.exit_scope();
        return JsonValue(std::move(obj), pos);
    }

    while (true) {
        if (!check(JsonTokenKind::String)) {
            return unexpected("expected a string key in object", "string key");
        }
        std::string key = std::move(current_.string_value);
        SourcePos key_pos = current_.pos;
        advance();

        if (obj.contains(key)) {
            return DecodeError::make(ErrorKind::DuplicateField,
                                     "duplicate key '" + key + "' in object", key_pos)
                .with_path(join_path(parent, key))
                .with_hint("each key may appear only once per object");
        }

        if (!check(JsonTokenKind::Colon)) {
            path_ = join_path(parent, key);
            return unexpected("expected ':' after object key", "':'");
        }
        advance();

        path_ = join_path(parent, key);
        auto value_result = parse_value();
        path_ = parent;
        if (is_err(value_result)) {
            return value_result;
        }
        obj.insert(std::move(key), key_pos, std::move(unwrap(value_result)));

        if (check(JsonTokenKind::Comma)) {
            advance();
            if (check(JsonTokenKind::RBrace)) {
                return DecodeError::make(ErrorKind::SyntaxError, "trailing comma in object",
                                         current_.pos)
                    .with_path(parent)
                    .expected_found("string key", "'}'")
                    .with_hint("remove the comma before '}'");
            }
        } else if (check(JsonTokenKind::RBrace)) {
            advance();
            guard_.exit_scope();
            return JsonValue(std::move(obj), pos);
        } else {
            return unexpected("expected ',' or '}' in object", "',' or '}'");
        }
    }
}

/// Parses a JSON array (`[...]`).
///
/// Fails with `ArrayTooLarge` at the first element past the limit, before
/// that element is parsed.
auto JsonParser::parse_array() -> Result<JsonValue, DecodeError> {
    SourcePos pos = current_.pos;
    if (poll_cancelled()) {
        return token_error();
    }
    if (auto err = guard_.enter_scope(pos, path_)) {
        return std::move(*err);
    }
    advance(); // Skip '['

    JsonArray arr;
    const std::string parent = path_;

    if (check(JsonTokenKind::RBracket)) {
        advance();
        guard_.exit_scope();
        return JsonValue(std::move(arr), pos);
    }

    while (true) {
        if (auto err = guard_.check_array_count(arr.size() + 1, current_.pos, parent)) {
            return std::move(*err);
        }

        path_ = index_path(parent, arr.size());
        auto value_result = parse_value();
        path_ = parent;
        if (is_err(value_result)) {
            return value_result;
        }
        arr.push_back(std::move(unwrap(value_result)));

        if (check(JsonTokenKind::Comma)) {
            advance();
            if (check(JsonTokenKind::RBracket)) {
                return DecodeError::make(ErrorKind::SyntaxError, "trailing comma in array",
                                         current_.pos)
                    .with_path(parent)
                    .expected_found("a JSON value", "']'")
                    .with_hint("remove the comma before ']'");
            }
        } else if (check(JsonTokenKind::RBracket)) {
            advance();
            guard_.exit_scope();
            return JsonValue(std::move(arr), pos);
        } else {
            return unexpected("expected ',' or ']' in array", "',' or ']'");
        }
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto parse_json(std::string_view input, const LimitConfig& limits,
                const CancellationToken* cancel) -> Result<JsonValue, DecodeError> {
    LimitGuard guard(limits);
    if (auto err = guard.check_payload(input.size())) {
        return std::move(*err);
    }
    JsonParser parser(input, limits, cancel);
    return parser.parse();
}

} // namespace strictjson::json
