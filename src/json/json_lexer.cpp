//! # JSON Tokenizer Implementation
//!
//! Single-pass scanner over the input bytes. Columns count code points, so
//! multi-byte UTF-8 sequences advance the column once.

#include "json/json_lexer.hpp"

namespace strictjson::json {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_alpha(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_continuation(unsigned char c) -> bool {
    return (c & 0xC0) == 0x80;
}

/// Appends the UTF-8 encoding of `cp` to `out`.
void encode_utf8(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto describe_char(char c) -> std::string {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte >= 0x7F) {
        static constexpr char HEX[] = "0123456789ABCDEF";
        std::string out = "byte 0x";
        out += HEX[byte >> 4];
        out += HEX[byte & 0x0F];
        return out;
    }
    return std::string("'") + c + "'";
}

} // anonymous namespace

auto token_kind_name(JsonTokenKind kind) -> const char* {
    switch (kind) {
    case JsonTokenKind::LBrace:
        return "'{'";
    case JsonTokenKind::RBrace:
        return "'}'";
    case JsonTokenKind::LBracket:
        return "'['";
    case JsonTokenKind::RBracket:
        return "']'";
    case JsonTokenKind::Colon:
        return "':'";
    case JsonTokenKind::Comma:
        return "','";
    case JsonTokenKind::String:
        return "string";
    case JsonTokenKind::Number:
        return "number";
    case JsonTokenKind::True:
        return "'true'";
    case JsonTokenKind::False:
        return "'false'";
    case JsonTokenKind::Null:
        return "'null'";
    case JsonTokenKind::Eof:
        return "end of input";
    case JsonTokenKind::Error:
        return "invalid token";
    }
    return "unknown token";
}

JsonLexer::JsonLexer(std::string_view input, const LimitGuard& guard)
    : input_(input), guard_(guard) {}

// ============================================================================
// Character Access
// ============================================================================

auto JsonLexer::peek() const -> char {
    return at_end() ? '\0' : input_[pos_];
}

auto JsonLexer::peek_at(size_t ahead) const -> char {
    size_t idx = pos_ + ahead;
    return idx < input_.size() ? input_[idx] : '\0';
}

auto JsonLexer::advance() -> char {
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else if (!is_continuation(static_cast<unsigned char>(c))) {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t start_pos, SourcePos start) -> JsonToken {
    JsonToken token;
    token.kind = kind;
    token.lexeme = input_.substr(start_pos, pos_ - start_pos);
    token.pos = start;
    return token;
}

auto JsonLexer::fail(ErrorKind kind, std::string msg, SourcePos at, std::string hint)
    -> JsonToken {
    error_ = DecodeError::make(kind, std::move(msg), at);
    error_->hint = std::move(hint);
    JsonToken token;
    token.kind = JsonTokenKind::Error;
    token.pos = at;
    return token;
}

auto JsonLexer::string_too_long(size_t length, SourcePos start) -> JsonToken {
    if (auto err = guard_.check_string_length(length, start)) {
        error_ = std::move(*err);
    } else {
        error_ = DecodeError::make(ErrorKind::StringTooLong,
                                   "string exceeds the configured length limit", start);
    }
    JsonToken token;
    token.kind = JsonTokenKind::Error;
    token.pos = start;
    return token;
}

// ============================================================================
// Main Dispatch
// ============================================================================

auto JsonLexer::next_token() -> JsonToken {
    if (error_) {
        JsonToken token;
        token.kind = JsonTokenKind::Error;
        token.pos = error_->position();
        return token;
    }

    skip_whitespace();
    SourcePos start = here();
    if (at_end()) {
        return make_token(JsonTokenKind::Eof, pos_, start);
    }

    size_t start_pos = pos_;
    char c = peek();
    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start_pos, start);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start_pos, start);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start_pos, start);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start_pos, start);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start_pos, start);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start_pos, start);
    case '"':
        return scan_string();
    case '\'':
        return fail(ErrorKind::LexError, "single-quoted strings are not allowed", start,
                    "use double quotes");
    case '/':
        return fail(ErrorKind::LexError, "comments are not allowed", start);
    case '+':
        return fail(ErrorKind::LexError, "numbers must not start with '+'", start,
                    "remove the leading '+'");
    case '.':
        return fail(ErrorKind::LexError, "numbers must start with a digit", start,
                    "write a leading zero, e.g. 0.5");
    default:
        break;
    }

    if (c == '-' || is_digit(c)) {
        return scan_number();
    }
    if (is_alpha(c)) {
        return scan_literal();
    }
    return fail(ErrorKind::LexError, "unexpected " + describe_char(c), start);
}

// ============================================================================
// Strings
// ============================================================================

auto JsonLexer::scan_string() -> JsonToken {
    SourcePos start = here();
    size_t start_pos = pos_;
    advance(); // opening quote

    std::string value;
    while (true) {
        if (at_end()) {
            return fail(ErrorKind::LexError, "unterminated string", start,
                        "close the string with '\"'");
        }
        if (!guard_.string_fits(value.size())) {
            return string_too_long(value.size(), start);
        }

        char c = peek();
        auto byte = static_cast<unsigned char>(c);
        if (c == '"') {
            advance();
            break;
        }
        if (byte < 0x20) {
            return fail(ErrorKind::LexError,
                        "unescaped control character " + describe_char(c) + " in string", here(),
                        "escape control characters, e.g. \\n or \\u0001");
        }
        if (byte >= 0x80) {
            SourcePos at = here();
            if (!copy_utf8_sequence(value)) {
                return fail(ErrorKind::LexError, "invalid UTF-8 sequence in string", at);
            }
            continue;
        }
        if (c != '\\') {
            value += advance();
            continue;
        }

        SourcePos escape_pos = here();
        advance(); // backslash
        if (at_end()) {
            return fail(ErrorKind::LexError, "unterminated escape sequence", escape_pos);
        }
        char esc = advance();
        switch (esc) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto cp = read_hex4();
            if (!cp) {
                return fail(ErrorKind::LexError, "invalid \\u escape, expected 4 hex digits",
                            escape_pos);
            }
            uint32_t code = *cp;
            if (code >= 0xDC00 && code <= 0xDFFF) {
                return fail(ErrorKind::LexError, "unpaired low surrogate in \\u escape",
                            escape_pos);
            }
            if (code >= 0xD800 && code <= 0xDBFF) {
                if (peek() != '\\' || peek_at(1) != 'u') {
                    return fail(ErrorKind::LexError, "unpaired high surrogate in \\u escape",
                                escape_pos);
                }
                advance();
                advance();
                auto low = read_hex4();
                if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                    return fail(ErrorKind::LexError,
                                "high surrogate must be followed by a low surrogate escape",
                                escape_pos);
                }
                code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
            }
            encode_utf8(code, value);
            break;
        }
        default:
            return fail(ErrorKind::LexError,
                        std::string("invalid escape sequence '\\") + esc + "'", escape_pos);
        }
    }

    if (!guard_.string_fits(value.size())) {
        return string_too_long(value.size(), start);
    }

    JsonToken token = make_token(JsonTokenKind::String, start_pos, start);
    token.string_value = std::move(value);
    return token;
}

auto JsonLexer::read_hex4() -> std::optional<uint32_t> {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        if (at_end()) {
            return std::nullopt;
        }
        int digit = hex_value(peek());
        if (digit < 0) {
            return std::nullopt;
        }
        advance();
        value = (value << 4) | static_cast<uint32_t>(digit);
    }
    return value;
}

auto JsonLexer::copy_utf8_sequence(std::string& out) -> bool {
    auto lead = static_cast<unsigned char>(peek());
    size_t length = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            min_second = 0xA0; // overlong
        } else if (lead == 0xED) {
            max_second = 0x9F; // UTF-16 surrogates
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            min_second = 0x90; // overlong
        } else if (lead == 0xF4) {
            max_second = 0x8F; // above U+10FFFF
        }
    } else {
        return false;
    }

    if (pos_ + length > input_.size()) {
        return false;
    }
    auto second = static_cast<unsigned char>(peek_at(1));
    if (second < min_second || second > max_second) {
        return false;
    }
    for (size_t i = 2; i < length; ++i) {
        if (!is_continuation(static_cast<unsigned char>(peek_at(i)))) {
            return false;
        }
    }
    for (size_t i = 0; i < length; ++i) {
        out += advance();
    }
    return true;
}

// ============================================================================
// Numbers
// ============================================================================

auto JsonLexer::scan_number() -> JsonToken {
    SourcePos start = here();
    size_t start_pos = pos_;
    bool has_fraction = false;

    if (peek() == '-') {
        advance();
    }
    if (!is_digit(peek())) {
        return fail(ErrorKind::LexError, "expected a digit after '-'", start);
    }
    if (peek() == '0') {
        advance();
        if (is_digit(peek())) {
            return fail(ErrorKind::LexError, "leading zeros are not allowed", start,
                        "remove the leading zero");
        }
    } else {
        while (is_digit(peek())) {
            advance();
        }
    }

    if (peek() == '.') {
        advance();
        if (!is_digit(peek())) {
            return fail(ErrorKind::LexError, "expected a digit after the decimal point", start);
        }
        while (is_digit(peek())) {
            advance();
        }
        has_fraction = true;
    }

    if (peek() == 'e' || peek() == 'E') {
        return fail(ErrorKind::LexError, "exponent notation is not accepted", start,
                    "write the number in plain decimal form, e.g. 1500 instead of 1.5e3");
    }
    if (is_alpha(peek()) || is_digit(peek())) {
        return fail(ErrorKind::LexError, "invalid character after number", here());
    }

    JsonToken token = make_token(JsonTokenKind::Number, start_pos, start);
    token.number_value = JsonNumber{std::string(token.lexeme), has_fraction};
    return token;
}

// ============================================================================
// Literals
// ============================================================================

auto JsonLexer::scan_literal() -> JsonToken {
    SourcePos start = here();
    size_t start_pos = pos_;
    while (is_alpha(peek()) || is_digit(peek())) {
        advance();
    }
    std::string_view word = input_.substr(start_pos, pos_ - start_pos);

    if (word == "true") {
        return make_token(JsonTokenKind::True, start_pos, start);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start_pos, start);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start_pos, start);
    }

    std::string hint;
    if (word == "True" || word == "TRUE" || word == "False" || word == "FALSE" ||
        word == "Null" || word == "NULL") {
        hint = "literals are lowercase: true, false, null";
    } else if (word == "NaN" || word == "Infinity") {
        hint = "non-finite numbers cannot be represented";
    } else {
        hint = "strings and keys must be double-quoted";
    }
    return fail(ErrorKind::LexError, "unknown literal '" + std::string(word) + "'", start,
                std::move(hint));
}

} // namespace strictjson::json
