//! # Decode Error Implementation
//!
//! Kind names, stable codes, categories, and the one-line rendering used in
//! logs and by the lint tool.

#include "json/json_error.hpp"

namespace strictjson::json {

auto kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::LexError:
        return "LexError";
    case ErrorKind::SyntaxError:
        return "SyntaxError";
    case ErrorKind::DuplicateField:
        return "DuplicateField";
    case ErrorKind::PayloadTooLarge:
        return "PayloadTooLarge";
    case ErrorKind::NestingTooDeep:
        return "NestingTooDeep";
    case ErrorKind::ArrayTooLarge:
        return "ArrayTooLarge";
    case ErrorKind::StringTooLong:
        return "StringTooLong";
    case ErrorKind::TypeMismatch:
        return "TypeMismatch";
    case ErrorKind::UnexpectedNull:
        return "UnexpectedNull";
    case ErrorKind::MissingRequiredField:
        return "MissingRequiredField";
    case ErrorKind::UnknownField:
        return "UnknownField";
    case ErrorKind::InvalidDateFormat:
        return "InvalidDateFormat";
    case ErrorKind::SchemaError:
        return "SchemaError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

auto error_code(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::LexError:
        return "L001";
    case ErrorKind::SyntaxError:
        return "P001";
    case ErrorKind::DuplicateField:
        return "P002";
    case ErrorKind::PayloadTooLarge:
        return "G001";
    case ErrorKind::NestingTooDeep:
        return "G002";
    case ErrorKind::ArrayTooLarge:
        return "G003";
    case ErrorKind::StringTooLong:
        return "G004";
    case ErrorKind::TypeMismatch:
        return "B001";
    case ErrorKind::UnexpectedNull:
        return "B002";
    case ErrorKind::MissingRequiredField:
        return "B003";
    case ErrorKind::UnknownField:
        return "B004";
    case ErrorKind::InvalidDateFormat:
        return "B005";
    case ErrorKind::SchemaError:
        return "S001";
    case ErrorKind::Cancelled:
        return "C001";
    }
    return "E000";
}

auto category_of(ErrorKind kind) -> ErrorCategory {
    switch (kind) {
    case ErrorKind::LexError:
        return ErrorCategory::Lexical;
    case ErrorKind::SyntaxError:
    case ErrorKind::DuplicateField:
        return ErrorCategory::Syntax;
    case ErrorKind::PayloadTooLarge:
    case ErrorKind::NestingTooDeep:
    case ErrorKind::ArrayTooLarge:
    case ErrorKind::StringTooLong:
        return ErrorCategory::Limit;
    case ErrorKind::TypeMismatch:
    case ErrorKind::UnexpectedNull:
    case ErrorKind::MissingRequiredField:
    case ErrorKind::UnknownField:
    case ErrorKind::InvalidDateFormat:
        return ErrorCategory::Binding;
    case ErrorKind::SchemaError:
        return ErrorCategory::Schema;
    case ErrorKind::Cancelled:
        return ErrorCategory::Cancellation;
    }
    return ErrorCategory::Syntax;
}

auto DecodeError::to_string() const -> std::string {
    std::string out = "[";
    out += code();
    out += "] ";

    if (line > 0 && column > 0) {
        out += "line " + std::to_string(line) + ", column " + std::to_string(column) + ": ";
    } else if (line > 0) {
        out += "line " + std::to_string(line) + ": ";
    }

    out += message;

    if (!path.empty()) {
        out += " (at '" + path + "')";
    }
    if (!expected.empty() || !actual.empty()) {
        out += ": expected " + (expected.empty() ? std::string("?") : expected) + ", found " +
               (actual.empty() ? std::string("?") : actual);
    }
    if (!hint.empty()) {
        out += "; hint: " + hint;
    }
    return out;
}

} // namespace strictjson::json
