//! # Decoder Configuration Implementation

#include "config/decoder_config.hpp"

#include "log/log.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

namespace strictjson::config {

// ============================================================================
// Profiles
// ============================================================================

auto DecoderConfig::defaults() -> DecoderConfig {
    return production();
}

auto DecoderConfig::development() -> DecoderConfig {
    DecoderConfig config;
    config.limits.max_payload_bytes = 50 * 1024 * 1024;
    config.limits.max_nesting_depth = 10;
    config.limits.max_array_elements = 100000;
    config.limits.max_string_length = 10 * 1024 * 1024;
    return config;
}

auto DecoderConfig::staging() -> DecoderConfig {
    return DecoderConfig{};
}

auto DecoderConfig::production() -> DecoderConfig {
    return DecoderConfig{};
}

auto DecoderConfig::for_profile(std::string_view name) -> std::optional<DecoderConfig> {
    if (name == "development") {
        return development();
    }
    if (name == "staging") {
        return staging();
    }
    if (name == "production") {
        return production();
    }
    return std::nullopt;
}

auto DecoderConfig::validate() const -> std::optional<std::string> {
    if (auto err = limits.validate()) {
        return err;
    }
    if (timeout && timeout->count() <= 0) {
        return "timeout must be positive";
    }
    return std::nullopt;
}

auto DecoderConfig::bind_options() const -> bind::BindOptions {
    bind::BindOptions options;
    options.unknown_fields = unknown_fields;
    options.max_nesting_depth = limits.max_nesting_depth;
    options.max_string_length = limits.max_string_length;
    return options;
}

auto requested_profile(std::string_view explicit_name) -> std::optional<std::string> {
    if (!explicit_name.empty()) {
        return std::string(explicit_name);
    }
    const char* env_profile = std::getenv(PROFILE_ENV_VAR);
    if (env_profile != nullptr && *env_profile != '\0') {
        return std::string(env_profile);
    }
    return std::nullopt;
}

auto select_profile(std::string_view explicit_name) -> std::string {
    return requested_profile(explicit_name).value_or(DEFAULT_PROFILE);
}

// ============================================================================
// ConfigFile
// ============================================================================

auto ConfigFile::resolve(std::string_view name) const -> std::optional<DecoderConfig> {
    if (name.empty()) {
        return decoder;
    }
    auto it = profiles.find(std::string(name));
    if (it != profiles.end()) {
        return it->second;
    }
    return DecoderConfig::for_profile(name);
}

auto ConfigFile::load(const std::filesystem::path& path, std::string* error)
    -> std::optional<ConfigFile> {
    std::ifstream file(path);
    if (!file) {
        if (error != nullptr) {
            *error = "cannot open config file '" + path.string() + "'";
        }
        STRICTJSON_LOG_ERROR("config", "Cannot open config file " << path);
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    ConfigParser parser(content);
    auto result = parser.parse();
    if (!result) {
        if (error != nullptr) {
            *error = parser.error();
        }
        STRICTJSON_LOG_ERROR("config", path.string() << ": " << parser.error());
        return std::nullopt;
    }

    STRICTJSON_LOG_INFO("config", "Loaded " << path.string() << " with "
                                            << result->profiles.size() << " profile sections");
    return result;
}

// ============================================================================
// ConfigParser
// ============================================================================

ConfigParser::ConfigParser(std::string_view content) : content_(content) {}

auto ConfigParser::advance() -> char {
    if (is_eof())
        return '\0';
    char c = content_[pos_++];
    if (c == '\n')
        line_++;
    return c;
}

void ConfigParser::skip_blanks() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t')) {
        advance();
    }
}

void ConfigParser::skip_trivia() {
    while (!is_eof()) {
        if (std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        } else if (peek() == '#') {
            while (!is_eof() && peek() != '\n') {
                advance();
            }
        } else {
            break;
        }
    }
}

auto ConfigParser::expect_line_end() -> bool {
    skip_blanks();
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
    if (is_eof() || peek() == '\n' || peek() == '\r') {
        return true;
    }
    set_error(std::string("Unexpected '") + peek() + "' after value");
    return false;
}

auto ConfigParser::parse_identifier() -> std::string {
    std::string result;
    while (!is_eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                         peek() == '-' || peek() == '.')) {
        result += advance();
    }
    return result;
}

auto ConfigParser::parse_section_header() -> std::optional<std::string> {
    advance(); // Skip '['
    skip_blanks();
    std::string name = parse_identifier();
    skip_blanks();
    if (peek() != ']') {
        set_error("Expected ']' to close the section header");
        return std::nullopt;
    }
    advance();
    if (name.empty()) {
        set_error("Empty section name");
        return std::nullopt;
    }
    return name;
}

auto ConfigParser::parse_string() -> std::optional<std::string> {
    if (peek() != '"') {
        set_error("Expected string");
        return std::nullopt;
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                set_error(std::string("Unsupported escape '\\") + escaped + "'");
                return std::nullopt;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return std::nullopt;
    }
    advance(); // Skip closing quote

    return result;
}

auto ConfigParser::parse_integer() -> std::optional<size_t> {
    std::string digits;
    while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        char c = advance();
        if (c != '_') {
            digits += c;
        }
    }
    if (digits.empty()) {
        set_error("Expected a non-negative integer");
        return std::nullopt;
    }

    size_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        set_error("Integer value '" + digits + "' is out of range");
        return std::nullopt;
    }
    return value;
}

auto ConfigParser::parse_entry(DecoderConfig& target) -> bool {
    std::string key = parse_identifier();
    if (key.empty()) {
        set_error(std::string("Expected a key, found '") + peek() + "'");
        return false;
    }
    skip_blanks();

    if (peek() != '=') {
        set_error("Expected '=' after key");
        return false;
    }
    advance();
    skip_blanks();

    if (key == "unknown_field_policy") {
        auto text = parse_string();
        if (!text) {
            return false;
        }
        auto policy = bind::parse_unknown_field_policy(*text);
        if (!policy) {
            set_error("unknown_field_policy must be \"reject\" or \"ignore\", found \"" + *text +
                      "\"");
            return false;
        }
        target.unknown_fields = *policy;
        return expect_line_end();
    }

    size_t* slot = nullptr;
    if (key == "max_payload_bytes") {
        slot = &target.limits.max_payload_bytes;
    } else if (key == "max_nesting_depth") {
        slot = &target.limits.max_nesting_depth;
    } else if (key == "max_array_elements") {
        slot = &target.limits.max_array_elements;
    } else if (key == "max_string_length") {
        slot = &target.limits.max_string_length;
    } else if (key != "timeout_ms") {
        set_error("Unknown key '" + key + "'");
        return false;
    }

    auto value = parse_integer();
    if (!value) {
        return false;
    }
    if (slot != nullptr) {
        *slot = *value;
    } else if (*value == 0) {
        target.timeout.reset();
    } else if (*value > static_cast<size_t>(std::numeric_limits<int64_t>::max())) {
        set_error("timeout_ms value " + std::to_string(*value) + " is out of range");
        return false;
    } else {
        target.timeout = std::chrono::milliseconds(static_cast<int64_t>(*value));
    }
    return expect_line_end();
}

void ConfigParser::set_error(const std::string& message) {
    error_message_ = "Line " + std::to_string(line_) + ": " + message;
}

auto ConfigParser::parse() -> std::optional<ConfigFile> {
    ConfigFile file;
    DecoderConfig* target = nullptr;
    std::string section;
    bool seen_decoder = false;

    skip_trivia();
    while (!is_eof()) {
        if (peek() == '[') {
            auto header = parse_section_header();
            if (!header) {
                return std::nullopt;
            }
            section = *header;

            if (section == "decoder") {
                if (seen_decoder) {
                    set_error("Duplicate section [decoder]");
                    return std::nullopt;
                }
                seen_decoder = true;
                target = &file.decoder;
            } else if (section.starts_with("profile.") && section.size() > 8) {
                std::string name = section.substr(8);
                if (file.profiles.count(name) != 0) {
                    set_error("Duplicate section [" + section + "]");
                    return std::nullopt;
                }
                DecoderConfig base = DecoderConfig::for_profile(name).value_or(file.decoder);
                target = &file.profiles.emplace(name, base).first->second;
            } else {
                set_error("Unknown section [" + section + "]");
                return std::nullopt;
            }

            if (!expect_line_end()) {
                return std::nullopt;
            }
        } else {
            if (target == nullptr) {
                set_error("Key outside of a section");
                return std::nullopt;
            }
            if (!parse_entry(*target)) {
                return std::nullopt;
            }
        }
        skip_trivia();
    }

    if (auto err = file.decoder.validate()) {
        error_message_ = "Section [decoder]: " + *err;
        return std::nullopt;
    }
    for (const auto& [name, config] : file.profiles) {
        if (auto err = config.validate()) {
            error_message_ = "Section [profile." + name + "]: " + *err;
            return std::nullopt;
        }
    }
    return file;
}

} // namespace strictjson::config
