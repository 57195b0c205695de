//! # Bound Values Implementation

#include "bind/bound_value.hpp"

#include <algorithm>
#include <functional>
#include <iomanip>
#include <sstream>

namespace strictjson::bind {

namespace {

auto hash_combine(size_t seed, size_t value) -> size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

void write_escaped(std::ostringstream& oss, const std::string& text) {
    oss << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

void write_value(std::ostringstream& oss, const BoundValue& value);

void write_items(std::ostringstream& oss, const std::vector<BoundValue>& items) {
    oss << '[';
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        write_value(oss, items[i]);
    }
    oss << ']';
}

void write_value(std::ostringstream& oss, const BoundValue& value) {
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NoValue>) {
                oss << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                oss << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, double>) {
                oss << std::setprecision(17) << v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_escaped(oss, v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                oss << '"' << v.to_string() << '"';
            } else if constexpr (std::is_same_v<T, BoundList> || std::is_same_v<T, BoundSet>) {
                write_items(oss, v.items);
            } else if constexpr (std::is_same_v<T, BoundObject>) {
                oss << '{';
                bool first = true;
                for (const auto& field : v.fields) {
                    if (field.state == FieldState::Missing) {
                        continue;
                    }
                    if (!first) {
                        oss << ',';
                    }
                    first = false;
                    write_escaped(oss, field.name);
                    oss << ':';
                    write_value(oss, field.value);
                }
                oss << '}';
            } else {
                oss << v;
            }
        },
        value.data);
}

} // anonymous namespace

auto field_state_name(FieldState state) -> const char* {
    switch (state) {
    case FieldState::Present:
        return "present";
    case FieldState::Null:
        return "null";
    case FieldState::Missing:
        return "missing";
    }
    return "unknown";
}

// ============================================================================
// Collections
// ============================================================================

auto BoundList::operator==(const BoundList& other) const -> bool {
    return items == other.items;
}

auto BoundSet::contains(const BoundValue& value) const -> bool {
    return std::find(items.begin(), items.end(), value) != items.end();
}

auto BoundSet::operator==(const BoundSet& other) const -> bool {
    if (items.size() != other.items.size()) {
        return false;
    }
    return std::all_of(items.begin(), items.end(),
                       [&](const BoundValue& item) { return other.contains(item); });
}

// ============================================================================
// Objects
// ============================================================================

auto BoundObject::field(std::string_view name) const -> const BoundField* {
    for (const auto& f : fields) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

auto BoundObject::state(std::string_view name) const -> FieldState {
    const BoundField* f = field(name);
    return f != nullptr ? f->state : FieldState::Missing;
}

auto BoundObject::get(std::string_view name) const -> const BoundValue& {
    static const BoundValue none;
    const BoundField* f = field(name);
    return f != nullptr ? f->value : none;
}

auto BoundObject::operator==(const BoundObject& other) const -> bool {
    return type_name == other.type_name && fields == other.fields;
}

auto BoundField::operator==(const BoundField& other) const -> bool {
    return name == other.name && state == other.state && value == other.value;
}

// ============================================================================
// BoundValue
// ============================================================================

auto BoundValue::operator==(const BoundValue& other) const -> bool {
    return data == other.data;
}

auto BoundValue::to_string() const -> std::string {
    std::ostringstream oss;
    write_value(oss, *this);
    return oss.str();
}

auto hash_value(const BoundValue& value) -> size_t {
    size_t seed = value.data.index();
    return std::visit(
        [&](const auto& v) -> size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NoValue>) {
                return seed;
            } else if constexpr (std::is_same_v<T, double>) {
                // 0.0 and -0.0 compare equal
                return hash_combine(seed, std::hash<double>{}(v == 0.0 ? 0.0 : v));
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return hash_combine(seed, std::hash<int64_t>{}(v.epoch_millis));
            } else if constexpr (std::is_same_v<T, BoundList>) {
                for (const auto& item : v.items) {
                    seed = hash_combine(seed, hash_value(item));
                }
                return seed;
            } else if constexpr (std::is_same_v<T, BoundSet>) {
                size_t combined = 0;
                for (const auto& item : v.items) {
                    combined += hash_value(item);
                }
                return hash_combine(seed, combined);
            } else if constexpr (std::is_same_v<T, BoundObject>) {
                seed = hash_combine(seed, std::hash<std::string>{}(v.type_name));
                for (const auto& field : v.fields) {
                    seed = hash_combine(seed, std::hash<std::string>{}(field.name));
                    seed = hash_combine(seed, static_cast<size_t>(field.state));
                    seed = hash_combine(seed, hash_value(field.value));
                }
                return seed;
            } else {
                return hash_combine(seed, std::hash<T>{}(v));
            }
        },
        value.data);
}

} // namespace strictjson::bind
