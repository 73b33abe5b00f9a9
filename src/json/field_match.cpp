//! # Field Matching Implementation

#include "weft/json/field_match.hpp"

namespace weft::json {

namespace {

auto is_separator(char c) -> bool {
    return c == '_' || c == '-';
}

auto to_lower(char c) -> char {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

} // namespace

auto normalize_identifier(std::string_view name) -> std::string {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (!is_separator(c)) {
            result += to_lower(c);
        }
    }
    return result;
}

auto identifiers_match(std::string_view a, std::string_view b) -> bool {
    size_t i = 0;
    size_t j = 0;
    while (true) {
        while (i < a.size() && is_separator(a[i])) {
            ++i;
        }
        while (j < b.size() && is_separator(b[j])) {
            ++j;
        }
        if (i == a.size() || j == b.size()) {
            return i == a.size() && j == b.size();
        }
        if (to_lower(a[i]) != to_lower(b[j])) {
            return false;
        }
        ++i;
        ++j;
    }
}

auto find_field(std::string_view key, std::span<const std::string_view> names)
    -> std::optional<size_t> {
    for (size_t i = 0; i < names.size(); ++i) {
        if (identifiers_match(key, names[i])) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace weft::json
