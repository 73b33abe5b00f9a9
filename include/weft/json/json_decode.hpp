//! # Type-Directed Decoding
//!
//! Reads a JSON value straight into a typed destination. Decoding is driven
//! by the destination's `TypeShape`; no intermediate document tree is built.
//!
//! ## Behavior by Shape
//!
//! | Shape | Accepted JSON | Notes |
//! |-------|---------------|-------|
//! | Boolean | `true` / `false` | |
//! | Integer | integer number | Float lexemes and out-of-range values are `TypeMismatch` |
//! | Floating | any number | |
//! | Character | one-character string | |
//! | Enum | name string or integer | Names matched under identifier normalization |
//! | Optional | `null` or the inner value | |
//! | Sequence | array | Destination is cleared first |
//! | FixedArray, Tuple | array of exactly N elements | Wrong count is a `Parse` error |
//! | Set | array | Equal elements follow `duplicate_elements` |
//! | Map | object | Repeated keys follow `duplicate_keys` |
//! | Record | object | Missing fields keep their current value |
//! | TaggedUnion | object, discriminant first | |
//!
//! Decoding into a record only assigns the fields present in the input; every
//! other field keeps whatever the destination held before. Containers are
//! replaced, never merged.
//!
//! ## Example
//!
//! ```cpp
//! auto point = from_json<Point>(R"({"x": 1, "y": 2})");
//! if (is_err(point)) {
//!     std::cerr << unwrap_err(point).to_string() << "\n";
//! }
//! ```

#pragma once

#include "weft/common.hpp"
#include "weft/json/field_match.hpp"
#include "weft/json/json_codecs.hpp"
#include "weft/json/json_error.hpp"
#include "weft/json/json_options.hpp"
#include "weft/json/json_parser.hpp"
#include "weft/json/json_source.hpp"
#include "weft/json/json_traits.hpp"
#include "weft/log/log.hpp"

#include <array>
#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace weft::json {

namespace detail {

// ============================================================================
// Primitives
// ============================================================================

inline auto decode_bool(JsonParser& parser, bool& out) -> Result<bool, JsonError> {
    if (parser.match(JsonTokenKind::True)) {
        out = true;
        return true;
    }
    if (parser.match(JsonTokenKind::False)) {
        out = false;
        return true;
    }
    return parser.type_mismatch("boolean");
}

template <typename I> auto decode_integer(JsonParser& parser, I& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::Number) || !parser.current().is_integer) {
        return parser.type_mismatch("integer");
    }
    const std::string& text = parser.current().text;
    const char* first = text.data();
    const char* last = text.data() + text.size();

    I value{};
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return parser.make_error(JsonErrorKind::TypeMismatch,
                                 "number " + text + " is out of range for the target integer");
    }
    out = value;
    parser.advance();
    return true;
}

template <typename F> auto decode_floating(JsonParser& parser, F& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::Number)) {
        return parser.type_mismatch("number");
    }
    const std::string& text = parser.current().text;
    const char* last = text.data() + text.size();

    F value{};
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return parser.make_error(JsonErrorKind::TypeMismatch,
                                 "number " + text + " is out of range for the target type");
    }
    out = value;
    parser.advance();
    return true;
}

inline auto decode_string(JsonParser& parser, std::string& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::String)) {
        return parser.type_mismatch("string");
    }
    out = std::move(parser.current().text);
    parser.advance();
    return true;
}

inline auto decode_char(JsonParser& parser, char& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::String)) {
        return parser.type_mismatch("one-character string");
    }
    const std::string& text = parser.current().text;
    if (text.size() != 1) {
        return parser.type_mismatch("one-character string");
    }
    out = text[0];
    parser.advance();
    return true;
}

template <typename E> auto decode_underlying(JsonParser& parser, E& out) -> Result<bool, JsonError> {
    std::underlying_type_t<E> raw{};
    auto result = decode_integer(parser, raw);
    if (is_ok(result)) {
        out = static_cast<E>(raw);
    }
    return result;
}

/// Named enums also accept their underlying integer, which is how values
/// without a name are encoded.
template <typename E> auto decode_enum(JsonParser& parser, E& out) -> Result<bool, JsonError> {
    if constexpr (has_enum_names_v<E>) {
        if (parser.check(JsonTokenKind::Number)) {
            return decode_underlying(parser, out);
        }
        if (!parser.check(JsonTokenKind::String)) {
            return parser.type_mismatch("enum name");
        }
        const std::string& text = parser.current().text;
        for (const auto& [value, name] : EnumTraits<E>::names) {
            if (identifiers_match(text, name)) {
                out = value;
                parser.advance();
                return true;
            }
        }
        return parser.make_error(JsonErrorKind::TypeMismatch,
                                 "\"" + text + "\" is not a valid enum name");
    } else {
        return decode_underlying(parser, out);
    }
}

// ============================================================================
// Arrays
// ============================================================================

template <typename T> auto decode_sequence(JsonParser& parser, T& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::LBracket)) {
        return parser.type_mismatch("array");
    }
    auto entered = parser.enter();
    if (is_err(entered)) {
        return entered;
    }
    parser.advance();
    out.clear();

    if (parser.match(JsonTokenKind::RBracket)) {
        parser.leave();
        return true;
    }
    while (true) {
        typename T::value_type element{};
        auto decoded = decode_value(parser, element);
        if (is_err(decoded)) {
            return decoded;
        }
        out.push_back(std::move(element));

        auto more = parser.after_element(JsonTokenKind::RBracket);
        if (is_err(more)) {
            return more;
        }
        if (!unwrap(more)) {
            break;
        }
    }
    parser.leave();
    return true;
}

template <typename T, size_t N>
auto decode_fixed_array(JsonParser& parser, std::array<T, N>& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::LBracket)) {
        return parser.type_mismatch("array");
    }
    auto entered = parser.enter();
    if (is_err(entered)) {
        return entered;
    }
    parser.advance();

    size_t count = 0;
    if (!parser.match(JsonTokenKind::RBracket)) {
        while (true) {
            if (count == N) {
                return parser.make_error(JsonErrorKind::Parse,
                                         "too many elements, expected " + std::to_string(N));
            }
            auto decoded = decode_value(parser, out[count]);
            if (is_err(decoded)) {
                return decoded;
            }
            ++count;

            auto more = parser.after_element(JsonTokenKind::RBracket);
            if (is_err(more)) {
                return more;
            }
            if (!unwrap(more)) {
                break;
            }
        }
    }
    if (count != N) {
        return parser.make_error(JsonErrorKind::Parse, "expected " + std::to_string(N) +
                                                           " elements, found " +
                                                           std::to_string(count));
    }
    parser.leave();
    return true;
}

template <size_t I, typename Tuple>
auto decode_tuple_elements(JsonParser& parser, Tuple& out) -> Result<bool, JsonError> {
    constexpr size_t N = std::tuple_size_v<Tuple>;
    if constexpr (I == N) {
        return true;
    } else {
        if (parser.check(JsonTokenKind::RBracket)) {
            return parser.make_error(JsonErrorKind::Parse, "expected " + std::to_string(N) +
                                                               " elements, found " +
                                                               std::to_string(I));
        }
        if constexpr (I > 0) {
            auto comma = parser.expect(JsonTokenKind::Comma);
            if (is_err(comma)) {
                return comma;
            }
        }
        auto decoded = decode_value(parser, std::get<I>(out));
        if (is_err(decoded)) {
            return decoded;
        }
        return decode_tuple_elements<I + 1>(parser, out);
    }
}

template <typename Tuple> auto decode_tuple(JsonParser& parser, Tuple& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::LBracket)) {
        return parser.type_mismatch("array");
    }
    auto entered = parser.enter();
    if (is_err(entered)) {
        return entered;
    }
    parser.advance();

    auto elements = decode_tuple_elements<0>(parser, out);
    if (is_err(elements)) {
        return elements;
    }
    if (parser.check(JsonTokenKind::Comma)) {
        return parser.make_error(JsonErrorKind::Parse,
                                 "too many elements, expected " +
                                     std::to_string(std::tuple_size_v<Tuple>));
    }
    auto close = parser.expect(JsonTokenKind::RBracket);
    if (is_err(close)) {
        return close;
    }
    parser.leave();
    return true;
}

template <typename T> auto decode_set(JsonParser& parser, T& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::LBracket)) {
        return parser.type_mismatch("array");
    }
    auto entered = parser.enter();
    if (is_err(entered)) {
        return entered;
    }
    parser.advance();
    out.clear();

    if (parser.match(JsonTokenKind::RBracket)) {
        parser.leave();
        return true;
    }
    while (true) {
        typename T::value_type element{};
        auto decoded = decode_value(parser, element);
        if (is_err(decoded)) {
            return decoded;
        }
        auto existing = out.find(element);
        if (existing != out.end()) {
            if (parser.options().duplicate_elements == DuplicatePolicy::Error) {
                return parser.make_error(JsonErrorKind::Parse, "duplicate set element");
            }
            out.erase(existing);
        }
        out.insert(std::move(element));

        auto more = parser.after_element(JsonTokenKind::RBracket);
        if (is_err(more)) {
            return more;
        }
        if (!unwrap(more)) {
            break;
        }
    }
    parser.leave();
    return true;
}

// ============================================================================
// Objects
// ============================================================================

template <typename T> auto decode_map(JsonParser& parser, T& out) -> Result<bool, JsonError> {
    static_assert(std::is_same_v<typename T::key_type, std::string>,
                  "JSON objects decode only into string-keyed maps");

    if (!parser.check(JsonTokenKind::LBrace)) {
        return parser.type_mismatch("object");
    }
    auto entered = parser.enter();
    if (is_err(entered)) {
        return entered;
    }
    parser.advance();
    out.clear();

    if (parser.match(JsonTokenKind::RBrace)) {
        parser.leave();
        return true;
    }
    while (true) {
        auto key = parser.read_key();
        if (is_err(key)) {
            return unwrap_err(key);
        }
        typename T::mapped_type value{};
        auto decoded = decode_value(parser, value);
        if (is_err(decoded)) {
            return decoded;
        }

        auto existing = out.find(unwrap(key));
        if (existing != out.end()) {
            if (parser.options().duplicate_keys == DuplicatePolicy::Error) {
                return parser.make_error(JsonErrorKind::Parse,
                                         "duplicate key \"" + unwrap(key) + "\"");
            }
            existing->second = std::move(value);
        } else {
            out.emplace(std::move(unwrap(key)), std::move(value));
        }

        auto more = parser.after_element(JsonTokenKind::RBrace);
        if (is_err(more)) {
            return more;
        }
        if (!unwrap(more)) {
            break;
        }
    }
    parser.leave();
    return true;
}

/// Decodes the value of the field at runtime position `index`.
template <typename T, typename Fields, size_t... I>
auto decode_field_at(JsonParser& parser, T& out, const Fields& fields, size_t index,
                     std::index_sequence<I...> /*indices*/) -> Result<bool, JsonError> {
    Result<bool, JsonError> result = true;
    static_cast<void>(
        ((I == index ? (result = decode_value(parser, out.*(std::get<I>(fields).member)), true)
                     : false) ||
         ...));
    return result;
}

/// Decodes the remaining members of an object whose `{` (and possibly a
/// leading discriminant) has been consumed, up to and including the `}`.
///
/// A key matching `reserved` is a repeated discriminant.
template <typename T, typename Fields>
auto decode_members(JsonParser& parser, T& out, const Fields& fields, std::string_view reserved)
    -> Result<bool, JsonError> {
    constexpr size_t N = std::tuple_size_v<Fields>;
    const auto names = field_names(fields);
    std::array<bool, N> seen{};

    while (true) {
        auto key = parser.read_key();
        if (is_err(key)) {
            return unwrap_err(key);
        }
        const std::string& name = unwrap(key);

        if (!reserved.empty() && identifiers_match(name, reserved)) {
            return parser.make_error(JsonErrorKind::Parse,
                                     "duplicate discriminant field \"" + name + "\"");
        }

        auto index = find_field(name, names);
        if (!index) {
            if (parser.options().strict_fields) {
                return parser.make_error(JsonErrorKind::UnknownField,
                                         "unknown field \"" + name + "\"");
            }
            WEFT_LOG_DEBUG("json", "skipping unknown field \"" << name << "\" in "
                                                                << parser.label());
            auto skipped = parser.skip_value();
            if (is_err(skipped)) {
                return skipped;
            }
        } else {
            if (seen[*index] && parser.options().duplicate_keys == DuplicatePolicy::Error) {
                return parser.make_error(JsonErrorKind::Parse,
                                         "duplicate field \"" + name + "\"");
            }
            seen[*index] = true;
            auto decoded =
                decode_field_at(parser, out, fields, *index, std::make_index_sequence<N>{});
            if (is_err(decoded)) {
                return decoded;
            }
        }

        auto more = parser.after_element(JsonTokenKind::RBrace);
        if (is_err(more)) {
            return more;
        }
        if (!unwrap(more)) {
            break;
        }
    }
    parser.leave();
    return true;
}

template <typename T> auto decode_record(JsonParser& parser, T& out) -> Result<bool, JsonError> {
    if (!parser.check(JsonTokenKind::LBrace)) {
        return parser.type_mismatch("object");
    }
    auto entered = parser.enter();
    if (is_err(entered)) {
        return entered;
    }
    parser.advance();

    if (parser.match(JsonTokenKind::RBrace)) {
        parser.leave();
        return true;
    }
    return decode_members(parser, out, RecordTraits<T>::fields(), {});
}

// ============================================================================
// Tagged Unions
// ============================================================================

template <typename V, size_t... I>
void emplace_alternative(V& out, size_t index, std::index_sequence<I...> /*indices*/) {
    static_cast<void>(((I == index ? (out.template emplace<I>(), true) : false) || ...));
}

template <typename V> auto decode_union(JsonParser& parser, V& out) -> Result<bool, JsonError> {
    using Traits = UnionTraits<V>;
    using Tag = typename Traits::Tag;
    constexpr size_t N = std::variant_size_v<V>;
    static_assert(std::tuple_size_v<std::decay_t<decltype(Traits::tags)>> == N,
                  "UnionTraits::tags needs one discriminant per alternative");

    if (!parser.check(JsonTokenKind::LBrace)) {
        return parser.type_mismatch("object");
    }
    auto entered = parser.enter();
    if (is_err(entered)) {
        return entered;
    }
    parser.advance();

    // The discriminant selects the branch, so it has to come before any
    // branch field.
    if (parser.check(JsonTokenKind::Error)) {
        return parser.unexpected("discriminant field");
    }
    if (!parser.check(JsonTokenKind::String) ||
        !identifiers_match(parser.current().text, Traits::tag_field)) {
        return parser.make_error(JsonErrorKind::Parse, "expected discriminant field \"" +
                                                           std::string(Traits::tag_field) +
                                                           "\" first");
    }
    auto key = parser.read_key();
    if (is_err(key)) {
        return unwrap_err(key);
    }

    Tag tag{};
    auto tag_decoded = decode_value(parser, tag);
    if (is_err(tag_decoded)) {
        return tag_decoded;
    }

    std::optional<size_t> branch;
    for (size_t i = 0; i < N; ++i) {
        if (Traits::tags[i] == tag) {
            branch = i;
            break;
        }
    }
    if (!branch) {
        return parser.make_error(JsonErrorKind::TypeMismatch,
                                 "no variant branch for discriminant \"" +
                                     std::string(Traits::tag_field) + "\"");
    }
    // A fresh branch, even when `out` already holds the same alternative.
    emplace_alternative(out, *branch, std::make_index_sequence<N>{});

    auto more = parser.after_element(JsonTokenKind::RBrace);
    if (is_err(more)) {
        return more;
    }
    if (!unwrap(more)) {
        parser.leave();
        return true;
    }
    return std::visit(
        [&parser](auto& alternative) -> Result<bool, JsonError> {
            using Alt = std::decay_t<decltype(alternative)>;
            static_assert(has_record_traits_v<Alt>,
                          "tagged union alternatives must have RecordTraits");
            return decode_members(parser, alternative, RecordTraits<Alt>::fields(),
                                  Traits::tag_field);
        },
        out);
}

} // namespace detail

// ============================================================================
// Dispatch
// ============================================================================

template <typename T> auto decode_value(JsonParser& parser, T& out) -> Result<bool, JsonError> {
    if constexpr (has_decode_codec_v<T>) {
        return JsonCodec<T>::decode(parser, out);
    } else {
        constexpr TypeShape shape = shape_of_v<T>;
        if constexpr (shape == TypeShape::Boolean) {
            return detail::decode_bool(parser, out);
        } else if constexpr (shape == TypeShape::Character) {
            return detail::decode_char(parser, out);
        } else if constexpr (shape == TypeShape::Integer) {
            return detail::decode_integer(parser, out);
        } else if constexpr (shape == TypeShape::Floating) {
            return detail::decode_floating(parser, out);
        } else if constexpr (shape == TypeShape::Enum) {
            return detail::decode_enum(parser, out);
        } else if constexpr (shape == TypeShape::String) {
            return detail::decode_string(parser, out);
        } else if constexpr (shape == TypeShape::Optional) {
            if (parser.match(JsonTokenKind::Null)) {
                out.reset();
                return true;
            }
            if (!out) {
                out.emplace();
            }
            return decode_value(parser, *out);
        } else if constexpr (shape == TypeShape::TaggedUnion) {
            return detail::decode_union(parser, out);
        } else if constexpr (shape == TypeShape::Record) {
            return detail::decode_record(parser, out);
        } else if constexpr (shape == TypeShape::FixedArray) {
            return detail::decode_fixed_array(parser, out);
        } else if constexpr (shape == TypeShape::Tuple) {
            return detail::decode_tuple(parser, out);
        } else if constexpr (shape == TypeShape::Map) {
            return detail::decode_map(parser, out);
        } else if constexpr (shape == TypeShape::Set) {
            return detail::decode_set(parser, out);
        } else if constexpr (shape == TypeShape::Sequence) {
            return detail::decode_sequence(parser, out);
        } else {
            static_assert(dependent_false_v<T>,
                          "type has no JSON mapping: specialize RecordTraits, UnionTraits or "
                          "JsonCodec");
        }
    }
}

// ============================================================================
// Public API
// ============================================================================

/// Decodes one JSON value from `source` into an existing `destination`.
///
/// Only the first complete value is consumed; whatever follows it stays in
/// the source. On failure the destination may be partially updated.
template <typename T>
[[nodiscard]] auto decode_into(JsonSource& source, T& destination, DecodeOptions options = {})
    -> Result<bool, JsonError> {
    JsonParser parser(source, options);
    auto result = decode_value(parser, destination);
    if (is_err(result)) {
        WEFT_LOG_DEBUG("json", "decode failed: " << unwrap_err(result).to_string());
    }
    return result;
}

/// Decodes one JSON value from `source` into a default-constructed `T`.
template <typename T>
[[nodiscard]] auto decode(JsonSource& source, DecodeOptions options = {}) -> Result<T, JsonError> {
    T value{};
    auto result = decode_into(source, value, options);
    if (is_err(result)) {
        return unwrap_err(result);
    }
    return value;
}

/// Decodes a complete JSON text. Anything but whitespace after the value is
/// a `Parse` error.
template <typename T>
[[nodiscard]] auto from_json(std::string_view text, DecodeOptions options = {})
    -> Result<T, JsonError> {
    StringSource source{std::string(text)};
    JsonParser parser(source, options);

    T value{};
    auto result = decode_value(parser, value);
    if (is_ok(result)) {
        result = parser.finish();
    }
    if (is_err(result)) {
        WEFT_LOG_DEBUG("json", "decode failed: " << unwrap_err(result).to_string());
        return unwrap_err(result);
    }
    return value;
}

} // namespace weft::json
