//! # JSON Type Descriptors
//!
//! The decode and encode engines are driven by a compile-time description of
//! the target type. Builtin shapes (booleans, numbers, strings, optionals,
//! sequences, sets, string-keyed maps, fixed arrays, pairs and tuples) are
//! recognized automatically. User types opt in by specializing one of the
//! traits below.
//!
//! ## Records
//!
//! ```cpp
//! struct Point {
//!     int x = 0;
//!     int y = 0;
//! };
//!
//! template <> struct weft::json::RecordTraits<Point> {
//!     static constexpr auto fields() {
//!         return std::make_tuple(field("x", &Point::x), field("y", &Point::y));
//!     }
//! };
//! ```
//!
//! Field names are matched against object keys with `identifiers_match()`,
//! so `"userName"` and `"user_name"` both reach a field declared `"user_name"`.
//!
//! ## Enums
//!
//! Enums with `EnumTraits` travel as their names; every other enum travels
//! as its underlying integer.
//!
//! ```cpp
//! template <> struct weft::json::EnumTraits<Shape> {
//!     static constexpr std::array<std::pair<Shape, std::string_view>, 2> names{
//!         {{Shape::Circle, "Circle"}, {Shape::Square, "Square"}}};
//! };
//! ```
//!
//! ## Tagged Unions
//!
//! A `std::variant` of records becomes a tagged union once `UnionTraits` names
//! its discriminant. `tags[i]` is the discriminant value selecting
//! alternative `i`.
//!
//! ```cpp
//! using Figure = std::variant<Circle, Square>;
//!
//! template <> struct weft::json::UnionTraits<Figure> {
//!     using Tag = Shape;
//!     static constexpr std::string_view tag_field = "kind";
//!     static constexpr std::array<Shape, 2> tags{Shape::Circle, Shape::Square};
//! };
//! ```
//!
//! ## Custom Codecs
//!
//! `JsonCodec<T>` overrides everything else for `T`:
//!
//! ```cpp
//! template <> struct weft::json::JsonCodec<Celsius> {
//!     static auto decode(JsonParser& parser, Celsius& out) -> Result<bool, JsonError>;
//!     static void encode(JsonWriter& writer, const Celsius& value);
//! };
//! ```

#pragma once

#include "weft/common.hpp"
#include "weft/json/json_error.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace weft::json {

class JsonParser;
class JsonWriter;

// ============================================================================
// Customization Points
// ============================================================================

/// Binds a JSON field name to a data member.
template <typename Class, typename Member> struct FieldDesc {
    using class_type = Class;
    using member_type = Member;

    std::string_view name;
    Member Class::*member;
};

/// Creates a field descriptor for `RecordTraits::fields()`.
template <typename Class, typename Member>
constexpr auto field(std::string_view name, Member Class::*member) -> FieldDesc<Class, Member> {
    return FieldDesc<Class, Member>{name, member};
}

/// Declares `T` a record. Specializations provide a static `fields()`
/// returning a tuple of `FieldDesc`, in declaration order.
template <typename T> struct RecordTraits {};

/// Declares the names of an enum's values.
/// Specializations provide a static `names` array of `(value, name)` pairs.
template <typename E> struct EnumTraits {};

/// Declares a `std::variant` of records a tagged union.
/// Specializations provide `Tag`, `tag_field` and `tags`.
template <typename V> struct UnionTraits {};

/// User-supplied decode/encode pair that takes precedence over every
/// builtin shape.
template <typename T, typename Enable = void> struct JsonCodec {};

/// Shorthand for a record field descriptor: `WEFT_JSON_FIELD(Point, x)`.
#define WEFT_JSON_FIELD(Type, member) ::weft::json::field(#member, &Type::member)

// ============================================================================
// Engine Entry Points
// ============================================================================

/// Decodes one JSON value into `out`. Defined in `json_decode.hpp`.
template <typename T> auto decode_value(JsonParser& parser, T& out) -> Result<bool, JsonError>;

/// Writes `value` as one JSON value. Defined in `json_encode.hpp`.
template <typename T> void encode_value(JsonWriter& writer, const T& value);

// ============================================================================
// Detection
// ============================================================================

template <typename T> inline constexpr bool dependent_false_v = false;

template <typename T, typename = void> struct has_record_traits : std::false_type {};
template <typename T>
struct has_record_traits<T, std::void_t<decltype(RecordTraits<T>::fields())>> : std::true_type {};
template <typename T> inline constexpr bool has_record_traits_v = has_record_traits<T>::value;

template <typename T, typename = void> struct has_enum_names : std::false_type {};
template <typename T>
struct has_enum_names<T, std::void_t<decltype(EnumTraits<T>::names)>> : std::true_type {};
template <typename T> inline constexpr bool has_enum_names_v = has_enum_names<T>::value;

template <typename T, typename = void> struct has_union_traits : std::false_type {};
template <typename T>
struct has_union_traits<T, std::void_t<typename UnionTraits<T>::Tag,
                                       decltype(UnionTraits<T>::tag_field),
                                       decltype(UnionTraits<T>::tags)>> : std::true_type {};
template <typename T> inline constexpr bool has_union_traits_v = has_union_traits<T>::value;

template <typename T, typename = void> struct has_decode_codec : std::false_type {};
template <typename T>
struct has_decode_codec<T, std::void_t<decltype(JsonCodec<T>::decode(
                               std::declval<JsonParser&>(), std::declval<T&>()))>>
    : std::true_type {};
template <typename T> inline constexpr bool has_decode_codec_v = has_decode_codec<T>::value;

template <typename T, typename = void> struct has_encode_codec : std::false_type {};
template <typename T>
struct has_encode_codec<T, std::void_t<decltype(JsonCodec<T>::encode(
                               std::declval<JsonWriter&>(), std::declval<const T&>()))>>
    : std::true_type {};
template <typename T> inline constexpr bool has_encode_codec_v = has_encode_codec<T>::value;

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
template <typename T> inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename T> struct is_std_array : std::false_type {};
template <typename T, size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};
template <typename T> inline constexpr bool is_std_array_v = is_std_array<T>::value;

template <typename T> struct is_tuple_like : std::false_type {};
template <typename A, typename B> struct is_tuple_like<std::pair<A, B>> : std::true_type {};
template <typename... Ts> struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};
template <typename T> inline constexpr bool is_tuple_like_v = is_tuple_like<T>::value;

template <typename T, typename = void> struct is_map_like : std::false_type {};
template <typename T>
struct is_map_like<T, std::void_t<typename T::key_type, typename T::mapped_type,
                                  decltype(std::declval<T&>().find(
                                      std::declval<const typename T::key_type&>()))>>
    : std::true_type {};
template <typename T> inline constexpr bool is_map_like_v = is_map_like<T>::value;

template <typename T, typename = void> struct is_set_like : std::false_type {};
template <typename T>
struct is_set_like<T, std::void_t<typename T::key_type,
                                  decltype(std::declval<T&>().insert(
                                      std::declval<typename T::value_type>())),
                                  decltype(std::declval<T&>().find(
                                      std::declval<const typename T::key_type&>()))>>
    : std::bool_constant<!is_map_like_v<T>> {};
template <typename T> inline constexpr bool is_set_like_v = is_set_like<T>::value;

template <typename T, typename = void> struct is_sequence_like : std::false_type {};
template <typename T>
struct is_sequence_like<T, std::void_t<typename T::value_type,
                                       decltype(std::declval<T&>().push_back(
                                           std::declval<typename T::value_type>())),
                                       decltype(std::declval<T&>().clear())>>
    : std::bool_constant<!std::is_same_v<T, std::string>> {};
template <typename T> inline constexpr bool is_sequence_like_v = is_sequence_like<T>::value;

// ============================================================================
// Type Shapes
// ============================================================================

/// The JSON shape the engines assign to a C++ type.
enum class TypeShape {
    Custom,      ///< `JsonCodec<T>` specialization
    Boolean,     ///< `bool`
    Character,   ///< `char`, a one-character string
    Integer,     ///< Any other integral type, range-checked
    Floating,    ///< `float`, `double`, `long double`
    Enum,        ///< Enum by name (with `EnumTraits`) or underlying integer
    String,      ///< `std::string`
    Optional,    ///< `std::optional<T>`, `null` when absent
    TaggedUnion, ///< `std::variant` with `UnionTraits`
    Record,      ///< Type with `RecordTraits`
    FixedArray,  ///< `std::array<T, N>`, exactly N elements
    Tuple,       ///< `std::pair` or `std::tuple`, one element per position
    Map,         ///< String-keyed associative container, a JSON object
    Set,         ///< Unique associative container, a JSON array
    Sequence,    ///< Growable container with `push_back`
    Unsupported
};

template <typename T> constexpr auto shape_of() -> TypeShape {
    if constexpr (has_decode_codec_v<T> || has_encode_codec_v<T>) {
        return TypeShape::Custom;
    } else if constexpr (std::is_same_v<T, bool>) {
        return TypeShape::Boolean;
    } else if constexpr (std::is_same_v<T, char>) {
        return TypeShape::Character;
    } else if constexpr (std::is_integral_v<T>) {
        return TypeShape::Integer;
    } else if constexpr (std::is_floating_point_v<T>) {
        return TypeShape::Floating;
    } else if constexpr (std::is_enum_v<T>) {
        return TypeShape::Enum;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return TypeShape::String;
    } else if constexpr (is_optional_v<T>) {
        return TypeShape::Optional;
    } else if constexpr (has_union_traits_v<T>) {
        return TypeShape::TaggedUnion;
    } else if constexpr (has_record_traits_v<T>) {
        return TypeShape::Record;
    } else if constexpr (is_std_array_v<T>) {
        return TypeShape::FixedArray;
    } else if constexpr (is_tuple_like_v<T>) {
        return TypeShape::Tuple;
    } else if constexpr (is_map_like_v<T>) {
        return TypeShape::Map;
    } else if constexpr (is_set_like_v<T>) {
        return TypeShape::Set;
    } else if constexpr (is_sequence_like_v<T>) {
        return TypeShape::Sequence;
    } else {
        return TypeShape::Unsupported;
    }
}

template <typename T> inline constexpr TypeShape shape_of_v = shape_of<T>();

// ============================================================================
// Record Helpers
// ============================================================================

namespace detail {

template <typename Fields, size_t... I>
constexpr auto field_names(const Fields& fields, std::index_sequence<I...> /*indices*/)
    -> std::array<std::string_view, sizeof...(I)> {
    return {std::get<I>(fields).name...};
}

} // namespace detail

/// Returns the declared JSON names of a record's fields, in order.
template <typename Fields>
constexpr auto field_names(const Fields& fields)
    -> std::array<std::string_view, std::tuple_size_v<Fields>> {
    return detail::field_names(fields, std::make_index_sequence<std::tuple_size_v<Fields>>{});
}

} // namespace weft::json
