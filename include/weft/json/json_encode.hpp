//! # Type-Directed Encoding
//!
//! Writes a typed value as JSON text through a `JsonWriter`. The output
//! mirrors what `json_decode.hpp` accepts, so encoding then decoding a value
//! yields an equal value.
//!
//! - Records become objects with their fields in declaration order.
//! - Tagged unions become objects whose first member is the discriminant.
//! - Enums with `EnumTraits` become their names, other enums their
//!   underlying integers.
//! - Absent optionals and empty pointers become `null`.
//! - NaN and infinities become `null`.
//!
//! ## Example
//!
//! ```cpp
//! std::string text = to_json(Point{1, 2});
//! // text == R"({"x":1,"y":2})"
//! ```

#pragma once

#include "weft/common.hpp"
#include "weft/json/json_codecs.hpp"
#include "weft/json/json_error.hpp"
#include "weft/json/json_options.hpp"
#include "weft/json/json_sink.hpp"
#include "weft/json/json_traits.hpp"
#include "weft/json/json_writer.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace weft::json {

namespace detail {

template <typename E> void encode_enum(JsonWriter& writer, E value) {
    if constexpr (has_enum_names_v<E>) {
        for (const auto& [candidate, name] : EnumTraits<E>::names) {
            if (candidate == value) {
                writer.string(name);
                return;
            }
        }
    }
    using U = std::underlying_type_t<E>;
    if constexpr (std::is_signed_v<U>) {
        writer.integer(static_cast<int64_t>(value));
    } else {
        writer.unsigned_integer(static_cast<uint64_t>(value));
    }
}

template <typename T, typename Fields, size_t... I>
void encode_members(JsonWriter& writer, const T& value, const Fields& fields,
                    std::index_sequence<I...> /*indices*/) {
    ((writer.key(std::get<I>(fields).name), encode_value(writer, value.*(std::get<I>(fields).member))),
     ...);
}

template <typename T> void encode_record(JsonWriter& writer, const T& value) {
    const auto fields = RecordTraits<T>::fields();
    writer.begin_object();
    encode_members(writer, value, fields,
                   std::make_index_sequence<std::tuple_size_v<std::decay_t<decltype(fields)>>>{});
    writer.end_object();
}

template <typename V> void encode_union(JsonWriter& writer, const V& value) {
    using Traits = UnionTraits<V>;

    writer.begin_object();
    writer.key(Traits::tag_field);
    encode_value(writer, Traits::tags[value.index()]);
    std::visit(
        [&writer](const auto& alternative) {
            using Alt = std::decay_t<decltype(alternative)>;
            const auto fields = RecordTraits<Alt>::fields();
            encode_members(
                writer, alternative, fields,
                std::make_index_sequence<std::tuple_size_v<std::decay_t<decltype(fields)>>>{});
        },
        value);
    writer.end_object();
}

template <typename Tuple, size_t... I>
void encode_tuple(JsonWriter& writer, const Tuple& value, std::index_sequence<I...> /*indices*/) {
    writer.begin_array();
    (encode_value(writer, std::get<I>(value)), ...);
    writer.end_array();
}

template <typename T> void encode_elements(JsonWriter& writer, const T& value) {
    writer.begin_array();
    for (const auto& element : value) {
        encode_value(writer, element);
    }
    writer.end_array();
}

template <typename T> void encode_map(JsonWriter& writer, const T& value) {
    static_assert(std::is_same_v<typename T::key_type, std::string>,
                  "only string-keyed maps encode as JSON objects");
    writer.begin_object();
    for (const auto& [key, element] : value) {
        writer.key(key);
        encode_value(writer, element);
    }
    writer.end_object();
}

} // namespace detail

// ============================================================================
// Dispatch
// ============================================================================

template <typename T> void encode_value(JsonWriter& writer, const T& value) {
    if constexpr (has_encode_codec_v<T>) {
        JsonCodec<T>::encode(writer, value);
    } else {
        constexpr TypeShape shape = shape_of_v<T>;
        if constexpr (shape == TypeShape::Boolean) {
            writer.boolean(value);
        } else if constexpr (shape == TypeShape::Character) {
            writer.string(std::string_view(&value, 1));
        } else if constexpr (shape == TypeShape::Integer) {
            if constexpr (std::is_signed_v<T>) {
                writer.integer(static_cast<int64_t>(value));
            } else {
                writer.unsigned_integer(static_cast<uint64_t>(value));
            }
        } else if constexpr (shape == TypeShape::Floating) {
            if constexpr (std::is_same_v<T, long double>) {
                writer.floating(value);
            } else {
                writer.floating(static_cast<double>(value));
            }
        } else if constexpr (shape == TypeShape::Enum) {
            detail::encode_enum(writer, value);
        } else if constexpr (shape == TypeShape::String) {
            writer.string(value);
        } else if constexpr (shape == TypeShape::Optional) {
            if (value) {
                encode_value(writer, *value);
            } else {
                writer.null();
            }
        } else if constexpr (shape == TypeShape::TaggedUnion) {
            detail::encode_union(writer, value);
        } else if constexpr (shape == TypeShape::Record) {
            detail::encode_record(writer, value);
        } else if constexpr (shape == TypeShape::Tuple) {
            detail::encode_tuple(writer, value,
                                 std::make_index_sequence<std::tuple_size_v<T>>{});
        } else if constexpr (shape == TypeShape::Map) {
            detail::encode_map(writer, value);
        } else if constexpr (shape == TypeShape::FixedArray || shape == TypeShape::Set ||
                             shape == TypeShape::Sequence) {
            detail::encode_elements(writer, value);
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

/// Writes `value` as JSON text to `sink`.
///
/// Returns an `Io` error if the sink reports a failed write.
template <typename T>
[[nodiscard]] auto encode(JsonSink& sink, const T& value, EncodeOptions options = {})
    -> Result<bool, JsonError> {
    JsonWriter writer(sink, options);
    encode_value(writer, value);
    if (!writer.ok()) {
        return JsonError::make(JsonErrorKind::Io, "failed to write JSON output",
                               std::string(sink.label()), 0, 0);
    }
    return true;
}

/// Returns `value` as a JSON string.
template <typename T>
[[nodiscard]] auto to_json(const T& value, EncodeOptions options = {}) -> std::string {
    StringSink sink;
    JsonWriter writer(sink, options);
    encode_value(writer, value);
    return sink.take();
}

} // namespace weft::json
