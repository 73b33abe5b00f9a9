//! # Builtin Codecs
//!
//! `JsonCodec` specializations for owning pointers. An empty pointer is
//! written as `null`, and `null` decodes to an empty pointer. Any other
//! value is decoded into the pointee, allocating it first when the pointer
//! is empty.

#pragma once

#include "weft/json/json_parser.hpp"
#include "weft/json/json_traits.hpp"
#include "weft/json/json_writer.hpp"

#include <memory>

namespace weft::json {

template <typename T> struct JsonCodec<std::unique_ptr<T>> {
    static auto decode(JsonParser& parser, std::unique_ptr<T>& out) -> Result<bool, JsonError> {
        if (parser.match(JsonTokenKind::Null)) {
            out.reset();
            return true;
        }
        if (!out) {
            out = std::make_unique<T>();
        }
        return decode_value(parser, *out);
    }

    static void encode(JsonWriter& writer, const std::unique_ptr<T>& value) {
        if (!value) {
            writer.null();
            return;
        }
        encode_value(writer, *value);
    }
};

template <typename T> struct JsonCodec<std::shared_ptr<T>> {
    static auto decode(JsonParser& parser, std::shared_ptr<T>& out) -> Result<bool, JsonError> {
        if (parser.match(JsonTokenKind::Null)) {
            out.reset();
            return true;
        }
        // A shared pointee may be observed elsewhere; decode into a fresh one.
        auto fresh = std::make_shared<T>();
        auto result = decode_value(parser, *fresh);
        if (is_ok(result)) {
            out = std::move(fresh);
        }
        return result;
    }

    static void encode(JsonWriter& writer, const std::shared_ptr<T>& value) {
        if (!value) {
            writer.null();
            return;
        }
        encode_value(writer, *value);
    }
};

} // namespace weft::json
