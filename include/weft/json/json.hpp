//! # weft JSON
//!
//! Umbrella header for typed JSON decoding and encoding.
//!
//! | Header | Provides |
//! |--------|----------|
//! | `json_source.hpp` / `json_sink.hpp` | Character input and output |
//! | `json_lexer.hpp` | Tokenizer |
//! | `json_parser.hpp` | Token cursor and grammar helpers |
//! | `json_traits.hpp` | `RecordTraits`, `EnumTraits`, `UnionTraits`, `JsonCodec` |
//! | `json_decode.hpp` | `decode`, `decode_into`, `from_json` |
//! | `json_encode.hpp` | `encode`, `to_json` |
//! | `json_stream.hpp` | `stream_items`, `stream_items_from_file` |
//!
//! ## Example
//!
//! ```cpp
//! #include "weft/json/json.hpp"
//!
//! struct User {
//!     std::string name;
//!     int age = 0;
//! };
//!
//! template <> struct weft::json::RecordTraits<User> {
//!     static constexpr auto fields() {
//!         return std::make_tuple(WEFT_JSON_FIELD(User, name), WEFT_JSON_FIELD(User, age));
//!     }
//! };
//!
//! auto user = weft::json::from_json<User>(R"({"name": "Ann", "age": 31})");
//! ```

#pragma once

#include "weft/json/field_match.hpp"
#include "weft/json/json_codecs.hpp"
#include "weft/json/json_decode.hpp"
#include "weft/json/json_encode.hpp"
#include "weft/json/json_error.hpp"
#include "weft/json/json_lexer.hpp"
#include "weft/json/json_options.hpp"
#include "weft/json/json_parser.hpp"
#include "weft/json/json_sink.hpp"
#include "weft/json/json_source.hpp"
#include "weft/json/json_stream.hpp"
#include "weft/json/json_traits.hpp"
#include "weft/json/json_writer.hpp"
