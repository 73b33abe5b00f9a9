//! # JSON Writer Implementation
//!
//! ## Features
//!
//! - **Compact output**: No whitespace between elements (default)
//! - **Pretty printing**: `EncodeOptions::indent` spaces per level
//! - **String escaping**: Handles special characters and control codes
//! - **Integer preservation**: Integers are written without a decimal point
//!
//! ## Pretty Output
//!
//! ```text
//! {
//!   "name": "Alice",
//!   "tags": [],
//!   "scores": [
//!     95,
//!     87
//!   ]
//! }
//! ```

#include "weft/json/json_writer.hpp"

#include <array>
#include <charconv>
#include <cmath>

namespace weft::json {

auto escape_string(std::string_view s) -> std::string {
    static constexpr char HEX[] = "0123456789abcdef";

    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                auto byte = static_cast<unsigned char>(c);
                result += "\\u00";
                result += HEX[byte >> 4];
                result += HEX[byte & 0x0F];
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

namespace {

template <typename F> auto format_floating(F value) -> std::string {
    // JSON has no representation for these
    if (std::isnan(value) || std::isinf(value)) {
        return "null";
    }

    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        return "null";
    }
    std::string result(buf.data(), ptr);

    // Keep floats recognizable as floats
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

} // namespace

auto format_double(double value) -> std::string {
    return format_floating(value);
}

auto format_long_double(long double value) -> std::string {
    return format_floating(value);
}

// ============================================================================
// JsonWriter
// ============================================================================

JsonWriter::JsonWriter(JsonSink& sink, EncodeOptions options) : sink_(sink), options_(options) {}

void JsonWriter::newline_indent(size_t depth) {
    sink_.write('\n');
    sink_.write(std::string(depth * static_cast<size_t>(options_.indent), ' '));
}

void JsonWriter::before_value() {
    if (after_key_) {
        after_key_ = false;
        return;
    }
    if (stack_.empty()) {
        return;
    }
    auto& frame = stack_.back();
    if (frame.count > 0) {
        sink_.write(',');
    }
    if (options_.indent > 0) {
        newline_indent(stack_.size());
    }
    ++frame.count;
}

void JsonWriter::begin_object() {
    before_value();
    sink_.write('{');
    stack_.push_back(Frame{Frame::Kind::Object, 0});
}

void JsonWriter::end_object() {
    if (stack_.empty()) {
        return;
    }
    Frame frame = stack_.back();
    stack_.pop_back();
    if (options_.indent > 0 && frame.count > 0) {
        newline_indent(stack_.size());
    }
    sink_.write('}');
}

void JsonWriter::begin_array() {
    before_value();
    sink_.write('[');
    stack_.push_back(Frame{Frame::Kind::Array, 0});
}

void JsonWriter::end_array() {
    if (stack_.empty()) {
        return;
    }
    Frame frame = stack_.back();
    stack_.pop_back();
    if (options_.indent > 0 && frame.count > 0) {
        newline_indent(stack_.size());
    }
    sink_.write(']');
}

void JsonWriter::key(std::string_view name) {
    before_value();
    sink_.write('"');
    sink_.write(escape_string(name));
    sink_.write(options_.indent > 0 ? "\": " : "\":");
    after_key_ = true;
}

void JsonWriter::null() {
    before_value();
    sink_.write("null");
}

void JsonWriter::boolean(bool value) {
    before_value();
    sink_.write(value ? "true" : "false");
}

void JsonWriter::integer(int64_t value) {
    before_value();
    sink_.write(std::to_string(value));
}

void JsonWriter::unsigned_integer(uint64_t value) {
    before_value();
    sink_.write(std::to_string(value));
}

void JsonWriter::floating(double value) {
    before_value();
    sink_.write(format_double(value));
}

void JsonWriter::floating(long double value) {
    before_value();
    sink_.write(format_long_double(value));
}

void JsonWriter::string(std::string_view value) {
    before_value();
    sink_.write('"');
    sink_.write(escape_string(value));
    sink_.write('"');
}

} // namespace weft::json
