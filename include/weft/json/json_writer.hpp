//! # JSON Writer
//!
//! Token-level JSON writer over a `JsonSink`. The encode engine calls it in
//! document order; the writer inserts commas, colons and (optionally)
//! indentation, using a stack of open containers.
//!
//! ## Example
//!
//! ```cpp
//! StringSink sink;
//! JsonWriter writer(sink);
//! writer.begin_object();
//! writer.key("name");
//! writer.string("Alice");
//! writer.key("scores");
//! writer.begin_array();
//! writer.integer(95);
//! writer.integer(87);
//! writer.end_array();
//! writer.end_object();
//! // sink.str() == R"({"name":"Alice","scores":[95,87]})"
//! ```

#pragma once

#include "weft/json/json_options.hpp"
#include "weft/json/json_sink.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace weft::json {

/// Escapes a string for JSON output (without surrounding quotes).
///
/// | Character | Escape Sequence |
/// |-----------|-----------------|
/// | `"` | `\"` |
/// | `\` | `\\` |
/// | Backspace | `\b` |
/// | Form feed | `\f` |
/// | Line feed | `\n` |
/// | Carriage return | `\r` |
/// | Tab | `\t` |
/// | Other control (0x00-0x1F) | `\u00XX` |
[[nodiscard]] auto escape_string(std::string_view s) -> std::string;

/// Formats a double using the shortest representation that round-trips.
///
/// Integral values keep a trailing `.0`; NaN and infinities become `null`.
[[nodiscard]] auto format_double(double value) -> std::string;

/// `format_double` at `long double` precision.
[[nodiscard]] auto format_long_double(long double value) -> std::string;

class JsonWriter {
public:
    explicit JsonWriter(JsonSink& sink, EncodeOptions options = {});

    void begin_object();
    void end_object();
    void begin_array();
    void end_array();

    /// Writes an object key. The next call must write its value.
    void key(std::string_view name);

    void null();
    void boolean(bool value);
    void integer(int64_t value);
    void unsigned_integer(uint64_t value);
    void floating(double value);
    void floating(long double value);
    void string(std::string_view value);

    /// Returns `false` once the sink has reported a failed write.
    [[nodiscard]] auto ok() const -> bool {
        return sink_.ok();
    }

    [[nodiscard]] auto sink() -> JsonSink& {
        return sink_;
    }

private:
    struct Frame {
        enum class Kind { Object, Array };
        Kind kind;
        size_t count = 0;
    };

    JsonSink& sink_;
    EncodeOptions options_;
    std::vector<Frame> stack_;
    bool after_key_ = false;

    /// Emits the separator and indentation that precede a value.
    void before_value();

    void newline_indent(size_t depth);
};

} // namespace weft::json
