//! # JSON Input Sources
//!
//! A `JsonSource` is the sequential character supply the lexer reads from.
//! It only needs "give me the next character", one character of lookahead
//! and a label used in diagnostics. Seeking is never required.
//!
//! ## Implementations
//!
//! | Type | Backing store | Ownership |
//! |------|---------------|-----------|
//! | `StringSource` | In-memory string | Owns a copy |
//! | `StreamSource` | `std::istream` | Borrows |
//! | `FileSource` | `std::ifstream` | Owns, closed on destruction |
//!
//! ## Example
//!
//! ```cpp
//! auto file = FileSource::open("records.json");
//! if (is_ok(file)) {
//!     auto items = stream_items<Record>(std::move(unwrap(file)));
//! }
//! ```

#pragma once

#include "weft/common.hpp"
#include "weft/json/json_error.hpp"

#include <fstream>
#include <istream>
#include <string>
#include <string_view>

namespace weft::json {

/// Value returned by `peek()` and `get()` once the input is exhausted.
constexpr int END_OF_INPUT = -1;

/// Abstract sequential character source.
///
/// Characters are returned as `int` in the range 0..255, or `END_OF_INPUT`.
/// A closed source behaves as if it were exhausted.
class JsonSource {
public:
    virtual ~JsonSource() = default;

    /// Returns the next character without consuming it.
    virtual auto peek() -> int = 0;

    /// Consumes and returns the next character.
    virtual auto get() -> int = 0;

    /// Returns the label used in error messages.
    [[nodiscard]] virtual auto label() const -> std::string_view = 0;

    /// Returns `true` until `close()` is called.
    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    /// Releases the underlying resource. Idempotent.
    virtual void close() = 0;
};

/// Source reading from an in-memory copy of the input text.
class StringSource : public JsonSource {
public:
    explicit StringSource(std::string content, std::string label = "<input>");

    auto peek() -> int override;
    auto get() -> int override;

    [[nodiscard]] auto label() const -> std::string_view override {
        return label_;
    }

    [[nodiscard]] auto is_open() const -> bool override {
        return open_;
    }

    void close() override {
        open_ = false;
    }

    /// Number of characters consumed so far.
    [[nodiscard]] auto position() const -> size_t {
        return pos_;
    }

    /// Returns the unconsumed rest of the input.
    [[nodiscard]] auto remaining() const -> std::string_view;

private:
    std::string content_;
    std::string label_;
    size_t pos_ = 0;
    bool open_ = true;
};

/// Source reading from a caller-owned input stream.
///
/// `close()` only detaches from the stream; the stream itself stays valid.
class StreamSource : public JsonSource {
public:
    explicit StreamSource(std::istream& in, std::string label = "<stream>");

    auto peek() -> int override;
    auto get() -> int override;

    [[nodiscard]] auto label() const -> std::string_view override {
        return label_;
    }

    [[nodiscard]] auto is_open() const -> bool override {
        return in_ != nullptr;
    }

    void close() override {
        in_ = nullptr;
    }

private:
    std::istream* in_;
    std::string label_;
};

/// Source reading from a file it owns.
///
/// The file is closed by `close()` or on destruction, whichever comes first.
/// Only an explicit `close()` is logged.
class FileSource : public JsonSource {
public:
    FileSource(const FileSource&) = delete;
    auto operator=(const FileSource&) -> FileSource& = delete;

    /// Opens `path` for reading.
    ///
    /// Returns an `Io` error if the file cannot be opened.
    [[nodiscard]] static auto open(const std::string& path) -> Result<Box<FileSource>, JsonError>;

    auto peek() -> int override;
    auto get() -> int override;

    [[nodiscard]] auto label() const -> std::string_view override {
        return path_;
    }

    [[nodiscard]] auto is_open() const -> bool override {
        return file_.is_open();
    }

    void close() override;

private:
    explicit FileSource(std::string path);

    std::string path_;
    std::ifstream file_;
};

} // namespace weft::json
