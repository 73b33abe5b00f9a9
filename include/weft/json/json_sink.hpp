//! # JSON Output Sinks
//!
//! A `JsonSink` is the sequential character destination the writer emits to.
//! Sinks never throw; a failed write is latched and reported by `ok()`.

#pragma once

#include "weft/common.hpp"
#include "weft/json/json_error.hpp"

#include <fstream>
#include <ostream>
#include <string>
#include <string_view>

namespace weft::json {

/// Abstract sequential character sink.
class JsonSink {
public:
    virtual ~JsonSink() = default;

    virtual void write(char c) = 0;
    virtual void write(std::string_view text) = 0;

    /// Returns `false` once any write has failed.
    [[nodiscard]] virtual auto ok() const -> bool = 0;

    /// Label used in error messages.
    [[nodiscard]] virtual auto label() const -> std::string_view = 0;
};

/// Sink appending to an owned string.
class StringSink : public JsonSink {
public:
    void write(char c) override {
        out_ += c;
    }

    void write(std::string_view text) override {
        out_.append(text);
    }

    [[nodiscard]] auto ok() const -> bool override {
        return true;
    }

    [[nodiscard]] auto label() const -> std::string_view override {
        return "<string>";
    }

    [[nodiscard]] auto str() const -> const std::string& {
        return out_;
    }

    /// Moves the accumulated text out, leaving the sink empty.
    [[nodiscard]] auto take() -> std::string {
        return std::move(out_);
    }

private:
    std::string out_;
};

/// Sink writing to a caller-owned output stream.
class StreamSink : public JsonSink {
public:
    explicit StreamSink(std::ostream& out, std::string label = "<stream>")
        : out_(&out), label_(std::move(label)) {}

    void write(char c) override {
        out_->put(c);
    }

    void write(std::string_view text) override {
        out_->write(text.data(), static_cast<std::streamsize>(text.size()));
    }

    [[nodiscard]] auto ok() const -> bool override {
        return out_->good();
    }

    [[nodiscard]] auto label() const -> std::string_view override {
        return label_;
    }

private:
    std::ostream* out_;
    std::string label_;
};

/// Sink writing to a file it owns. The file is flushed and closed on destruction.
class FileSink : public JsonSink {
public:
    FileSink(const FileSink&) = delete;
    auto operator=(const FileSink&) -> FileSink& = delete;

    /// Creates (or truncates) `path` for writing.
    [[nodiscard]] static auto create(const std::string& path) -> Result<Box<FileSink>, JsonError>;

    void write(char c) override;
    void write(std::string_view text) override;

    [[nodiscard]] auto ok() const -> bool override {
        return file_.is_open() && file_.good();
    }

    [[nodiscard]] auto label() const -> std::string_view override {
        return path_;
    }

    /// Flushes and closes the file. Further writes fail.
    void close();

private:
    explicit FileSink(std::string path);

    std::string path_;
    std::ofstream file_;
};

} // namespace weft::json
