//! # JSON Input Sources
//!
//! Implements the string, stream and file backed `JsonSource` adapters.

#include "weft/json/json_source.hpp"

#include "weft/log/log.hpp"

namespace weft::json {

// ============================================================================
// StringSource
// ============================================================================

StringSource::StringSource(std::string content, std::string label)
    : content_(std::move(content)), label_(std::move(label)) {}

auto StringSource::peek() -> int {
    if (!open_ || pos_ >= content_.size()) {
        return END_OF_INPUT;
    }
    return static_cast<unsigned char>(content_[pos_]);
}

auto StringSource::get() -> int {
    if (!open_ || pos_ >= content_.size()) {
        return END_OF_INPUT;
    }
    return static_cast<unsigned char>(content_[pos_++]);
}

auto StringSource::remaining() const -> std::string_view {
    if (pos_ >= content_.size()) {
        return {};
    }
    return std::string_view(content_).substr(pos_);
}

// ============================================================================
// StreamSource
// ============================================================================

StreamSource::StreamSource(std::istream& in, std::string label)
    : in_(&in), label_(std::move(label)) {}

auto StreamSource::peek() -> int {
    if (in_ == nullptr) {
        return END_OF_INPUT;
    }
    auto c = in_->peek();
    if (c == std::istream::traits_type::eof()) {
        return END_OF_INPUT;
    }
    return static_cast<unsigned char>(c);
}

auto StreamSource::get() -> int {
    if (in_ == nullptr) {
        return END_OF_INPUT;
    }
    auto c = in_->get();
    if (c == std::istream::traits_type::eof()) {
        return END_OF_INPUT;
    }
    return static_cast<unsigned char>(c);
}

// ============================================================================
// FileSource
// ============================================================================

FileSource::FileSource(std::string path) : path_(std::move(path)) {}

auto FileSource::open(const std::string& path) -> Result<Box<FileSource>, JsonError> {
    Box<FileSource> source(new FileSource(path));
    source->file_.open(path, std::ios::in | std::ios::binary);
    if (!source->file_.is_open()) {
        WEFT_LOG_DEBUG("json", "cannot open " << path);
        return JsonError::make(JsonErrorKind::Io, "cannot open file for reading", path, 0, 0);
    }
    WEFT_LOG_TRACE("json", "opened " << path);
    return std::move(source);
}

auto FileSource::peek() -> int {
    if (!file_.is_open()) {
        return END_OF_INPUT;
    }
    auto c = file_.peek();
    if (c == std::ifstream::traits_type::eof()) {
        return END_OF_INPUT;
    }
    return static_cast<unsigned char>(c);
}

auto FileSource::get() -> int {
    if (!file_.is_open()) {
        return END_OF_INPUT;
    }
    auto c = file_.get();
    if (c == std::ifstream::traits_type::eof()) {
        return END_OF_INPUT;
    }
    return static_cast<unsigned char>(c);
}

void FileSource::close() {
    if (file_.is_open()) {
        file_.close();
        WEFT_LOG_TRACE("json", "closed " << path_);
    }
}

} // namespace weft::json
