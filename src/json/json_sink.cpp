//! # JSON Output Sinks
//!
//! Implements the file-backed sink. The string and stream sinks are
//! header-only.

#include "weft/json/json_sink.hpp"

#include "weft/log/log.hpp"

namespace weft::json {

FileSink::FileSink(std::string path) : path_(std::move(path)) {}

auto FileSink::create(const std::string& path) -> Result<Box<FileSink>, JsonError> {
    Box<FileSink> sink(new FileSink(path));
    sink->file_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!sink->file_.is_open()) {
        WEFT_LOG_DEBUG("json", "cannot create " << path);
        return JsonError::make(JsonErrorKind::Io, "cannot open file for writing", path, 0, 0);
    }
    return std::move(sink);
}

void FileSink::write(char c) {
    if (file_.is_open()) {
        file_.put(c);
    }
}

void FileSink::write(std::string_view text) {
    if (file_.is_open()) {
        file_.write(text.data(), static_cast<std::streamsize>(text.size()));
    }
}

void FileSink::close() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

} // namespace weft::json
