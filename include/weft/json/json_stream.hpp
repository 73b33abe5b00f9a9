//! # Streaming Item Decoding
//!
//! `JsonItems<T>` walks a top-level JSON array one element at a time,
//! decoding each element into a `T` on demand. Only the element being
//! decoded is held in memory, so arbitrarily long arrays can be processed.
//!
//! ## Lifecycle
//!
//! The iterator owns its source. The source is released as soon as the
//! closing `]` has been consumed, when a decode error occurs, or when the
//! iterator is destroyed or closed early, whichever happens first. After
//! exhaustion or an error every further pull reports the end.
//!
//! Nothing after the closing `]` is read or checked.
//!
//! ## Example
//!
//! ```cpp
//! auto items = stream_items_from_file<Event>("events.json");
//! if (is_err(items)) {
//!     return unwrap_err(items);
//! }
//! for (auto& item : unwrap(items)) {
//!     if (is_err(item)) {
//!         return unwrap_err(item);
//!     }
//!     handle(unwrap(item));
//! }
//! ```

#pragma once

#include "weft/common.hpp"
#include "weft/json/json_decode.hpp"
#include "weft/json/json_error.hpp"
#include "weft/json/json_options.hpp"
#include "weft/json/json_parser.hpp"
#include "weft/json/json_source.hpp"
#include "weft/log/log.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace weft::json {

template <typename T> class JsonItems {
public:
    /// Input iterator over the decoded elements.
    ///
    /// Dereferencing yields a `Result<T, JsonError>`. An error is yielded at
    /// most once and ends the iteration.
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Result<T, JsonError>;
        using difference_type = std::ptrdiff_t;
        using pointer = value_type*;
        using reference = value_type&;

        Iterator() = default;

        explicit Iterator(JsonItems* items) : items_(items) {
            fetch();
        }

        auto operator*() -> reference {
            return *current_;
        }

        auto operator->() -> pointer {
            return &*current_;
        }

        auto operator++() -> Iterator& {
            fetch();
            return *this;
        }

        void operator++(int) {
            fetch();
        }

        friend auto operator==(const Iterator& a, const Iterator& b) -> bool {
            return a.items_ == b.items_;
        }

    private:
        JsonItems* items_ = nullptr;
        std::optional<value_type> current_;

        void fetch() {
            if (!items_ || items_->is_done()) {
                items_ = nullptr;
                current_.reset();
                return;
            }
            auto next = items_->next();
            if (is_err(next)) {
                current_.emplace(std::in_place_index<1>, std::move(unwrap_err(next)));
                return;
            }
            auto& item = unwrap(next);
            if (!item) {
                items_ = nullptr;
                current_.reset();
                return;
            }
            current_.emplace(std::in_place_index<0>, std::move(*item));
        }
    };

    explicit JsonItems(Box<JsonSource> source, DecodeOptions options = {})
        : source_(std::move(source)) {
        if (source_) {
            parser_ = make_box<JsonParser>(*source_, options);
        } else {
            state_ = State::Done;
        }
    }

    /// The moved-from iterator is left done, without a source.
    JsonItems(JsonItems&& other) noexcept
        : source_(std::move(other.source_)), parser_(std::move(other.parser_)),
          state_(other.state_) {
        other.state_ = State::Done;
    }

    auto operator=(JsonItems&& other) noexcept -> JsonItems& {
        if (this != &other) {
            close();
            source_ = std::move(other.source_);
            parser_ = std::move(other.parser_);
            state_ = other.state_;
            other.state_ = State::Done;
        }
        return *this;
    }

    JsonItems(const JsonItems&) = delete;
    auto operator=(const JsonItems&) -> JsonItems& = delete;

    ~JsonItems() {
        close();
    }

    /// Decodes the next element.
    ///
    /// Returns an empty optional once the array has been fully consumed.
    [[nodiscard]] auto next() -> Result<std::optional<T>, JsonError> {
        if (state_ == State::Done) {
            return std::optional<T>{};
        }

        if (state_ == State::Start) {
            WEFT_LOG_TRACE("json", "streaming items from " << parser_->label());
            auto open = parser_->expect(JsonTokenKind::LBracket);
            if (is_err(open)) {
                return fail(std::move(unwrap_err(open)));
            }
            state_ = State::Items;
            if (parser_->match(JsonTokenKind::RBracket)) {
                close();
                return std::optional<T>{};
            }
        }

        T item{};
        auto decoded = decode_value(*parser_, item);
        if (is_err(decoded)) {
            return fail(std::move(unwrap_err(decoded)));
        }

        auto more = parser_->after_element(JsonTokenKind::RBracket);
        if (is_err(more)) {
            return fail(std::move(unwrap_err(more)));
        }
        if (!unwrap(more)) {
            close();
        }
        return std::optional<T>(std::move(item));
    }

    /// Returns `true` once no further element will be produced.
    [[nodiscard]] auto is_done() const -> bool {
        return state_ == State::Done;
    }

    /// Returns `true` while the iterator still holds its source.
    [[nodiscard]] auto holds_source() const -> bool {
        return source_ != nullptr;
    }

    /// Stops the iteration and releases the source. Idempotent.
    void close() {
        state_ = State::Done;
        parser_.reset();
        if (source_) {
            WEFT_LOG_TRACE("json", "releasing item source " << source_->label());
            source_->close();
            source_.reset();
        }
    }

    auto begin() -> Iterator {
        return Iterator(this);
    }

    auto end() -> Iterator {
        return Iterator();
    }

private:
    enum class State { Start, Items, Done };

    Box<JsonSource> source_;
    Box<JsonParser> parser_;
    State state_ = State::Start;

    auto fail(JsonError error) -> Result<std::optional<T>, JsonError> {
        WEFT_LOG_DEBUG("json", "item stream failed: " << error.to_string());
        close();
        return error;
    }
};

/// Iterates the elements of the top-level array read from `source`.
template <typename T>
[[nodiscard]] auto stream_items(Box<JsonSource> source, DecodeOptions options = {})
    -> JsonItems<T> {
    return JsonItems<T>(std::move(source), options);
}

/// Opens `path` and iterates the elements of its top-level array.
///
/// Returns an `Io` error if the file cannot be opened.
template <typename T>
[[nodiscard]] auto stream_items_from_file(const std::string& path, DecodeOptions options = {})
    -> Result<JsonItems<T>, JsonError> {
    auto file = FileSource::open(path);
    if (is_err(file)) {
        return unwrap_err(file);
    }
    return JsonItems<T>(std::move(unwrap(file)), options);
}

} // namespace weft::json
