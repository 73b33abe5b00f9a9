//! # Common Definitions
//!
//! This module provides the small set of types shared by every weft component.
//!
//! ## Overview
//!
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: `Box<T>` for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Owned resources travel as `Box<T>`

#ifndef WEFT_COMMON_HPP
#define WEFT_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace weft {

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// Operations that succeed without producing a value return
/// `Result<bool, E>` holding `true`.
///
/// # Example
///
/// ```cpp
/// auto result = weft::json::from_json<int>("42");
/// if (is_ok(result)) {
///     int value = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace weft

#endif // WEFT_COMMON_HPP
