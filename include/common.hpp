//! # Common Definitions
//!
//! This module provides common types and utilities used throughout apidiff.
//! It establishes the foundational abstractions that all other components
//! (archive reading, metadata loading, surface extraction, diffing) depend on.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Byte Buffers**: The owned byte container passed between components
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Recoverable errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership, `Rc<T>` for shared
//! - **Plain Data Out**: Anything that leaves a loader context is a value type

#ifndef APIDIFF_COMMON_HPP
#define APIDIFF_COMMON_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace apidiff {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 3;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Byte Buffers
// ============================================================================

/// An owned, contiguous run of bytes (a downloaded archive, an extracted module).
using ByteBuffer = std::vector<uint8_t>;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions. This follows the Rust convention.
///
/// # Example
///
/// ```cpp
/// Result<ZipArchive, ArchiveError> open(const ByteBuffer& bytes);
///
/// auto result = ZipArchive::open(bytes);
/// if (is_ok(result)) {
///     auto& archive = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer (like Rust's `Box<T>`).
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer (like Rust's `Rc<T>`).
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Creates a new Rc containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Cancellation
// ============================================================================

/// Cooperative cancellation flag shared between a caller and its tasks.
///
/// Copies share one flag. Long-running loops call `is_cancelled()` between
/// iterations (modules, types, HTTP progress ticks) and bail out.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const {
        flag_->store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        return flag_->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// ============================================================================
// String Helpers
// ============================================================================

/// ASCII lowercase copy (registry ids and file names are ASCII-insensitive).
[[nodiscard]] inline auto to_lower_ascii(std::string_view s) -> std::string {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

/// Returns true if `s` ends with `suffix`, ignoring ASCII case.
[[nodiscard]] inline auto ends_with_icase(std::string_view s, std::string_view suffix) -> bool {
    if (s.size() < suffix.size()) {
        return false;
    }
    return to_lower_ascii(s.substr(s.size() - suffix.size())) == to_lower_ascii(suffix);
}

/// Returns true if a string is empty or whitespace only.
[[nodiscard]] inline auto is_blank(std::string_view s) -> bool {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            return false;
        }
    }
    return true;
}

} // namespace apidiff

#endif // APIDIFF_COMMON_HPP
