//! # JSON Error Types
//!
//! Parse errors with line/column/offset location.

#pragma once

#include <cstddef>
#include <string>

namespace apidiff::json {

/// A JSON parse error.
///
/// `to_string()` renders "line 5, column 12: Unexpected token" when a
/// location is known and just the message otherwise.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    static auto make(std::string msg, size_t line = 0, size_t column = 0, size_t offset = 0)
        -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace apidiff::json
