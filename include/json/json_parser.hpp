//! # JSON Parser
//!
//! Recursive descent parser producing a `JsonValue` tree. Used for MCP
//! request frames and for reading surfaces back from `--json` output.
//!
//! - Integers without fraction/exponent stay exact (`Int64` or `Uint64`)
//! - `\uXXXX` escapes (including surrogate pairs) are decoded to UTF-8
//! - Nesting is capped at `MAX_DEPTH` levels
//! - Trailing commas and trailing content are rejected
//!
//! ```cpp
//! auto result = parse_json(R"({"method": "tools/list", "id": 1})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     json.get("method")->as_string();   // "tools/list"
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace apidiff::json {

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    /// Parses the whole input as exactly one JSON value.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    static constexpr size_t MAX_DEPTH = 512;

    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    auto consume_literal(std::string_view word) -> bool;

    [[nodiscard]] auto error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_hex4() -> Result<uint32_t, JsonError>;
};

/// Parses a complete JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace apidiff::json
