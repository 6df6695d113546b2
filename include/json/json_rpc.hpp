//! # JSON-RPC 2.0 Types
//!
//! Request/response framing for the MCP stdio server.
//!
//! | Code | Name |
//! |------|------|
//! | -32700 | Parse error |
//! | -32600 | Invalid Request |
//! | -32601 | Method not found |
//! | -32602 | Invalid params |
//! | -32603 | Internal error |
//! | -32000 | Server error |

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"

#include <optional>
#include <string>

namespace apidiff::json {

/// Standard JSON-RPC 2.0 error codes.
enum class JsonRpcErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ServerError = -32000
};

/// The `error` member of a failed response.
struct JsonRpcError {
    int code;
    std::string message;
    std::optional<JsonValue> data;

    /// Error with the standard message for `code`.
    static auto from_code(JsonRpcErrorCode code) -> JsonRpcError;

    static auto make(JsonRpcErrorCode code, std::string message) -> JsonRpcError;

    [[nodiscard]] auto to_json() const -> JsonValue;
};

/// An incoming request or notification.
struct JsonRpcRequest {
    std::string method;
    std::optional<JsonValue> params;
    std::optional<JsonValue> id;

    /// Validates `jsonrpc == "2.0"`, a string `method` and object/array `params`.
    [[nodiscard]] static auto from_json(const JsonValue& json)
        -> Result<JsonRpcRequest, JsonRpcError>;

    /// A request without `id` expects no response.
    [[nodiscard]] auto is_notification() const -> bool {
        return !id.has_value();
    }
};

/// An outgoing response: exactly one of `result` and `error` is set.
struct JsonRpcResponse {
    std::optional<JsonValue> result;
    std::optional<JsonRpcError> error;
    JsonValue id;

    static auto success(JsonValue result, JsonValue id) -> JsonRpcResponse;

    static auto failure(JsonRpcError error, JsonValue id) -> JsonRpcResponse;

    [[nodiscard]] auto to_json() const -> JsonValue;
};

} // namespace apidiff::json
