//! # MCP Types
//!
//! Core types for Model Context Protocol (MCP) integration:
//!
//! - **ServerInfo**: Server identity and version
//! - **ClientInfo**: Client identity and version
//! - **ServerCapabilities**: Features the server supports
//! - **Tool**: Tool definition with JSON schema
//! - **ToolResult**: Text content returned by a tool call
//!
//! ## Protocol Version
//!
//! This implementation targets MCP protocol version 2025-03-26.

#pragma once

#include "json/json_value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace apidiff::mcp {

/// MCP protocol version this implementation supports.
constexpr const char* MCP_PROTOCOL_VERSION = "2025-03-26";

/// Server identity, sent during initialization.
struct ServerInfo {
    std::string name;    ///< Server name (e.g., "apidiff")
    std::string version; ///< Server version

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

/// Client identity, received during initialization.
struct ClientInfo {
    std::string name;
    std::string version;

    [[nodiscard]] static auto from_json(const json::JsonValue& json)
        -> std::optional<ClientInfo>;
};

/// One tool input, rendered as a JSON Schema property.
struct ToolParameter {
    std::string name;        ///< Parameter name
    std::string type;        ///< JSON Schema type (string, boolean, ...)
    std::string description; ///< Parameter description
    bool required = true;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

/// Tool definition.
///
/// ```cpp
/// Tool tool{
///     .name = "get_obsolete_apis",
///     .description = "List deprecated APIs of a package version",
///     .parameters = {
///         {"packageId", "string", "NuGet package ID", true},
///         {"version", "string", "Package version", true},
///     }
/// };
/// ```
struct Tool {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

struct ServerCapabilities {
    bool tools = true;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

struct ToolContent {
    std::string type = "text";
    std::string text;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

/// The complete result of a tool invocation.
struct ToolResult {
    std::vector<ToolContent> content;
    bool is_error = false;

    [[nodiscard]] auto to_json() const -> json::JsonValue;

    static auto text(const std::string& text) -> ToolResult;

    static auto error(const std::string& message) -> ToolResult;
};

} // namespace apidiff::mcp
