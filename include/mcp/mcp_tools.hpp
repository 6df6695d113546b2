//! # MCP Package Tools
//!
//! Tool definitions and handlers exposing the package inspector.
//!
//! | Tool | Description |
//! |------|-------------|
//! | `compare_package_versions` | Structured diff between two versions |
//! | `get_version_diff_report` | Markdown report of the same diff |
//! | `extract_package_api` | Full API surface of one version |
//! | `decompile_package` | Outline source of a package or one type |
//! | `get_obsolete_apis` | Deprecated types and methods of one version |
//! | `has_breaking_changes` | Yes/no upgrade check with counts |
//!
//! Every tool takes an optional `source` (feed directory or service-index
//! URL); without one the server's configured source is used.
//!
//! ## Usage
//!
//! ```cpp
//! mcp::McpServer server;
//! mcp::register_package_tools(server, mcp::ToolContext{...});
//! server.run();
//! ```

#pragma once

#include "inspector/package_inspector.hpp"
#include "mcp/mcp_server.hpp"
#include "package/registry.hpp"

#include <functional>

namespace apidiff::mcp {

/// Builds the registry client for one tool call.
using RegistryFactory = std::function<Box<package::RegistryClient>(const std::string& source)>;

/// What every tool handler needs besides its arguments.
struct ToolContext {
    std::string default_source = package::DEFAULT_SOURCE;
    inspector::InspectorOptions inspector_options;
    const package::ManifestReader* manifest = nullptr;
    RegistryFactory make_registry = package::make_registry;
};

/// Registers the six package tools. `context.manifest` must outlive the server.
void register_package_tools(McpServer& server, ToolContext context);

// ============================================================================
// Tool Definitions
// ============================================================================

auto make_compare_versions_tool() -> Tool;
auto make_version_report_tool() -> Tool;
auto make_extract_api_tool() -> Tool;
auto make_decompile_tool() -> Tool;
auto make_obsolete_apis_tool() -> Tool;
auto make_breaking_changes_tool() -> Tool;

// ============================================================================
// Tool Handlers
// ============================================================================

auto handle_compare_versions(const ToolContext& context, const json::JsonValue& params)
    -> ToolResult;
auto handle_version_report(const ToolContext& context, const json::JsonValue& params)
    -> ToolResult;
auto handle_extract_api(const ToolContext& context, const json::JsonValue& params) -> ToolResult;
auto handle_decompile(const ToolContext& context, const json::JsonValue& params) -> ToolResult;
auto handle_obsolete_apis(const ToolContext& context, const json::JsonValue& params)
    -> ToolResult;
auto handle_breaking_changes(const ToolContext& context, const json::JsonValue& params)
    -> ToolResult;

} // namespace apidiff::mcp
