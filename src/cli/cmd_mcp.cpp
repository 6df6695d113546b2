//! # MCP Command
//!
//! Implements `apidiff mcp`, which serves the package tools over stdio.
//!
//! ## Protocol
//!
//! The server uses JSON-RPC 2.0 over stdio:
//! - Reads requests from stdin (newline-delimited JSON)
//! - Writes responses to stdout (newline-delimited JSON)
//! - Writes logs to stderr

#include "cli/commands.hpp"
#include "log/log.hpp"
#include "mcp/mcp_server.hpp"
#include "mcp/mcp_tools.hpp"
#include "package/nuspec.hpp"

#include <iostream>

namespace apidiff::cli {

auto cmd_mcp(const Config& config) -> int {
    if (config.help) {
        std::cerr << R"(
Usage: apidiff mcp [--source=<url-or-dir>] [--scratch-dir=<dir>] [log options]

Start the apidiff MCP (Model Context Protocol) server on stdio.

Available tools:
  compare_package_versions  Structured API diff between two versions
  get_version_diff_report   Markdown report of the same diff
  extract_package_api       API surface of one version
  decompile_package         Outline source of a package or one type
  get_obsolete_apis         Deprecated types and methods
  has_breaking_changes      Upgrade safety check with counts
)";
        return 0;
    }
    if (!config.positional.empty()) {
        APIDIFF_LOG_ERROR("cli", "mcp takes no arguments, got '" << config.positional.front()
                                                                 << "'");
        return 2;
    }

    package::NuspecManifestReader manifest;

    mcp::McpServer server;
    mcp::register_package_tools(
        server, mcp::ToolContext{.default_source = config.source,
                                 .inspector_options = {.scratch_root = config.scratch_root},
                                 .manifest = &manifest});

    APIDIFF_LOG_INFO("cli", "Starting apidiff MCP server (source " << config.source << ")");
    server.run(std::cin, std::cout);
    APIDIFF_LOG_INFO("cli", "MCP server stopped");
    return 0;
}

} // namespace apidiff::cli
