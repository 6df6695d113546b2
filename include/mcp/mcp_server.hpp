//! # MCP Server
//!
//! Model Context Protocol server exposing the package inspector to AI
//! assistants via JSON-RPC 2.0 over stdio.
//!
//! ## Transport
//!
//! - Reads JSON-RPC requests from stdin (one per line)
//! - Writes JSON-RPC responses to stdout (one per line)
//! - Logs go to stderr through the logger, never to stdout
//!
//! ## Protocol Flow
//!
//! 1. Client sends `initialize` request
//! 2. Server responds with capabilities
//! 3. Client sends `notifications/initialized`
//! 4. Client calls tools via `tools/list` and `tools/call`
//! 5. Client sends `shutdown` or closes stdin
//!
//! ## Thread Safety
//!
//! Requests are processed sequentially; a tool handler may use threads
//! internally but returns before the next request is read.

#pragma once

#include "mcp/mcp_types.hpp"

#include "json/json_rpc.hpp"
#include "json/json_value.hpp"

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace apidiff::mcp {

/// Tool handler: receives the call arguments, returns the tool result.
using ToolHandler = std::function<ToolResult(const json::JsonValue& params)>;

class McpServer {
public:
    McpServer(std::string name = "apidiff", std::string version = VERSION);

    void register_tool(Tool tool, ToolHandler handler);

    /// Processes requests until shutdown is requested or `in` closes.
    void run(std::istream& in, std::ostream& out);

    /// `run()` on stdin/stdout.
    void run();

    void stop();

    [[nodiscard]] bool is_running() const {
        return running_;
    }

    /// Handles one raw message. Returns the serialized response, or nullopt
    /// for notifications.
    [[nodiscard]] auto handle_message(std::string_view line) -> std::optional<std::string>;

    [[nodiscard]] auto tools() const -> const std::vector<Tool>& {
        return tools_;
    }

private:
    ServerInfo server_info_;
    ServerCapabilities capabilities_;

    std::optional<ClientInfo> client_info_;
    bool initialized_ = false;
    bool running_ = false;

    std::vector<Tool> tools_;
    std::unordered_map<std::string, ToolHandler> tool_handlers_;

    auto process_request(const json::JsonRpcRequest& request) -> std::optional<json::JsonRpcResponse>;
    static auto error_response(json::JsonValue id, json::JsonRpcErrorCode code,
                               const std::string& message) -> json::JsonRpcResponse;

    // Protocol handlers
    auto handle_initialize(json::JsonValue params, json::JsonValue id) -> json::JsonRpcResponse;
    void handle_initialized();
    auto handle_shutdown(json::JsonValue id) -> json::JsonRpcResponse;
    auto handle_tools_list(json::JsonValue id) -> json::JsonRpcResponse;
    auto handle_tools_call(json::JsonValue params, json::JsonValue id) -> json::JsonRpcResponse;
};

} // namespace apidiff::mcp
