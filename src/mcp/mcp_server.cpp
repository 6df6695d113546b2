//! # MCP Server Implementation
//!
//! ## Message Flow
//!
//! 1. Read line from the input stream
//! 2. Parse as JSON
//! 3. Parse as JSON-RPC request
//! 4. Route to the protocol or tool handler
//! 5. Write the response line, unless the message was a notification

#include "mcp/mcp_server.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <iostream>

namespace apidiff::mcp {

// ============================================================================
// Constructor
// ============================================================================

McpServer::McpServer(std::string name, std::string version)
    : server_info_{std::move(name), std::move(version)} {
    capabilities_.tools = true;
}

// ============================================================================
// Tool Registration
// ============================================================================

void McpServer::register_tool(Tool tool, ToolHandler handler) {
    tool_handlers_[tool.name] = std::move(handler);
    tools_.push_back(std::move(tool));
}

// ============================================================================
// Main Loop
// ============================================================================

void McpServer::run(std::istream& in, std::ostream& out) {
    running_ = true;
    APIDIFF_LOG_INFO("mcp", "MCP server starting (" << server_info_.name << " v"
                                                    << server_info_.version << ")");

    std::string line;
    while (running_ && std::getline(in, line)) {
        if (line.empty() || line == "\r") {
            continue;
        }
        if (auto response = handle_message(line)) {
            out << *response << "\n" << std::flush;
        }
    }

    running_ = false;
    APIDIFF_LOG_INFO("mcp", "MCP server stopped");
}

void McpServer::run() {
    run(std::cin, std::cout);
}

void McpServer::stop() {
    running_ = false;
}

auto McpServer::handle_message(std::string_view line) -> std::optional<std::string> {
    auto json_result = json::parse_json(line);
    if (is_err(json_result)) {
        APIDIFF_LOG_WARN("mcp", "Parse error: " << unwrap_err(json_result).to_string());
        return error_response(json::JsonValue(), json::JsonRpcErrorCode::ParseError,
                              unwrap_err(json_result).message)
            .to_json()
            .to_string();
    }

    auto request_result = json::JsonRpcRequest::from_json(unwrap(json_result));
    if (is_err(request_result)) {
        APIDIFF_LOG_WARN("mcp", "Invalid request: " << unwrap_err(request_result).message);
        return json::JsonRpcResponse::failure(std::move(unwrap_err(request_result)),
                                              json::JsonValue())
            .to_json()
            .to_string();
    }

    auto response = process_request(unwrap(request_result));
    if (!response) {
        return std::nullopt;
    }
    return response->to_json().to_string();
}

// ============================================================================
// Request Processing
// ============================================================================

auto McpServer::process_request(const json::JsonRpcRequest& request)
    -> std::optional<json::JsonRpcResponse> {
    APIDIFF_LOG_DEBUG("mcp", "Request: " << request.method);

    if (request.is_notification()) {
        if (request.method == "notifications/initialized") {
            handle_initialized();
        } else if (request.method != "notifications/cancelled") {
            APIDIFF_LOG_DEBUG("mcp", "Unknown notification: " << request.method);
        }
        return std::nullopt;
    }

    // Clone id for each handler since JsonValue is move-only
    auto id = request.id.value().clone();
    auto params = request.params.has_value() ? request.params->clone() : json::JsonValue();

    if (request.method == "initialize") {
        return handle_initialize(std::move(params), std::move(id));
    }
    if (request.method == "shutdown") {
        return handle_shutdown(std::move(id));
    }
    if (request.method == "ping") {
        return json::JsonRpcResponse::success(json::json_object(), std::move(id));
    }
    if (request.method == "tools/list") {
        return handle_tools_list(std::move(id));
    }
    if (request.method == "tools/call") {
        return handle_tools_call(std::move(params), std::move(id));
    }
    return json::JsonRpcResponse::failure(
        json::JsonRpcError::from_code(json::JsonRpcErrorCode::MethodNotFound), std::move(id));
}

auto McpServer::error_response(json::JsonValue id, json::JsonRpcErrorCode code,
                               const std::string& message) -> json::JsonRpcResponse {
    return json::JsonRpcResponse::failure(json::JsonRpcError::make(code, message), std::move(id));
}

// ============================================================================
// Protocol Handlers
// ============================================================================

auto McpServer::handle_initialize(json::JsonValue params, json::JsonValue id)
    -> json::JsonRpcResponse {
    if (params.is_object()) {
        auto* client_info = params.get("clientInfo");
        if (client_info != nullptr) {
            client_info_ = ClientInfo::from_json(*client_info);
            if (client_info_.has_value()) {
                APIDIFF_LOG_INFO("mcp", "Client: " << client_info_->name << " v"
                                                   << client_info_->version);
            }
        }
    }

    json::JsonObject result;
    result["protocolVersion"] = json::JsonValue(MCP_PROTOCOL_VERSION);
    result["capabilities"] = capabilities_.to_json();
    result["serverInfo"] = server_info_.to_json();

    initialized_ = true;
    return json::JsonRpcResponse::success(json::JsonValue(std::move(result)), std::move(id));
}

void McpServer::handle_initialized() {
    APIDIFF_LOG_DEBUG("mcp", "Initialization complete");
}

auto McpServer::handle_shutdown(json::JsonValue id) -> json::JsonRpcResponse {
    APIDIFF_LOG_INFO("mcp", "Shutdown requested");
    stop();
    return json::JsonRpcResponse::success(json::JsonValue(), std::move(id));
}

auto McpServer::handle_tools_list(json::JsonValue id) -> json::JsonRpcResponse {
    json::JsonArray tools_arr;
    for (const auto& tool : tools_) {
        tools_arr.push_back(tool.to_json());
    }

    json::JsonObject result;
    result["tools"] = json::JsonValue(std::move(tools_arr));
    return json::JsonRpcResponse::success(json::JsonValue(std::move(result)), std::move(id));
}

auto McpServer::handle_tools_call(json::JsonValue params, json::JsonValue id)
    -> json::JsonRpcResponse {
    if (!params.is_object()) {
        return error_response(std::move(id), json::JsonRpcErrorCode::InvalidParams,
                              "params must be an object");
    }

    auto* name_val = params.get("name");
    if (name_val == nullptr || !name_val->is_string()) {
        return error_response(std::move(id), json::JsonRpcErrorCode::InvalidParams,
                              "missing or invalid tool name");
    }

    std::string tool_name = name_val->as_string();
    APIDIFF_LOG_INFO("mcp", "Calling tool: " << tool_name);

    auto it = tool_handlers_.find(tool_name);
    if (it == tool_handlers_.end()) {
        return error_response(std::move(id), json::JsonRpcErrorCode::MethodNotFound,
                              "tool not found: " + tool_name);
    }

    auto* arguments = params.get("arguments");
    json::JsonValue args = (arguments != nullptr) ? arguments->clone() : json::json_object();

    // JSON accessors throw on type mismatches; report them as tool errors
    try {
        ToolResult result = it->second(args);
        return json::JsonRpcResponse::success(result.to_json(), std::move(id));
    } catch (const std::exception& e) {
        APIDIFF_LOG_ERROR("mcp", "Tool " << tool_name << " failed: " << e.what());
        return json::JsonRpcResponse::success(ToolResult::error(e.what()).to_json(),
                                              std::move(id));
    }
}

} // namespace apidiff::mcp
