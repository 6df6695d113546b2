#include "json/json_rpc.hpp"

namespace apidiff::json {

// ============================================================================
// JsonRpcError
// ============================================================================

auto JsonRpcError::from_code(JsonRpcErrorCode code) -> JsonRpcError {
    std::string message;
    switch (code) {
    case JsonRpcErrorCode::ParseError:
        message = "Parse error";
        break;
    case JsonRpcErrorCode::InvalidRequest:
        message = "Invalid Request";
        break;
    case JsonRpcErrorCode::MethodNotFound:
        message = "Method not found";
        break;
    case JsonRpcErrorCode::InvalidParams:
        message = "Invalid params";
        break;
    case JsonRpcErrorCode::InternalError:
        message = "Internal error";
        break;
    case JsonRpcErrorCode::ServerError:
        message = "Server error";
        break;
    }
    return JsonRpcError{static_cast<int>(code), std::move(message), std::nullopt};
}

auto JsonRpcError::make(JsonRpcErrorCode code, std::string message) -> JsonRpcError {
    return JsonRpcError{static_cast<int>(code), std::move(message), std::nullopt};
}

auto JsonRpcError::to_json() const -> JsonValue {
    JsonObject obj;
    obj["code"] = JsonValue(static_cast<int64_t>(code));
    obj["message"] = JsonValue(message);
    if (data.has_value()) {
        obj["data"] = data->clone();
    }
    return JsonValue(std::move(obj));
}

// ============================================================================
// JsonRpcRequest
// ============================================================================

auto JsonRpcRequest::from_json(const JsonValue& json) -> Result<JsonRpcRequest, JsonRpcError> {
    if (!json.is_object()) {
        return JsonRpcError::make(JsonRpcErrorCode::InvalidRequest, "Request must be an object");
    }

    auto* version = json.get("jsonrpc");
    if (version == nullptr || !version->is_string() || version->as_string() != "2.0") {
        return JsonRpcError::make(JsonRpcErrorCode::InvalidRequest,
                                  "Missing or invalid jsonrpc version");
    }

    auto* method = json.get("method");
    if (method == nullptr || !method->is_string()) {
        return JsonRpcError::make(JsonRpcErrorCode::InvalidRequest, "Missing or invalid method");
    }

    JsonRpcRequest request;
    request.method = method->as_string();

    if (auto* params = json.get("params")) {
        if (!params->is_array() && !params->is_object()) {
            return JsonRpcError::make(JsonRpcErrorCode::InvalidParams,
                                      "params must be an array or object");
        }
        request.params = params->clone();
    }

    if (auto* id = json.get("id")) {
        request.id = id->clone();
    }

    return request;
}

// ============================================================================
// JsonRpcResponse
// ============================================================================

auto JsonRpcResponse::success(JsonValue result, JsonValue id) -> JsonRpcResponse {
    JsonRpcResponse response;
    response.result = std::move(result);
    response.id = std::move(id);
    return response;
}

auto JsonRpcResponse::failure(JsonRpcError error, JsonValue id) -> JsonRpcResponse {
    JsonRpcResponse response;
    response.error = std::move(error);
    response.id = std::move(id);
    return response;
}

auto JsonRpcResponse::to_json() const -> JsonValue {
    JsonObject obj;
    obj["jsonrpc"] = JsonValue("2.0");
    obj["id"] = id.clone();
    if (result.has_value()) {
        obj["result"] = result->clone();
    }
    if (error.has_value()) {
        obj["error"] = error->to_json();
    }
    return JsonValue(std::move(obj));
}

} // namespace apidiff::json
