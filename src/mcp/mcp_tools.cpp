//! # MCP Package Tools Implementation
//!
//! Each handler validates its arguments, builds a registry for the
//! requested source, runs one inspector entry point and returns the result
//! as pretty-printed JSON (or markdown for the report tool).

#include "mcp/mcp_tools.hpp"

#include "diff/diff_json.hpp"
#include "inspector/result_json.hpp"
#include "log/log.hpp"
#include "report/report_formatter.hpp"
#include "surface/surface_json.hpp"

#include <memory>

namespace apidiff::mcp {

// ============================================================================
// Tool Registration
// ============================================================================

void register_package_tools(McpServer& server, ToolContext context) {
    auto shared = std::make_shared<const ToolContext>(std::move(context));
    auto wrap = [shared](ToolResult (*handler)(const ToolContext&, const json::JsonValue&)) {
        return [shared, handler](const json::JsonValue& params) {
            return handler(*shared, params);
        };
    };

    server.register_tool(make_compare_versions_tool(), wrap(handle_compare_versions));
    server.register_tool(make_version_report_tool(), wrap(handle_version_report));
    server.register_tool(make_extract_api_tool(), wrap(handle_extract_api));
    server.register_tool(make_decompile_tool(), wrap(handle_decompile));
    server.register_tool(make_obsolete_apis_tool(), wrap(handle_obsolete_apis));
    server.register_tool(make_breaking_changes_tool(), wrap(handle_breaking_changes));
}

// ============================================================================
// Tool Definitions
// ============================================================================

namespace {

const ToolParameter SOURCE_PARAM{"source", "string",
                                 "Custom NuGet source: service index URL or feed directory",
                                 false};

} // namespace

auto make_compare_versions_tool() -> Tool {
    return Tool{.name = "compare_package_versions",
                .description = "Compare APIs between two package versions. Detects breaking "
                               "changes, removals, additions, obsolete APIs, and sync to async "
                               "migrations.",
                .parameters = {
                    {"packageId", "string", "NuGet package ID (e.g., 'Newtonsoft.Json')", true},
                    {"fromVersion", "string", "Version to compare from (e.g., '12.0.0')", true},
                    {"toVersion", "string", "Version to compare to (e.g., '13.0.0')", true},
                    SOURCE_PARAM,
                }};
}

auto make_version_report_tool() -> Tool {
    return Tool{.name = "get_version_diff_report",
                .description = "Markdown report of API changes between package versions: "
                               "breaking changes, deprecations and new features.",
                .parameters = {
                    {"packageId", "string", "NuGet package ID", true},
                    {"fromVersion", "string", "Source version", true},
                    {"toVersion", "string", "Target version", true},
                    SOURCE_PARAM,
                }};
}

auto make_extract_api_tool() -> Tool {
    return Tool{.name = "extract_package_api",
                .description = "Extract the API surface of a package version: types, methods "
                               "and properties with signatures.",
                .parameters = {
                    {"packageId", "string", "NuGet package ID", true},
                    {"version", "string", "Package version", true},
                    {"includePrivate", "boolean", "Include non-public types and members", false},
                    SOURCE_PARAM,
                }};
}

auto make_decompile_tool() -> Tool {
    return Tool{.name = "decompile_package",
                .description = "Outline source of a package's primary assembly, or of one type "
                               "in it.",
                .parameters = {
                    {"packageId", "string", "NuGet package ID", true},
                    {"version", "string", "Package version", true},
                    {"typeName", "string", "Full name of one type; omit for the whole assembly",
                     false},
                    SOURCE_PARAM,
                }};
}

auto make_obsolete_apis_tool() -> Tool {
    return Tool{.name = "get_obsolete_apis",
                .description = "List obsolete/deprecated types and methods of a package version.",
                .parameters = {
                    {"packageId", "string", "NuGet package ID", true},
                    {"version", "string", "Package version", true},
                    SOURCE_PARAM,
                }};
}

auto make_breaking_changes_tool() -> Tool {
    return Tool{.name = "has_breaking_changes",
                .description = "Quick check whether upgrading between two versions breaks the "
                               "API, with a short summary.",
                .parameters = {
                    {"packageId", "string", "NuGet package ID", true},
                    {"fromVersion", "string", "Source version", true},
                    {"toVersion", "string", "Target version", true},
                    SOURCE_PARAM,
                }};
}

// ============================================================================
// Argument Helpers
// ============================================================================

namespace {

auto string_arg(const json::JsonValue& params, const std::string& name)
    -> std::optional<std::string> {
    auto* value = params.get(name);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return value->as_string();
}

auto bool_arg(const json::JsonValue& params, const std::string& name) -> bool {
    auto* value = params.get(name);
    return value != nullptr && value->is_bool() && value->as_bool();
}

/// Registry + inspector for one call.
struct Session {
    Box<package::RegistryClient> registry;
    Box<inspector::PackageInspector> inspector;
};

auto open_session(const ToolContext& context, const json::JsonValue& params) -> Session {
    std::string source = string_arg(params, "source").value_or(context.default_source);
    Session session;
    session.registry = context.make_registry(source);
    session.inspector = make_box<inspector::PackageInspector>(
        *session.registry, *context.manifest, context.inspector_options);
    return session;
}

struct VersionPair {
    std::string package_id;
    std::string from;
    std::string to;
};

auto version_pair(const json::JsonValue& params) -> std::optional<VersionPair> {
    auto id = string_arg(params, "packageId");
    auto from = string_arg(params, "fromVersion");
    auto to = string_arg(params, "toVersion");
    if (!id || !from || !to) {
        return std::nullopt;
    }
    return VersionPair{*id, *from, *to};
}

auto failed(const inspector::InspectorError& error) -> ToolResult {
    APIDIFF_LOG_WARN("mcp", error.to_string());
    return ToolResult::error(error.to_string());
}

constexpr const char* MISSING_PAIR =
    "Missing or invalid 'packageId', 'fromVersion' or 'toVersion' parameter";
constexpr const char* MISSING_VERSION = "Missing or invalid 'packageId' or 'version' parameter";

} // namespace

// ============================================================================
// Tool Handlers
// ============================================================================

auto handle_compare_versions(const ToolContext& context, const json::JsonValue& params)
    -> ToolResult {
    auto pair = version_pair(params);
    if (!pair) {
        return ToolResult::error(MISSING_PAIR);
    }
    auto session = open_session(context, params);
    auto result =
        session.inspector->compare_versions(pair->package_id, pair->from, pair->to, {}).get();
    if (is_err(result)) {
        return failed(unwrap_err(result));
    }
    return ToolResult::text(diff::to_json(unwrap(result)).to_string_pretty());
}

auto handle_version_report(const ToolContext& context, const json::JsonValue& params)
    -> ToolResult {
    auto pair = version_pair(params);
    if (!pair) {
        return ToolResult::error(MISSING_PAIR);
    }
    auto session = open_session(context, params);
    auto result =
        session.inspector->version_report(pair->package_id, pair->from, pair->to, {}).get();
    if (is_err(result)) {
        return failed(unwrap_err(result));
    }
    return ToolResult::text(unwrap(result));
}

auto handle_extract_api(const ToolContext& context, const json::JsonValue& params) -> ToolResult {
    auto id = string_arg(params, "packageId");
    auto version = string_arg(params, "version");
    if (!id || !version) {
        return ToolResult::error(MISSING_VERSION);
    }
    auto session = open_session(context, params);
    auto result =
        session.inspector->extract_surface(*id, *version, bool_arg(params, "includePrivate"), {})
            .get();
    if (is_err(result)) {
        return failed(unwrap_err(result));
    }
    return ToolResult::text(surface::to_json(unwrap(result)).to_string_pretty());
}

auto handle_decompile(const ToolContext& context, const json::JsonValue& params) -> ToolResult {
    auto id = string_arg(params, "packageId");
    auto version = string_arg(params, "version");
    if (!id || !version) {
        return ToolResult::error(MISSING_VERSION);
    }
    auto session = open_session(context, params);
    auto result =
        session.inspector->decompile(*id, *version, string_arg(params, "typeName"), {}).get();
    if (is_err(result)) {
        return failed(unwrap_err(result));
    }
    return ToolResult::text(inspector::to_json(unwrap(result)).to_string_pretty());
}

auto handle_obsolete_apis(const ToolContext& context, const json::JsonValue& params)
    -> ToolResult {
    auto id = string_arg(params, "packageId");
    auto version = string_arg(params, "version");
    if (!id || !version) {
        return ToolResult::error(MISSING_VERSION);
    }
    auto session = open_session(context, params);
    auto result = session.inspector->obsolete_apis(*id, *version, {}).get();
    if (is_err(result)) {
        return failed(unwrap_err(result));
    }
    return ToolResult::text(inspector::to_json(unwrap(result)).to_string_pretty());
}

auto handle_breaking_changes(const ToolContext& context, const json::JsonValue& params)
    -> ToolResult {
    auto pair = version_pair(params);
    if (!pair) {
        return ToolResult::error(MISSING_PAIR);
    }
    auto session = open_session(context, params);
    auto result =
        session.inspector->has_breaking_changes(pair->package_id, pair->from, pair->to, {})
            .get();
    if (is_err(result)) {
        return failed(unwrap_err(result));
    }
    return ToolResult::text(inspector::to_json(unwrap(result)).to_string_pretty());
}

} // namespace apidiff::mcp
