//! # Surface Serialization
//!
//! JSON form of the surface model, used by the CLI `--json` output and the
//! MCP `extract_package_api` tool. Field names are camelCase:
//!
//! ```json
//! {"fullName":"ExamplePkg.Widget","namespace":"ExamplePkg","name":"Widget",
//!  "kind":"class","isPublic":true,"baseType":"System.Object","interfaces":[],
//!  "methods":[{"name":"Run","signature":"Run(Int32)","returnType":"System.Void",
//!              "isStatic":false,"isAsync":false,
//!              "parameters":[{"name":"count","type":"System.Int32","hasDefault":false}]}],
//!  "properties":[{"name":"Size","type":"System.Int32","canRead":true,"canWrite":false}]}
//! ```
//!
//! Optional fields (`baseType`, `obsoleteMessage`, `error`) are omitted when
//! absent. `from_json` accepts exactly what `to_json` writes.

#pragma once

#include "json/json_error.hpp"
#include "json/json_value.hpp"
#include "surface/api_surface.hpp"

namespace apidiff::surface {

[[nodiscard]] auto to_json(const TypeSurface& type) -> json::JsonValue;
[[nodiscard]] auto to_json(const std::vector<TypeSurface>& types) -> json::JsonValue;
[[nodiscard]] auto to_json(const ApiSurface& surface) -> json::JsonValue;

[[nodiscard]] auto type_from_json(const json::JsonValue& value)
    -> Result<TypeSurface, json::JsonError>;
[[nodiscard]] auto types_from_json(const json::JsonValue& value)
    -> Result<std::vector<TypeSurface>, json::JsonError>;
[[nodiscard]] auto surface_from_json(const json::JsonValue& value)
    -> Result<ApiSurface, json::JsonError>;

} // namespace apidiff::surface
