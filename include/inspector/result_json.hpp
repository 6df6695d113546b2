//! # Inspector Result Serialization
//!
//! JSON forms of the auxiliary inspector results (`decompile_package`,
//! `get_obsolete_apis`, `has_breaking_changes`). Optional fields are
//! omitted when unset.

#pragma once

#include "inspector/inspector_types.hpp"
#include "json/json_value.hpp"

namespace apidiff::inspector {

[[nodiscard]] auto to_json(const DecompileResult& result) -> json::JsonValue;
[[nodiscard]] auto to_json(const ObsoleteApisResult& result) -> json::JsonValue;
[[nodiscard]] auto to_json(const BreakingChangesCheck& check) -> json::JsonValue;

} // namespace apidiff::inspector
