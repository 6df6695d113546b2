//! # Diff Serialization
//!
//! JSON form of a `DiffResult`, as returned by `compare_package_versions`
//! and `apidiff diff --json`. Bucket names are camelCase; the derived flags
//! are included so callers need not recompute them.

#pragma once

#include "diff/change_set.hpp"
#include "json/json_value.hpp"

namespace apidiff::diff {

[[nodiscard]] auto to_json(const ChangeSet& changes) -> json::JsonValue;
[[nodiscard]] auto to_json(const DiffResult& result) -> json::JsonValue;

} // namespace apidiff::diff
