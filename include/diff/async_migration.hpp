//! # Sync-to-Async Heuristic
//!
//! A removed synchronous method `Foo` counts as migrated when the new
//! version of its type has an async-shaped `FooAsync`. This is a name and
//! return-shape match only; false positives are accepted.
//!
//! When several added `FooAsync` overloads qualify, one is consumed (so it
//! is not also reported as an addition), chosen in this order:
//!
//! 1. same parameter types as `Foo`
//! 2. same parameter types plus a trailing `CancellationToken`
//! 3. first in surface order
//!
//! Each added overload is consumed at most once.

#pragma once

#include "surface/api_surface.hpp"

#include <optional>
#include <vector>

namespace apidiff::diff {

constexpr const char* ASYNC_SUFFIX = "Async";
constexpr const char* CANCELLATION_TOKEN_TYPE = "System.Threading.CancellationToken";

/// True if `new_type` has an async-shaped method named `<removed.name>Async`.
/// Async methods never migrate.
[[nodiscard]] auto has_async_counterpart(const surface::MethodSurface& removed,
                                         const surface::TypeSurface& new_type) -> bool;

/// Picks which added overload a migration consumes, skipping indexes already
/// marked in `consumed`. Returns an index into `added`.
[[nodiscard]] auto pick_async_counterpart(const surface::MethodSurface& removed,
                                          const std::vector<const surface::MethodSurface*>& added,
                                          const std::vector<bool>& consumed)
    -> std::optional<size_t>;

/// `Ns.Type.Foo → FooAsync (sync to async)`
[[nodiscard]] auto migration_entry(const std::string& type_full_name,
                                   const surface::MethodSurface& removed) -> std::string;

} // namespace apidiff::diff
