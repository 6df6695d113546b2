//! # Diff Engine
//!
//! Structural comparison of two extracted surfaces. Pure and synchronous:
//! no I/O, no shared state.
//!
//! ## Pass order
//!
//! 1. `old` in surface order: removed types, then per matched type its
//!    interfaces, base class, namespace, methods (with sync-to-async
//!    migrations), properties and the new side's obsolete markers
//! 2. `new` in surface order: added types
//! 3. namespace moves between removed and added types
//!
//! Only the first of several types sharing a full name takes part. An added
//! type is never reported as obsolete.
//!
//! ## Known blind spots
//!
//! Method identity is the signature, which leaves out the return type, so a
//! return-type-only change is invisible. Properties compare by name only, so
//! accessor changes are invisible too.

#pragma once

#include "common.hpp"
#include "diff/change_set.hpp"
#include "surface/api_surface.hpp"

#include <vector>

namespace apidiff::diff {

/// Compares `old_types` against `new_types`. When `cancel` fires between
/// types, returns what was found so far with `comparison_error` set.
[[nodiscard]] auto compare_surfaces(const std::vector<surface::TypeSurface>& old_types,
                                    const std::vector<surface::TypeSurface>& new_types,
                                    const CancellationToken& cancel = CancellationToken())
    -> ChangeSet;

} // namespace apidiff::diff
