//! # Report Formatter
//!
//! Renders a change set as markdown. Output is stable for a given change
//! set: sections and lists keep diff-engine order and are never sorted.
//!
//! ```text
//! ## Breaking Changes          only if has_breaking_changes()
//! ### Removed Types (12)
//! - ExamplePkg.Widget          at most 10 items
//! - ... and 2 more
//!
//! ## Deprecations              only if an obsolete bucket is non-empty
//! ## New Features              only if has_additions()
//! ## Meta-Package              only if is_meta_package (20 dependencies max)
//!
//! **Warning:** <comparison error>
//! ```

#pragma once

#include "diff/change_set.hpp"

#include <string>

namespace apidiff::report {

constexpr size_t MAX_LIST_ITEMS = 10;
constexpr size_t MAX_META_DEPENDENCIES = 20;

/// Sections for the non-empty parts of `changes`; "" for an empty set.
[[nodiscard]] auto format_change_set(const diff::ChangeSet& changes) -> std::string;

/// `# API Changes: <id>` and `**<from> → <to>**` followed by the change set.
[[nodiscard]] auto format_version_report(const diff::DiffResult& result) -> std::string;

} // namespace apidiff::report
