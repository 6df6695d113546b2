//! # Target Framework Priority
//!
//! Packages ship one module variant per runtime target folder
//! (`lib/net8.0/`, `lib/netstandard2.0/`, ...). When several variants share a
//! module name the one with the highest priority is inspected:
//!
//! | Folder | Priority |
//! |--------|----------|
//! | `net10.0` | 110 |
//! | `net9.0` | 105 |
//! | `net8.0` | 100 |
//! | `net5.0` | 85 |
//! | `netcoreapp3.1` | 77 |
//! | `netstandard2.1` | 70 |
//! | `netstandard2.0` | 60 |
//! | `net48` | 58 |
//! | `net45` | 55 |
//! | `netstandard1.6` | 46 |
//! | other `net*` | below 40 |
//!
//! Platform suffixes (`net8.0-windows10.0.19041`) are ignored.

#pragma once

#include <string_view>

namespace apidiff::package {

/// Priority of a runtime-target folder name (case-insensitive). Unknown
/// `net*` folders get a small non-negative value, anything else 0.
[[nodiscard]] auto tfm_priority(std::string_view tfm) -> int;

/// Where a candidate module lives in the archive. Used as a tie-breaker
/// between equal target priorities.
enum class AssetFolder {
    Ref = 0,      ///< ref/<tfm>/
    Runtimes = 1, ///< runtimes/<rid>/lib/<tfm>/
    Lib = 2,      ///< lib/<tfm>/
};

} // namespace apidiff::package
