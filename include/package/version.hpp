//! # Package Versions
//!
//! NuGet-style version validation and normalization. Registry paths are
//! built from the normalized form.
//!
//! | Input | Normalized |
//! |-------|------------|
//! | `1.0` | `1.0.0` |
//! | `1.02.3.0` | `1.2.3` |
//! | `1.2.3.4` | `1.2.3.4` |
//! | `2.0.0-Beta.1+sha.abc` | `2.0.0-beta.1` |

#pragma once

#include "common.hpp"

#include <string>
#include <string_view>

namespace apidiff::package {

/// Why a version string was rejected.
struct VersionError {
    std::string message;
};

/// Validates `text` and returns its normalized, lowercase form.
[[nodiscard]] auto normalize_version(std::string_view text) -> Result<std::string, VersionError>;

} // namespace apidiff::package
