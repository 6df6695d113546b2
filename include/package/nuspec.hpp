//! # Nuspec Manifest Reader
//!
//! Reads dependency ids from the `.nuspec` at the archive root:
//!
//! ```xml
//! <package><metadata>
//!   <dependencies>
//!     <group targetFramework="net8.0">
//!       <dependency id="Microsoft.Extensions.Logging" version="8.0.0" />
//!     </group>
//!   </dependencies>
//! </metadata></package>
//! ```
//!
//! Both grouped and legacy flat `<dependency>` lists are read. The XML
//! namespace of the manifest varies between schema versions and is ignored.

#pragma once

#include "package/archive_reader.hpp"

#include <string_view>

namespace apidiff::package {

class NuspecManifestReader : public ManifestReader {
public:
    [[nodiscard]] auto dependency_ids(const ArchiveReader& archive) const
        -> Result<std::vector<std::string>, ArchiveError> override;

    /// Parses nuspec XML text directly.
    [[nodiscard]] static auto parse_dependency_ids(std::string_view xml)
        -> Result<std::vector<std::string>, ArchiveError>;
};

} // namespace apidiff::package
