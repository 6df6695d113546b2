//! # Archive Interfaces
//!
//! The package layer only sees an archive through these two interfaces:
//! `ArchiveReader` lists and opens entries, `ManifestReader` reads the
//! declared dependency ids out of the package manifest.

#pragma once

#include "common.hpp"
#include "package/package_types.hpp"

#include <string>
#include <vector>

namespace apidiff::package {

/// Read-only view of one package archive.
class ArchiveReader {
public:
    virtual ~ArchiveReader() = default;

    /// Entry paths in archive order, '/'-separated, directories excluded.
    [[nodiscard]] virtual auto entries() const -> const std::vector<std::string>& = 0;

    /// Full contents of one entry.
    [[nodiscard]] virtual auto read_entry(const std::string& path) const
        -> Result<ByteBuffer, ArchiveError> = 0;
};

/// Reads the dependency manifest stored inside an archive.
class ManifestReader {
public:
    virtual ~ManifestReader() = default;

    /// Dependency ids from every dependency group, distinct, in manifest order.
    [[nodiscard]] virtual auto dependency_ids(const ArchiveReader& archive) const
        -> Result<std::vector<std::string>, ArchiveError> = 0;
};

} // namespace apidiff::package
