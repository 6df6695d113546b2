//! # Package Types
//!
//! Identity, module candidates and the error types of the package layer
//! (registry resolution and archive reading).

#pragma once

#include "common.hpp"

#include <string>

namespace apidiff::package {

/// Registry lookup key: a package id plus a version string.
struct PackageIdentity {
    std::string id;
    std::string version;

    [[nodiscard]] auto to_string() const -> std::string {
        return id + " " + version;
    }
};

/// A binary module found inside a package archive.
///
/// Several candidates can share a `module_name` (one per runtime target);
/// `ArchiveExtractor` keeps exactly one per name.
struct ModuleCandidate {
    std::string entry_path;       ///< Archive path, e.g. "lib/net8.0/Foo.dll"
    std::string module_name;      ///< File name without extension, e.g. "Foo"
    std::string target_framework; ///< Folder tag, e.g. "net8.0"
    int priority = 0;             ///< Runtime-target priority (higher wins)
    ByteBuffer bytes;             ///< Entry contents
};

/// The archive container could not be read.
struct ArchiveError {
    std::string message;
};

/// Registry resolution failure.
struct RegistryError {
    enum class Kind {
        NotFound,  ///< The id/version pair does not exist
        Network,   ///< Transport or I/O failure
        Cancelled, ///< The caller cancelled the request
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static auto not_found(const PackageIdentity& identity) -> RegistryError {
        return RegistryError{Kind::NotFound, "Package " + identity.to_string() + " not found"};
    }

    [[nodiscard]] static auto network(std::string message) -> RegistryError {
        return RegistryError{Kind::Network, std::move(message)};
    }

    [[nodiscard]] static auto cancelled() -> RegistryError {
        return RegistryError{Kind::Cancelled, "Operation cancelled"};
    }
};

} // namespace apidiff::package
