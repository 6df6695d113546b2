//! # Package Inspector
//!
//! Caller-facing entry points. Each call is self-contained: it fetches the
//! archives it needs, extracts fresh surfaces in its own load contexts and
//! keeps nothing afterwards.
//!
//! ```text
//! registry ─► archive bytes ─► module selection ─► scratch files
//!          ─► LoadContext ─► SurfaceExtractor ─► ApiSurface
//! compare: (old ∥ new) ─► compare_surfaces ─► DiffResult
//! ```
//!
//! ## Errors
//!
//! | Condition | Reported as |
//! |-----------|-------------|
//! | blank id or version, unparsable version | `InspectorError` Validation |
//! | registry `NotFound` for any requested version | `InspectorError` NotFound |
//! | network, cancellation, unreadable archive, no loadable module | `error` / `comparison_error` |
//! | malformed module, corrupt archive entry | skipped, listed in `skipped_modules` |
//!
//! ## Threading
//!
//! Every entry point runs on its own `std::async` task; `compare_versions`
//! fetches and extracts the two versions on two more. The inspector, its
//! registry and its manifest reader must outlive the returned futures.

#pragma once

#include "common.hpp"
#include "decompile/decompiler.hpp"
#include "diff/change_set.hpp"
#include "inspector/inspector_types.hpp"
#include "package/archive_reader.hpp"
#include "package/registry.hpp"
#include "surface/api_surface.hpp"

#include <filesystem>
#include <future>
#include <optional>
#include <string>

namespace apidiff::inspector {

struct InspectorOptions {
    /// Parent of the per-call `apidiff/<hex>/` scratch directories.
    std::filesystem::path scratch_root = std::filesystem::temp_directory_path();
};

class PackageInspector {
public:
    PackageInspector(package::RegistryClient& registry, const package::ManifestReader& manifest,
                     InspectorOptions options = {});

    /// Visible API of one version.
    [[nodiscard]] auto extract_surface(std::string package_id, std::string version,
                                       bool include_non_public, CancellationToken cancel)
        -> std::future<Result<surface::ApiSurface, InspectorError>>;

    /// Structural diff between two versions. The meta-package check runs on
    /// `to_version`.
    [[nodiscard]] auto compare_versions(std::string package_id, std::string from_version,
                                        std::string to_version, CancellationToken cancel)
        -> std::future<Result<diff::DiffResult, InspectorError>>;

    /// Outline source of the highest-priority module, or of one type in it.
    [[nodiscard]] auto decompile(std::string package_id, std::string version,
                                 std::optional<std::string> type_name, CancellationToken cancel)
        -> std::future<Result<DecompileResult, InspectorError>>;

    /// Every `[Obsolete]` type and method of one version.
    [[nodiscard]] auto obsolete_apis(std::string package_id, std::string version,
                                     CancellationToken cancel)
        -> std::future<Result<ObsoleteApisResult, InspectorError>>;

    [[nodiscard]] auto has_breaking_changes(std::string package_id, std::string from_version,
                                            std::string to_version, CancellationToken cancel)
        -> std::future<Result<BreakingChangesCheck, InspectorError>>;

    /// Markdown report of `compare_versions`.
    [[nodiscard]] auto version_report(std::string package_id, std::string from_version,
                                      std::string to_version, CancellationToken cancel)
        -> std::future<Result<std::string, InspectorError>>;

    // Synchronous bodies of the entry points above.

    [[nodiscard]] auto extract_surface_now(const std::string& package_id,
                                           const std::string& version, bool include_non_public,
                                           const CancellationToken& cancel)
        -> Result<surface::ApiSurface, InspectorError>;

    [[nodiscard]] auto compare_versions_now(const std::string& package_id,
                                            const std::string& from_version,
                                            const std::string& to_version,
                                            const CancellationToken& cancel)
        -> Result<diff::DiffResult, InspectorError>;

    [[nodiscard]] auto decompile_now(const std::string& package_id, const std::string& version,
                                     const std::optional<std::string>& type_name,
                                     const CancellationToken& cancel)
        -> Result<DecompileResult, InspectorError>;

    [[nodiscard]] auto obsolete_apis_now(const std::string& package_id,
                                         const std::string& version,
                                         const CancellationToken& cancel)
        -> Result<ObsoleteApisResult, InspectorError>;

private:
    /// Validates and normalizes a request, turning it into a registry key.
    [[nodiscard]] static auto identity_for(const std::string& package_id,
                                           const std::string& version)
        -> Result<package::PackageIdentity, InspectorError>;

    [[nodiscard]] auto fetch(const package::PackageIdentity& identity,
                             const CancellationToken& cancel)
        -> Result<ByteBuffer, package::RegistryError>;

    /// Archive bytes to surface, in a load context of its own.
    [[nodiscard]] auto extract_archive(const package::PackageIdentity& identity,
                                       const ByteBuffer& archive, bool include_non_public,
                                       const CancellationToken& cancel) const
        -> surface::ApiSurface;

    package::RegistryClient& registry_;
    const package::ManifestReader& manifest_;
    InspectorOptions options_;
    decompile::OutlineDecompiler decompiler_;
};

} // namespace apidiff::inspector
