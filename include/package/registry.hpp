//! # Package Registry
//!
//! Resolves a package identity to the raw archive bytes. Two adapters ship:
//!
//! | Adapter | Source | Layout |
//! |---------|--------|--------|
//! | `LocalFeedRegistry` | a directory | `<root>/<id>/<version>/<id>.<version>.nupkg` or `<root>/<id>.<version>.nupkg` |
//! | `HttpRegistry` | a v3 service index URL | `PackageBaseAddress/3.0.0` flat container |
//!
//! Archives are fully buffered in memory. Callers pass normalized versions.

#pragma once

#include "common.hpp"
#include "package/package_types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace apidiff::package {

/// Resolves an id+version pair to archive bytes.
class RegistryClient {
public:
    virtual ~RegistryClient() = default;

    /// Downloads (or reads) the archive for `identity`.
    ///
    /// Fails with `NotFound` when the pair does not exist, `Network` on
    /// transport or I/O failure and `Cancelled` when `cancel` fires.
    [[nodiscard]] virtual auto resolve(const PackageIdentity& identity,
                                       const CancellationToken& cancel)
        -> Result<ByteBuffer, RegistryError> = 0;

    /// Human-readable source description, for logs.
    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

/// nuget.org v3 service index.
constexpr const char* DEFAULT_SOURCE = "https://api.nuget.org/v3/index.json";

/// Registry for a source string: an existing directory selects a local feed,
/// anything else is taken as a service-index URL.
[[nodiscard]] auto make_registry(const std::string& source) -> Box<RegistryClient>;

// ============================================================================
// Local folder feed
// ============================================================================

class LocalFeedRegistry : public RegistryClient {
public:
    explicit LocalFeedRegistry(std::filesystem::path root);

    [[nodiscard]] auto resolve(const PackageIdentity& identity, const CancellationToken& cancel)
        -> Result<ByteBuffer, RegistryError> override;

    [[nodiscard]] auto describe() const -> std::string override {
        return "feed " + root_.string();
    }

private:
    /// Finds the archive file, trying the hierarchical then the flat layout.
    [[nodiscard]] auto locate(const PackageIdentity& identity) const
        -> std::optional<std::filesystem::path>;

    std::filesystem::path root_;
};

// ============================================================================
// HTTP (NuGet v3)
// ============================================================================

class HttpRegistry : public RegistryClient {
public:
    explicit HttpRegistry(std::string service_index_url);

    [[nodiscard]] auto resolve(const PackageIdentity& identity, const CancellationToken& cancel)
        -> Result<ByteBuffer, RegistryError> override;

    [[nodiscard]] auto describe() const -> std::string override {
        return "service index " + service_index_url_;
    }

    /// Flat-container URL of one archive.
    [[nodiscard]] static auto archive_url(const std::string& base_address,
                                          const PackageIdentity& identity) -> std::string;

    /// Picks the `PackageBaseAddress/3.0.0` resource out of a service index
    /// document. Returns nullopt when the document has none.
    [[nodiscard]] static auto find_base_address(std::string_view service_index_json)
        -> std::optional<std::string>;

private:
    /// Fetches and caches the base address (once per registry instance).
    [[nodiscard]] auto base_address(const CancellationToken& cancel)
        -> Result<std::string, RegistryError>;

    std::string service_index_url_;
    std::mutex mutex_;
    std::optional<std::string> base_address_;
};

} // namespace apidiff::package
