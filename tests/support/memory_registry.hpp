//! # In-Memory Registry and Manifest Doubles
//!
//! `MemoryRegistry` serves archives from a map keyed by lowercase
//! `id/version`; `ListManifestReader` reads dependency ids from a plain
//! `dependencies.txt` entry (one id per line) so the inspector tests do not
//! depend on the XML manifest adapter.

#pragma once

#include "common.hpp"
#include "package/archive_reader.hpp"
#include "package/registry.hpp"

#include <atomic>
#include <map>
#include <string>

namespace apidiff::test {

class MemoryRegistry : public package::RegistryClient {
public:
    void add(const std::string& id, const std::string& version, ByteBuffer archive);

    /// Every `resolve` of this id fails with a network error.
    void fail_with_network_error(const std::string& id);

    [[nodiscard]] auto resolve(const package::PackageIdentity& identity,
                               const CancellationToken& cancel)
        -> Result<ByteBuffer, package::RegistryError> override;

    [[nodiscard]] auto describe() const -> std::string override {
        return "memory";
    }

    [[nodiscard]] auto resolve_count() const -> int {
        return resolve_count_.load();
    }

private:
    std::map<std::string, ByteBuffer> archives_;
    std::map<std::string, bool> failing_;
    std::atomic<int> resolve_count_{0};
};

class ListManifestReader : public package::ManifestReader {
public:
    static constexpr const char* ENTRY = "dependencies.txt";

    [[nodiscard]] auto dependency_ids(const package::ArchiveReader& archive) const
        -> Result<std::vector<std::string>, package::ArchiveError> override;
};

} // namespace apidiff::test
