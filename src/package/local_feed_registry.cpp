#include "log/log.hpp"
#include "package/registry.hpp"

#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace apidiff::package {

LocalFeedRegistry::LocalFeedRegistry(fs::path root) : root_(std::move(root)) {}

auto LocalFeedRegistry::locate(const PackageIdentity& identity) const
    -> std::optional<fs::path> {
    std::string id = to_lower_ascii(identity.id);
    std::string version = to_lower_ascii(identity.version);
    std::string file = id + "." + version + ".nupkg";

    std::error_code ec;
    fs::path hierarchical = root_ / id / version / file;
    if (fs::is_regular_file(hierarchical, ec)) {
        return hierarchical;
    }

    // Flat feeds keep the publisher's casing; compare names case-insensitively
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (entry.is_regular_file(ec) &&
            to_lower_ascii(entry.path().filename().string()) == file) {
            return entry.path();
        }
    }
    return std::nullopt;
}

auto LocalFeedRegistry::resolve(const PackageIdentity& identity, const CancellationToken& cancel)
    -> Result<ByteBuffer, RegistryError> {
    if (cancel.is_cancelled()) {
        return RegistryError::cancelled();
    }
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return RegistryError::network("feed directory does not exist: " + root_.string());
    }

    auto path = locate(identity);
    if (!path) {
        APIDIFF_LOG_DEBUG("registry", "Not in feed: " << identity.to_string());
        return RegistryError::not_found(identity);
    }

    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        return RegistryError::network("cannot open " + path->string());
    }
    ByteBuffer bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return RegistryError::network("read failed: " + path->string());
    }
    APIDIFF_LOG_INFO("registry", "Read " << path->string() << " (" << bytes.size() << " bytes)");
    return bytes;
}

} // namespace apidiff::package
