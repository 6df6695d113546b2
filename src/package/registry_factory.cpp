#include "log/log.hpp"
#include "package/registry.hpp"

namespace apidiff::package {

auto make_registry(const std::string& source) -> Box<RegistryClient> {
    std::error_code ec;
    if (!source.empty() && std::filesystem::is_directory(source, ec)) {
        APIDIFF_LOG_DEBUG("registry", "Using local feed " << source);
        return make_box<LocalFeedRegistry>(source);
    }
    std::string url = source.empty() ? DEFAULT_SOURCE : source;
    APIDIFF_LOG_DEBUG("registry", "Using service index " << url);
    return make_box<HttpRegistry>(url);
}

} // namespace apidiff::package
