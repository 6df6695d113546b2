//! # HTTP Registry
//!
//! NuGet v3 client over libcurl. The service index is fetched once per
//! registry instance; archives are then downloaded from the flat container:
//!
//! ```text
//! GET <index>                       -> resources[@type=PackageBaseAddress/3.0.0]
//! GET <base>/<id>/<ver>/<id>.<ver>.nupkg
//! ```

#include "json/json_parser.hpp"
#include "log/log.hpp"
#include "package/registry.hpp"

#include <curl/curl.h>

namespace apidiff::package {

namespace {

constexpr const char* BASE_ADDRESS_TYPE = "PackageBaseAddress/3.0.0";
constexpr long CONNECT_TIMEOUT_SECS = 30;
constexpr long HTTP_NOT_FOUND = 404;

/// Process-wide libcurl initialization, done once.
void ensure_curl_initialized() {
    static const bool initialized = [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)initialized;
}

struct Transfer {
    ByteBuffer body;
    const CancellationToken* cancel = nullptr;
};

auto write_body(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* transfer = static_cast<Transfer*>(userdata);
    size_t n = size * nmemb;
    transfer->body.insert(transfer->body.end(), reinterpret_cast<uint8_t*>(ptr),
                          reinterpret_cast<uint8_t*>(ptr) + n);
    return n;
}

auto on_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
    auto* transfer = static_cast<Transfer*>(userdata);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return transfer->cancel->is_cancelled() ? 1 : 0;
}

struct HttpResponse {
    long status = 0;
    ByteBuffer body;
};

/// Owns one easy handle.
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() {
        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }
    CurlHandle(const CurlHandle&) = delete;
    auto operator=(const CurlHandle&) -> CurlHandle& = delete;

    [[nodiscard]] auto get() const -> CURL* {
        return handle_;
    }

private:
    CURL* handle_;
};

auto http_get(const std::string& url, const CancellationToken& cancel)
    -> Result<HttpResponse, RegistryError> {
    ensure_curl_initialized();
    CurlHandle curl;
    if (curl.get() == nullptr) {
        return RegistryError::network("curl_easy_init failed");
    }

    Transfer transfer;
    transfer.cancel = &cancel;

    std::string user_agent = std::string("apidiff/") + VERSION;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SECS);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &transfer);

    APIDIFF_LOG_DEBUG("registry", "GET " << url);
    CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_ABORTED_BY_CALLBACK || cancel.is_cancelled()) {
        return RegistryError::cancelled();
    }
    if (rc != CURLE_OK) {
        return RegistryError::network(std::string("GET ") + url + ": " + curl_easy_strerror(rc));
    }

    HttpResponse response;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    response.body = std::move(transfer.body);
    APIDIFF_LOG_DEBUG("registry", "HTTP " << response.status << " (" << response.body.size()
                                          << " bytes) " << url);
    return response;
}

auto ensure_trailing_slash(std::string s) -> std::string {
    if (s.empty() || s.back() != '/') {
        s.push_back('/');
    }
    return s;
}

} // namespace

HttpRegistry::HttpRegistry(std::string service_index_url)
    : service_index_url_(std::move(service_index_url)) {}

auto HttpRegistry::archive_url(const std::string& base_address, const PackageIdentity& identity)
    -> std::string {
    std::string id = to_lower_ascii(identity.id);
    std::string version = to_lower_ascii(identity.version);
    return ensure_trailing_slash(base_address) + id + "/" + version + "/" + id + "." + version +
           ".nupkg";
}

auto HttpRegistry::find_base_address(std::string_view service_index_json)
    -> std::optional<std::string> {
    auto parsed = json::parse_json(service_index_json);
    if (is_err(parsed)) {
        return std::nullopt;
    }
    const auto& doc = unwrap(parsed);
    const auto* resources = doc.get("resources");
    if (resources == nullptr || !resources->is_array()) {
        return std::nullopt;
    }
    for (const auto& resource : resources->as_array()) {
        const auto* type = resource.get("@type");
        const auto* id = resource.get("@id");
        if (type != nullptr && type->is_string() && type->as_string() == BASE_ADDRESS_TYPE &&
            id != nullptr && id->is_string()) {
            return id->as_string();
        }
    }
    return std::nullopt;
}

auto HttpRegistry::base_address(const CancellationToken& cancel)
    -> Result<std::string, RegistryError> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (base_address_) {
        return *base_address_;
    }

    auto response = http_get(service_index_url_, cancel);
    if (is_err(response)) {
        return unwrap_err(response);
    }
    const auto& body = unwrap(response);
    if (body.status != 200) {
        return RegistryError::network("service index returned HTTP " +
                                      std::to_string(body.status));
    }

    auto address = find_base_address(std::string_view(
        reinterpret_cast<const char*>(body.body.data()), body.body.size()));
    if (!address) {
        return RegistryError::network(std::string("service index has no ") + BASE_ADDRESS_TYPE +
                                      " resource");
    }
    APIDIFF_LOG_INFO("registry", "Package base address: " << *address);
    base_address_ = *address;
    return *address;
}

auto HttpRegistry::resolve(const PackageIdentity& identity, const CancellationToken& cancel)
    -> Result<ByteBuffer, RegistryError> {
    if (cancel.is_cancelled()) {
        return RegistryError::cancelled();
    }

    auto base = base_address(cancel);
    if (is_err(base)) {
        return unwrap_err(base);
    }

    auto response = http_get(archive_url(unwrap(base), identity), cancel);
    if (is_err(response)) {
        return unwrap_err(response);
    }
    auto& body = unwrap(response);
    if (body.status == HTTP_NOT_FOUND) {
        return RegistryError::not_found(identity);
    }
    if (body.status < 200 || body.status >= 300) {
        return RegistryError::network("download of " + identity.to_string() + " returned HTTP " +
                                      std::to_string(body.status));
    }
    return std::move(body.body);
}

} // namespace apidiff::package
