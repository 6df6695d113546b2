#include "inspector/package_inspector.hpp"

#include "diff/diff_engine.hpp"
#include "inspector/scratch_directory.hpp"
#include "log/log.hpp"
#include "metadata/load_context.hpp"
#include "package/archive_extractor.hpp"
#include "package/hashing.hpp"
#include "package/version.hpp"
#include "package/zip_archive.hpp"
#include "report/report_formatter.hpp"
#include "surface/surface_extractor.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace apidiff::inspector {

using package::PackageIdentity;
using package::RegistryError;
using surface::ApiSurface;

namespace {

constexpr const char* NO_ASSEMBLIES = "No assemblies found in package";
constexpr const char* CANCELLED = "Operation cancelled";

void append_error(std::optional<std::string>& slot, const std::string& message) {
    if (slot) {
        *slot += "; " + message;
    } else {
        slot = message;
    }
}

auto load_module_file(const std::filesystem::path& path) -> Result<ByteBuffer, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "cannot open " + path.string();
    }
    ByteBuffer bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return "cannot read " + path.string();
    }
    return bytes;
}

} // namespace

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Network:
        return "network";
    case ErrorKind::Archive:
        return "archive";
    case ErrorKind::Internal:
        return "internal";
    }
    return "unknown";
}

PackageInspector::PackageInspector(package::RegistryClient& registry,
                                   const package::ManifestReader& manifest,
                                   InspectorOptions options)
    : registry_(registry), manifest_(manifest), options_(std::move(options)) {}

// ============================================================================
// Shared steps
// ============================================================================

auto PackageInspector::identity_for(const std::string& package_id, const std::string& version)
    -> Result<PackageIdentity, InspectorError> {
    if (is_blank(package_id)) {
        return InspectorError::validation("package id must not be blank");
    }
    if (is_blank(version)) {
        return InspectorError::validation("version must not be blank");
    }
    auto normalized = package::normalize_version(version);
    if (is_err(normalized)) {
        return InspectorError::validation(unwrap_err(normalized).message);
    }
    return PackageIdentity{package_id, unwrap(normalized)};
}

auto PackageInspector::fetch(const PackageIdentity& identity, const CancellationToken& cancel)
    -> Result<ByteBuffer, RegistryError> {
    APIDIFF_LOG_INFO("inspector", "Fetching " << identity.to_string() << " from "
                                              << registry_.describe());
    if (cancel.is_cancelled()) {
        return RegistryError::cancelled();
    }
    auto bytes = registry_.resolve(identity, cancel);
    if (is_err(bytes)) {
        APIDIFF_LOG_WARN("inspector", "Fetching " << identity.to_string()
                                                  << " failed: " << unwrap_err(bytes).message);
    }
    return bytes;
}

auto PackageInspector::extract_archive(const PackageIdentity& identity,
                                       const ByteBuffer& archive_bytes, bool include_non_public,
                                       const CancellationToken& cancel) const -> ApiSurface {
    ApiSurface surface;
    surface.package_id = identity.id;
    surface.version = identity.version;
    if (auto hash = package::sha512_base64(archive_bytes)) {
        surface.archive_sha512 = *hash;
    }

    auto archive = package::ZipArchive::open(archive_bytes);
    if (is_err(archive)) {
        surface.error = "Unreadable archive: " + unwrap_err(archive).message;
        return surface;
    }
    auto selection = package::select_modules(unwrap(archive));
    if (selection.modules.empty() && selection.failures.empty()) {
        surface.error = NO_ASSEMBLIES;
        return surface;
    }
    for (const auto& failure : selection.failures) {
        surface.skipped_modules.push_back(failure.module_name + ": " + failure.message);
    }

    auto scratch = ScratchDirectory::create(options_.scratch_root);
    if (is_err(scratch)) {
        surface.error = unwrap_err(scratch);
        return surface;
    }

    metadata::LoadContext context;
    for (auto& candidate : selection.modules) {
        if (cancel.is_cancelled()) {
            break;
        }
        auto path = unwrap(scratch).write(candidate.module_name + ".dll", candidate.bytes);
        if (is_err(path)) {
            surface.skipped_modules.push_back(candidate.module_name + ": " + unwrap_err(path));
            continue;
        }
        auto bytes = load_module_file(unwrap(path));
        if (is_err(bytes)) {
            surface.skipped_modules.push_back(candidate.module_name + ": " + unwrap_err(bytes));
            continue;
        }
        APIDIFF_LOG_DEBUG("inspector", "Loading " << candidate.entry_path);
        // Failures are recorded in context.skipped()
        (void)context.add_module(candidate.module_name, std::move(unwrap(bytes)));
    }
    for (const auto& skipped : context.skipped()) {
        surface.skipped_modules.push_back(skipped.module_name + ": " + skipped.reason);
    }

    if (cancel.is_cancelled()) {
        surface.error = CANCELLED;
        return surface;
    }
    if (context.modules().empty()) {
        surface.error = "No loadable assemblies in " + identity.to_string();
        return surface;
    }

    surface::SurfaceExtractor extractor(context, surface::ExtractOptions{include_non_public});
    surface.types = extractor.extract(cancel);
    if (cancel.is_cancelled()) {
        surface.error = CANCELLED;
    }
    APIDIFF_LOG_INFO("inspector", identity.to_string() << ": " << surface.types.size()
                                                       << " types from "
                                                       << context.modules().size()
                                                       << " modules");
    return surface;
}

// ============================================================================
// Entry points
// ============================================================================

auto PackageInspector::extract_surface_now(const std::string& package_id,
                                           const std::string& version, bool include_non_public,
                                           const CancellationToken& cancel)
    -> Result<ApiSurface, InspectorError> {
    auto identity = identity_for(package_id, version);
    if (is_err(identity)) {
        return unwrap_err(identity);
    }
    auto bytes = fetch(unwrap(identity), cancel);
    if (is_err(bytes)) {
        const auto& error = unwrap_err(bytes);
        if (error.kind == RegistryError::Kind::NotFound) {
            return InspectorError::not_found(error.message);
        }
        ApiSurface surface;
        surface.package_id = unwrap(identity).id;
        surface.version = unwrap(identity).version;
        surface.error = error.message;
        return surface;
    }
    return extract_archive(unwrap(identity), unwrap(bytes), include_non_public, cancel);
}

auto PackageInspector::compare_versions_now(const std::string& package_id,
                                            const std::string& from_version,
                                            const std::string& to_version,
                                            const CancellationToken& cancel)
    -> Result<diff::DiffResult, InspectorError> {
    auto from_identity = identity_for(package_id, from_version);
    if (is_err(from_identity)) {
        return unwrap_err(from_identity);
    }
    auto to_identity = identity_for(package_id, to_version);
    if (is_err(to_identity)) {
        return unwrap_err(to_identity);
    }
    const PackageIdentity& from = unwrap(from_identity);
    const PackageIdentity& to = unwrap(to_identity);

    auto old_fetch = std::async(std::launch::async, [&] { return fetch(from, cancel); });
    auto new_fetch = std::async(std::launch::async, [&] { return fetch(to, cancel); });
    auto old_bytes = old_fetch.get();
    auto new_bytes = new_fetch.get();

    for (const auto* fetched : {&old_bytes, &new_bytes}) {
        if (is_err(*fetched) && unwrap_err(*fetched).kind == RegistryError::Kind::NotFound) {
            return InspectorError::not_found(unwrap_err(*fetched).message);
        }
    }

    diff::ChangeSet changes;
    auto finish = [&]() {
        return diff::DiffResult(package_id, from_version, to_version, std::move(changes));
    };
    if (is_err(new_bytes) || is_err(old_bytes)) {
        for (const auto* fetched : {&old_bytes, &new_bytes}) {
            if (is_err(*fetched)) {
                append_error(changes.comparison_error, unwrap_err(*fetched).message);
            }
        }
        return finish();
    }

    // Meta-package check on the target version
    {
        auto archive = package::ZipArchive::open(unwrap(new_bytes));
        if (is_err(archive)) {
            append_error(changes.comparison_error, "Unreadable archive for " + to.to_string() +
                                                       ": " + unwrap_err(archive).message);
            return finish();
        }
        if (!package::has_code_modules(unwrap(archive))) {
            changes.is_meta_package = true;
            auto dependencies = manifest_.dependency_ids(unwrap(archive));
            if (is_ok(dependencies)) {
                changes.meta_dependencies = std::move(unwrap(dependencies));
            } else {
                append_error(changes.comparison_error, unwrap_err(dependencies).message);
            }
            APIDIFF_LOG_INFO("inspector", to.to_string() << " is a meta-package with "
                                                         << changes.meta_dependencies.size()
                                                         << " dependencies");
            return finish();
        }
    }

    auto old_task = std::async(std::launch::async, [&] {
        return extract_archive(from, unwrap(old_bytes), false, cancel);
    });
    auto new_task = std::async(std::launch::async, [&] {
        return extract_archive(to, unwrap(new_bytes), false, cancel);
    });
    ApiSurface old_surface = old_task.get();
    ApiSurface new_surface = new_task.get();

    changes = diff::compare_surfaces(old_surface.types, new_surface.types, cancel);
    for (const auto* surface : {&old_surface, &new_surface}) {
        if (surface->error) {
            append_error(changes.comparison_error, surface->version + ": " + *surface->error);
        }
        if (!surface->skipped_modules.empty()) {
            std::string skipped = surface->version + ": skipped ";
            for (size_t i = 0; i < surface->skipped_modules.size(); ++i) {
                skipped += (i == 0 ? "" : ", ") + surface->skipped_modules[i];
            }
            append_error(changes.comparison_error, skipped);
        }
    }
    return finish();
}

auto PackageInspector::decompile_now(const std::string& package_id, const std::string& version,
                                     const std::optional<std::string>& type_name,
                                     const CancellationToken& cancel)
    -> Result<DecompileResult, InspectorError> {
    auto identity = identity_for(package_id, version);
    if (is_err(identity)) {
        return unwrap_err(identity);
    }
    DecompileResult result{package_id, version, type_name, std::nullopt, std::nullopt};

    auto bytes = fetch(unwrap(identity), cancel);
    if (is_err(bytes)) {
        if (unwrap_err(bytes).kind == RegistryError::Kind::NotFound) {
            return InspectorError::not_found(unwrap_err(bytes).message);
        }
        result.error = unwrap_err(bytes).message;
        return result;
    }

    auto archive = package::ZipArchive::open(std::move(unwrap(bytes)));
    if (is_err(archive)) {
        result.error = "Unreadable archive: " + unwrap_err(archive).message;
        return result;
    }
    auto selection = package::select_modules(unwrap(archive));
    auto& modules = selection.modules;
    if (modules.empty()) {
        result.error = selection.failures.empty()
                           ? std::string(NO_ASSEMBLIES)
                           : "Unreadable archive: " + selection.failures.front().message;
        return result;
    }

    // Highest priority wins; max_element keeps the first, so ties go by module name
    auto primary = std::max_element(modules.begin(), modules.end(),
                                    [](const auto& a, const auto& b) {
                                        return a.priority < b.priority;
                                    });

    auto scratch = ScratchDirectory::create(options_.scratch_root);
    if (is_err(scratch)) {
        result.error = unwrap_err(scratch);
        return result;
    }
    auto path = unwrap(scratch).write(primary->module_name + ".dll", primary->bytes);
    if (is_err(path)) {
        result.error = unwrap_err(path);
        return result;
    }

    auto source = decompiler_.decompile(unwrap(path), type_name);
    if (is_err(source)) {
        result.error = unwrap_err(source).message;
    } else {
        result.source = std::move(unwrap(source));
    }
    return result;
}

auto PackageInspector::obsolete_apis_now(const std::string& package_id,
                                         const std::string& version,
                                         const CancellationToken& cancel)
    -> Result<ObsoleteApisResult, InspectorError> {
    auto extracted = extract_surface_now(package_id, version, false, cancel);
    if (is_err(extracted)) {
        return unwrap_err(extracted);
    }
    const ApiSurface& surface = unwrap(extracted);

    ObsoleteApisResult result{package_id, version, {}, surface.error};
    for (const auto& type : surface.types) {
        if (type.obsolete_message) {
            result.items.push_back(ObsoleteItem{type.full_name, "type", *type.obsolete_message});
        }
    }
    for (const auto& type : surface.types) {
        for (const auto& method : type.methods) {
            if (method.obsolete_message) {
                result.items.push_back(ObsoleteItem{type.full_name + "." + method.name, "method",
                                                    *method.obsolete_message});
            }
        }
    }
    return result;
}

// ============================================================================
// Asynchronous wrappers
// ============================================================================

auto PackageInspector::extract_surface(std::string package_id, std::string version,
                                       bool include_non_public, CancellationToken cancel)
    -> std::future<Result<ApiSurface, InspectorError>> {
    return std::async(std::launch::async, [this, package_id = std::move(package_id),
                                           version = std::move(version), include_non_public,
                                           cancel = std::move(cancel)] {
        return extract_surface_now(package_id, version, include_non_public, cancel);
    });
}

auto PackageInspector::compare_versions(std::string package_id, std::string from_version,
                                        std::string to_version, CancellationToken cancel)
    -> std::future<Result<diff::DiffResult, InspectorError>> {
    return std::async(std::launch::async,
                      [this, package_id = std::move(package_id),
                       from_version = std::move(from_version), to_version = std::move(to_version),
                       cancel = std::move(cancel)] {
                          return compare_versions_now(package_id, from_version, to_version,
                                                      cancel);
                      });
}

auto PackageInspector::decompile(std::string package_id, std::string version,
                                 std::optional<std::string> type_name, CancellationToken cancel)
    -> std::future<Result<DecompileResult, InspectorError>> {
    return std::async(std::launch::async, [this, package_id = std::move(package_id),
                                           version = std::move(version),
                                           type_name = std::move(type_name),
                                           cancel = std::move(cancel)] {
        return decompile_now(package_id, version, type_name, cancel);
    });
}

auto PackageInspector::obsolete_apis(std::string package_id, std::string version,
                                     CancellationToken cancel)
    -> std::future<Result<ObsoleteApisResult, InspectorError>> {
    return std::async(std::launch::async, [this, package_id = std::move(package_id),
                                           version = std::move(version),
                                           cancel = std::move(cancel)] {
        return obsolete_apis_now(package_id, version, cancel);
    });
}

auto PackageInspector::has_breaking_changes(std::string package_id, std::string from_version,
                                            std::string to_version, CancellationToken cancel)
    -> std::future<Result<BreakingChangesCheck, InspectorError>> {
    return std::async(
        std::launch::async,
        [this, package_id = std::move(package_id), from_version = std::move(from_version),
         to_version = std::move(to_version),
         cancel = std::move(cancel)]() -> Result<BreakingChangesCheck, InspectorError> {
            auto compared = compare_versions_now(package_id, from_version, to_version, cancel);
            if (is_err(compared)) {
                return unwrap_err(compared);
            }
            const auto& changes = unwrap(compared).changes();
            BreakingChangesCheck check;
            check.package_id = package_id;
            check.from_version = from_version;
            check.to_version = to_version;
            check.has_breaking_changes = changes.has_breaking_changes();
            check.removed_types_count = changes.removed_types.size();
            check.removed_methods_count = changes.removed_methods.size();
            check.sync_to_async_count = changes.async_migrations.size();
            check.has_new_features = changes.has_additions();
            check.added_types_count = changes.added_types.size();
            check.added_methods_count = changes.added_methods.size();
            check.comparison_error = changes.comparison_error;
            return check;
        });
}

auto PackageInspector::version_report(std::string package_id, std::string from_version,
                                      std::string to_version, CancellationToken cancel)
    -> std::future<Result<std::string, InspectorError>> {
    return std::async(
        std::launch::async,
        [this, package_id = std::move(package_id), from_version = std::move(from_version),
         to_version = std::move(to_version),
         cancel = std::move(cancel)]() -> Result<std::string, InspectorError> {
            auto compared = compare_versions_now(package_id, from_version, to_version, cancel);
            if (is_err(compared)) {
                return unwrap_err(compared);
            }
            return report::format_version_report(unwrap(compared));
        });
}

} // namespace apidiff::inspector
