//! # Inspection Commands
//!
//! `diff`, `surface`, `decompile` and `obsolete`. Each builds a registry
//! for the configured source, runs one inspector entry point and prints
//! the result.

#include "cli/commands.hpp"
#include "diff/diff_json.hpp"
#include "inspector/package_inspector.hpp"
#include "inspector/result_json.hpp"
#include "log/log.hpp"
#include "package/nuspec.hpp"
#include "report/report_formatter.hpp"
#include "surface/surface_json.hpp"

#include <iostream>

namespace apidiff::cli {

namespace {

/// Registry, manifest reader and inspector for one command run.
class Session {
public:
    explicit Session(const Config& config)
        : registry_(package::make_registry(config.source)),
          inspector_(*registry_, manifest_, {.scratch_root = config.scratch_root}) {
        APIDIFF_LOG_DEBUG("cli", "Using " << registry_->describe());
    }

    [[nodiscard]] auto inspector() -> inspector::PackageInspector& {
        return inspector_;
    }

private:
    Box<package::RegistryClient> registry_;
    package::NuspecManifestReader manifest_;
    inspector::PackageInspector inspector_;
};

auto report_failure(const inspector::InspectorError& error) -> int {
    std::cerr << "error: " << error.to_string() << "\n";
    return 1;
}

auto expect_args(const Config& config, size_t min, size_t max, const char* usage) -> bool {
    if (config.positional.size() < min || config.positional.size() > max) {
        std::cerr << "Usage: apidiff " << usage << "\n";
        return false;
    }
    return true;
}

} // namespace

auto cmd_diff(const Config& config) -> int {
    if (!expect_args(config, 3, 3, "diff <package-id> <from-version> <to-version> [--json]")) {
        return 2;
    }
    const auto& args = config.positional;

    Session session(config);
    auto result =
        session.inspector().compare_versions(args[0], args[1], args[2], CancellationToken()).get();
    if (is_err(result)) {
        return report_failure(unwrap_err(result));
    }

    const auto& diff = unwrap(result);
    if (config.json) {
        std::cout << diff::to_json(diff).to_string_pretty() << "\n";
    } else {
        std::cout << report::format_version_report(diff);
    }
    return diff.changes().comparison_error ? 1 : 0;
}

auto cmd_surface(const Config& config) -> int {
    if (!expect_args(config, 2, 2, "surface <package-id> <version> [--include-non-public]")) {
        return 2;
    }
    const auto& args = config.positional;

    Session session(config);
    auto result = session.inspector()
                      .extract_surface(args[0], args[1], config.include_non_public,
                                       CancellationToken())
                      .get();
    if (is_err(result)) {
        return report_failure(unwrap_err(result));
    }

    const auto& surface = unwrap(result);
    std::cout << surface::to_json(surface).to_string_pretty() << "\n";
    return surface.error ? 1 : 0;
}

auto cmd_decompile(const Config& config) -> int {
    if (!expect_args(config, 2, 3, "decompile <package-id> <version> [type-full-name]")) {
        return 2;
    }
    const auto& args = config.positional;
    std::optional<std::string> type_name;
    if (args.size() == 3) {
        type_name = args[2];
    }

    Session session(config);
    auto result =
        session.inspector().decompile(args[0], args[1], type_name, CancellationToken()).get();
    if (is_err(result)) {
        return report_failure(unwrap_err(result));
    }

    const auto& decompiled = unwrap(result);
    if (config.json) {
        std::cout << inspector::to_json(decompiled).to_string_pretty() << "\n";
    } else if (decompiled.source) {
        std::cout << *decompiled.source;
    }
    if (decompiled.error) {
        std::cerr << "error: " << *decompiled.error << "\n";
        return 1;
    }
    return 0;
}

auto cmd_obsolete(const Config& config) -> int {
    if (!expect_args(config, 2, 2, "obsolete <package-id> <version> [--json]")) {
        return 2;
    }
    const auto& args = config.positional;

    Session session(config);
    auto result = session.inspector().obsolete_apis(args[0], args[1], CancellationToken()).get();
    if (is_err(result)) {
        return report_failure(unwrap_err(result));
    }

    const auto& obsolete = unwrap(result);
    if (config.json) {
        std::cout << inspector::to_json(obsolete).to_string_pretty() << "\n";
    } else {
        for (const auto& item : obsolete.items) {
            std::cout << item.kind << " " << item.name;
            if (!item.message.empty()) {
                std::cout << ": " << item.message;
            }
            std::cout << "\n";
        }
    }
    if (obsolete.error) {
        std::cerr << "error: " << *obsolete.error << "\n";
        return 1;
    }
    return 0;
}

} // namespace apidiff::cli
