//! # Change Set
//!
//! The outcome of comparing two surfaces. Buckets are independent evidence,
//! not a partition: one type can show up in several buckets (for example a
//! namespace move is listed next to the removal and the addition it
//! explains). Every bucket keeps diff-engine insertion order.
//!
//! | Bucket | Entry text |
//! |--------|-----------|
//! | `removed_types`, `added_types` | `Ns.Type` |
//! | `removed_methods`, `added_methods` | `Ns.Type.Name(T1,T2)` |
//! | `removed_properties`, `added_properties` | `Ns.Type.Name` |
//! | `removed_interfaces` | `Ns.Type no longer implements I` |
//! | `added_interfaces` | `Ns.Type now implements I` |
//! | `base_class_changes` | `Ns.Type: Old → New` |
//! | `obsolete_types`, `obsolete_methods` | `Ns.Type[.Method][: message]` |
//! | `async_migrations` | `Ns.Type.Foo → FooAsync (sync to async)` |
//! | `namespace_changes` | `Old.Ns.Type → New.Ns.Type` |

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace apidiff::diff {

struct ChangeSet {
    std::vector<std::string> removed_types;
    std::vector<std::string> added_types;
    std::vector<std::string> removed_methods;
    std::vector<std::string> added_methods;
    std::vector<std::string> removed_properties;
    std::vector<std::string> added_properties;
    std::vector<std::string> removed_interfaces;
    std::vector<std::string> added_interfaces;
    std::vector<std::string> base_class_changes;
    std::vector<std::string> obsolete_types;
    std::vector<std::string> obsolete_methods;
    std::vector<std::string> async_migrations;
    std::vector<std::string> namespace_changes;

    /// Set when the classified archive has no code modules; only
    /// `meta_dependencies` is populated then.
    bool is_meta_package = false;
    std::vector<std::string> meta_dependencies;

    /// Advisory: the diff is partial. Never discards what was computed.
    std::optional<std::string> comparison_error;

    /// Any removal, base class change or sync-to-async migration.
    [[nodiscard]] auto has_breaking_changes() const -> bool;

    /// Any added type, method, property or interface.
    [[nodiscard]] auto has_additions() const -> bool;

    [[nodiscard]] auto has_deprecations() const -> bool;

    /// True when every bucket is empty (flags and error are not considered).
    [[nodiscard]] auto is_empty() const -> bool;
};

/// A finished comparison. Read-only once built.
class DiffResult {
public:
    DiffResult(std::string package_id, std::string from_version, std::string to_version,
               ChangeSet changes)
        : package_id_(std::move(package_id)), from_version_(std::move(from_version)),
          to_version_(std::move(to_version)), changes_(std::move(changes)) {}

    [[nodiscard]] auto package_id() const -> const std::string& {
        return package_id_;
    }
    [[nodiscard]] auto from_version() const -> const std::string& {
        return from_version_;
    }
    [[nodiscard]] auto to_version() const -> const std::string& {
        return to_version_;
    }
    [[nodiscard]] auto changes() const -> const ChangeSet& {
        return changes_;
    }

private:
    std::string package_id_;
    std::string from_version_;
    std::string to_version_;
    ChangeSet changes_;
};

} // namespace apidiff::diff
