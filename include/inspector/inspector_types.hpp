//! # Inspector Results
//!
//! Result records of the package inspector entry points. Recoverable
//! problems travel inside the records (`error`, `comparison_error`);
//! `InspectorError` is reserved for requests that cannot produce any
//! result: invalid input and missing packages.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace apidiff::inspector {

enum class ErrorKind {
    Validation, ///< Blank id, blank or unparsable version
    NotFound,   ///< The registry has no such id/version
    Cancelled,
    Network,
    Archive,
    Internal,
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) -> const char*;

struct InspectorError {
    ErrorKind kind;
    std::string message;

    [[nodiscard]] static auto validation(std::string message) -> InspectorError {
        return InspectorError{ErrorKind::Validation, std::move(message)};
    }

    [[nodiscard]] static auto not_found(std::string message) -> InspectorError {
        return InspectorError{ErrorKind::NotFound, std::move(message)};
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return std::string(error_kind_name(kind)) + ": " + message;
    }
};

struct DecompileResult {
    std::string package_id;
    std::string version;
    std::optional<std::string> type_name;
    std::optional<std::string> source;
    std::optional<std::string> error;
};

struct ObsoleteItem {
    std::string name;
    std::string kind; ///< "type" or "method"
    std::string message;
};

struct ObsoleteApisResult {
    std::string package_id;
    std::string version;
    std::vector<ObsoleteItem> items;
    std::optional<std::string> error;
};

/// Condensed answer to "is this upgrade safe?".
struct BreakingChangesCheck {
    std::string package_id;
    std::string from_version;
    std::string to_version;
    bool has_breaking_changes = false;
    size_t removed_types_count = 0;
    size_t removed_methods_count = 0;
    size_t sync_to_async_count = 0;
    bool has_new_features = false;
    size_t added_types_count = 0;
    size_t added_methods_count = 0;
    std::optional<std::string> comparison_error;
};

} // namespace apidiff::inspector
