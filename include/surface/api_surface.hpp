//! # API Surface Model
//!
//! Plain-data snapshot of the visible API of one package version. Every
//! record here is a value type: nothing refers back into the metadata load
//! context, so a surface outlives the context that produced it.
//!
//! ```text
//! ApiSurface
//! └── TypeSurface*        (unique full_name, module order then TypeDef order)
//!     ├── MethodSurface*  (identity = signature "Name(T1,T2)")
//!     │   └── ParameterSurface*
//!     └── PropertySurface*
//! ```

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apidiff::surface {

struct ParameterSurface {
    std::string name;
    std::string type_name;
    bool has_default = false;

    auto operator==(const ParameterSurface&) const -> bool = default;
};

struct MethodSurface {
    std::string name;
    /// `Name(T1,T2)` with short parameter type names; the cross-version key.
    std::string signature;
    std::string return_type;
    bool is_static = false;
    bool is_async = false;
    std::optional<std::string> obsolete_message;
    std::vector<ParameterSurface> parameters;

    auto operator==(const MethodSurface&) const -> bool = default;
};

struct PropertySurface {
    std::string name;
    std::string type_name;
    bool can_read = false;
    bool can_write = false;

    auto operator==(const PropertySurface&) const -> bool = default;
};

struct TypeSurface {
    std::string full_name;
    std::string namespace_name;
    std::string name;
    std::string kind;
    bool is_public = false;
    std::optional<std::string> base_type;
    /// Distinct, in discovery order.
    std::vector<std::string> interfaces;
    std::optional<std::string> obsolete_message;
    std::vector<MethodSurface> methods;
    std::vector<PropertySurface> properties;

    /// Distinct property names in declaration order.
    [[nodiscard]] auto property_names() const -> std::vector<std::string>;

    auto operator==(const TypeSurface&) const -> bool = default;
};

/// Result of extracting one package version.
struct ApiSurface {
    std::string package_id;
    std::string version;
    /// Base64 SHA-512 of the archive, empty if the archive was never read.
    std::string archive_sha512;
    std::vector<TypeSurface> types;
    /// Modules that failed to load, as "name: reason".
    std::vector<std::string> skipped_modules;
    std::optional<std::string> error;
};

// ============================================================================
// Kinds
// ============================================================================

namespace kind {
constexpr const char* INTERFACE = "interface";
constexpr const char* ENUM = "enum";
constexpr const char* STRUCT = "struct";
constexpr const char* STATIC_CLASS = "static class";
constexpr const char* ABSTRACT_CLASS = "abstract class";
constexpr const char* SEALED_CLASS = "sealed class";
constexpr const char* CLASS = "class";
} // namespace kind

/// True for `Task`, `Task<T>`, `ValueTask` and `ValueTask<T>` (full names).
[[nodiscard]] auto is_async_return_type(std::string_view full_type_name) -> bool;

} // namespace apidiff::surface
