//! # Load Context
//!
//! An isolated resolution universe for one extraction call:
//!
//! ```text
//! universe = { modules loaded into this context } ∪ { platform baseline }
//! ```
//!
//! Type references are resolved by (assembly name, full type name) against
//! the loaded modules only. References into the platform baseline are known
//! but carry no structure; references outside the universe stay unresolved
//! names. Nothing is ever resolved against the host process, and no module
//! code runs.
//!
//! A module that fails to load is logged and recorded in `skipped()`; the
//! context keeps going with the rest.
//!
//! ## Lifetime
//!
//! Move-only. Everything returned by reference (modules, readers, rows) is
//! valid only while the context is alive.

#ifndef APIDIFF_METADATA_LOAD_CONTEXT_HPP
#define APIDIFF_METADATA_LOAD_CONTEXT_HPP

#include "common.hpp"
#include "metadata/module.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace apidiff::metadata {

/// A TypeDef in one of the context's modules.
struct ResolvedType {
    const Module* module = nullptr;
    uint32_t row = 0;
};

struct SkippedModule {
    std::string module_name;
    std::string reason;
};

/// Framework assembly names that make up the platform baseline.
///
/// Initialized once on first use, read-only afterwards.
[[nodiscard]] auto platform_baseline() -> const std::vector<std::string>&;

/// True if `assembly_name` is part of the platform baseline (case-insensitive).
[[nodiscard]] auto is_platform_assembly(std::string_view assembly_name) -> bool;

class LoadContext {
public:
    LoadContext() = default;
    LoadContext(const LoadContext&) = delete;
    auto operator=(const LoadContext&) -> LoadContext& = delete;
    LoadContext(LoadContext&&) noexcept = default;
    auto operator=(LoadContext&&) noexcept -> LoadContext& = default;
    ~LoadContext();

    /// Loads one module. On failure the module is skipped, logged and the
    /// error returned; the context stays usable.
    auto add_module(std::string module_name, ByteBuffer bytes) -> Result<const Module*, MetadataError>;

    [[nodiscard]] auto modules() const -> const std::vector<Box<Module>>& {
        return modules_;
    }

    [[nodiscard]] auto skipped() const -> const std::vector<SkippedModule>& {
        return skipped_;
    }

    /// Resolves a TypeDef or TypeRef index seen in `from` to a TypeDef in the
    /// universe. TypeSpecs, baseline types and unknown assemblies give nullopt.
    [[nodiscard]] auto resolve(const Module& from, CodedIndex type) const
        -> std::optional<ResolvedType>;

    /// Module whose assembly has the given name (case-insensitive).
    [[nodiscard]] auto find_assembly(std::string_view assembly_name) const -> const Module*;

private:
    std::vector<Box<Module>> modules_;
    std::vector<SkippedModule> skipped_;
    std::unordered_map<std::string, const Module*> by_assembly_;
};

} // namespace apidiff::metadata

#endif // APIDIFF_METADATA_LOAD_CONTEXT_HPP
