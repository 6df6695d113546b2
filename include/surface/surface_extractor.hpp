//! # Surface Extractor
//!
//! Walks every type of every module in a `LoadContext` and flattens the
//! visible ones into `TypeSurface` records. Runs while the context is alive;
//! the returned records own all their data.
//!
//! ## Visibility
//!
//! A type is visible when it is `Public`, or `NestedPublic` with every
//! enclosing type visible. `include_non_public` admits every type except
//! the `<Module>` pseudo-type, and non-public methods and properties.
//!
//! ## Members
//!
//! - Methods: non-special-name methods (no accessors, no constructors)
//! - Inherited instance methods and properties of base types that resolve
//!   inside the context are flattened in; a same-signature (method) or
//!   same-name (property) declaration closer to the type hides them
//! - Interfaces: declared, plus those inherited through base types and
//!   interface inheritance inside the context
//!
//! A member whose signature cannot be decoded is skipped and logged; the
//! rest of its type is kept.

#pragma once

#include "common.hpp"
#include "metadata/load_context.hpp"
#include "surface/api_surface.hpp"

namespace apidiff::surface {

struct ExtractOptions {
    bool include_non_public = false;
};

class SurfaceExtractor {
public:
    explicit SurfaceExtractor(const metadata::LoadContext& context, ExtractOptions options = {});

    /// Extracts every visible type, module order then TypeDef order. The
    /// first occurrence of a full name wins.
    ///
    /// Returns what was extracted so far when `cancel` fires; callers check
    /// the token themselves.
    [[nodiscard]] auto extract(const CancellationToken& cancel) const -> std::vector<TypeSurface>;

    /// Extracts one TypeDef regardless of its visibility.
    [[nodiscard]] auto extract_type(const metadata::Module& module, uint32_t type_row) const
        -> TypeSurface;

    /// True if the type passes the visibility filter.
    [[nodiscard]] auto is_visible(const metadata::Module& module, uint32_t type_row) const -> bool;

private:
    const metadata::LoadContext& context_;
    ExtractOptions options_;
};

} // namespace apidiff::surface
