//! # Decompiler
//!
//! The readable-source operation. Never used on the diff path.
//!
//! `OutlineDecompiler` renders C#-like declarations from metadata alone:
//! namespaces, type headers with their base list, method and property
//! signatures with `{ ... }` bodies and `[Obsolete]` markers. Method bodies
//! are not decoded.

#pragma once

#include "common.hpp"
#include "surface/api_surface.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace apidiff::decompile {

struct DecompileError {
    std::string message;
};

class Decompiler {
public:
    virtual ~Decompiler() = default;

    /// Source text for the whole module, or for one type when
    /// `type_full_name` is given. A type that is not in the module yields
    /// the text `// Type '<name>' not found`, not an error.
    [[nodiscard]] virtual auto decompile(const std::filesystem::path& module_path,
                                         const std::optional<std::string>& type_full_name)
        -> Result<std::string, DecompileError> = 0;
};

class OutlineDecompiler : public Decompiler {
public:
    [[nodiscard]] auto decompile(const std::filesystem::path& module_path,
                                 const std::optional<std::string>& type_full_name)
        -> Result<std::string, DecompileError> override;

    /// Renders already-extracted types, grouped by namespace in order of
    /// first appearance.
    [[nodiscard]] static auto render(const std::vector<surface::TypeSurface>& types)
        -> std::string;
};

} // namespace apidiff::decompile
