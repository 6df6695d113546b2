//! # Archive Extractor
//!
//! Picks the managed modules worth inspecting out of a package archive.
//!
//! A candidate is a `.dll` sitting directly in a runtime-target folder:
//!
//! - `lib/<tfm>/X.dll`
//! - `ref/<tfm>/X.dll`
//! - `runtimes/<rid>/lib/<tfm>/X.dll`
//!
//! where `<tfm>` starts with `net`. Documentation, symbols, native assets,
//! analyzers, build/content folders and satellite resource assemblies never
//! match. When several candidates share a module name, the highest
//! `tfm_priority` wins, then `lib` over `runtimes` over `ref`, then the
//! ordinally smallest path. Results are sorted by module name.
//!
//! Stateless; safe to call concurrently on different archives.

#pragma once

#include "package/archive_reader.hpp"
#include "package/tfm.hpp"

#include <optional>
#include <string_view>

namespace apidiff::package {

/// Where a single archive path would sit as a candidate, if it is one.
struct CandidatePath {
    std::string module_name;
    std::string target_framework;
    AssetFolder folder;
    int priority;
};

/// Classifies one archive path. Returns nullopt for non-candidates.
[[nodiscard]] auto classify_entry(std::string_view path) -> std::optional<CandidatePath>;

/// A selected entry whose bytes could not be read.
struct EntryFailure {
    std::string module_name;
    std::string message;
};

/// Readable winners plus the winners that failed to read.
struct ModuleSelection {
    std::vector<ModuleCandidate> modules;
    std::vector<EntryFailure> failures;
};

/// Selects one module per name and reads its bytes. A corrupt entry lands in
/// `failures` and the remaining entries are still read. Zero candidates is a
/// valid, empty result.
[[nodiscard]] auto select_modules(const ArchiveReader& archive) -> ModuleSelection;

/// Same selection as `select_modules`, without reading any entry.
[[nodiscard]] auto selected_entry_paths(const ArchiveReader& archive) -> std::vector<std::string>;

/// True iff the archive holds at least one candidate module.
[[nodiscard]] auto has_code_modules(const ArchiveReader& archive) -> bool;

} // namespace apidiff::package
