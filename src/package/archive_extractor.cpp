#include "package/archive_extractor.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <map>

namespace apidiff::package {

namespace {

auto split_path(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        parts.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto is_runtime_target(std::string_view folder) -> bool {
    return folder.size() > 3 && to_lower_ascii(folder.substr(0, 3)) == "net";
}

struct Winner {
    std::string path;
    CandidatePath info;
};

/// True if `a` should be preferred over `b`.
auto better(const Winner& a, const Winner& b) -> bool {
    if (a.info.priority != b.info.priority) {
        return a.info.priority > b.info.priority;
    }
    if (a.info.folder != b.info.folder) {
        return static_cast<int>(a.info.folder) > static_cast<int>(b.info.folder);
    }
    return a.path < b.path;
}

auto select(const ArchiveReader& archive) -> std::vector<Winner> {
    // Keyed by lowercase module name; std::map keeps the output ordinal
    std::map<std::string, Winner> winners;
    for (const auto& path : archive.entries()) {
        auto info = classify_entry(path);
        if (!info) {
            continue;
        }
        Winner candidate{path, std::move(*info)};
        std::string key = to_lower_ascii(candidate.info.module_name);
        auto it = winners.find(key);
        if (it == winners.end()) {
            winners.emplace(std::move(key), std::move(candidate));
        } else if (better(candidate, it->second)) {
            APIDIFF_LOG_TRACE("zip", "Preferring " << candidate.path << " over " << it->second.path);
            it->second = std::move(candidate);
        }
    }

    std::vector<Winner> out;
    out.reserve(winners.size());
    for (auto& [_, winner] : winners) {
        out.push_back(std::move(winner));
    }
    std::stable_sort(out.begin(), out.end(), [](const Winner& a, const Winner& b) {
        return a.info.module_name < b.info.module_name;
    });
    return out;
}

} // namespace

auto classify_entry(std::string_view path) -> std::optional<CandidatePath> {
    auto parts = split_path(path);
    if (parts.size() < 3) {
        return std::nullopt;
    }

    std::string_view file = parts.back();
    if (!ends_with_icase(file, ".dll") || file.size() <= 4) {
        return std::nullopt;
    }

    std::string root = to_lower_ascii(parts[0]);
    std::string_view tfm;
    AssetFolder folder;
    if (parts.size() == 3 && (root == "lib" || root == "ref")) {
        tfm = parts[1];
        folder = root == "lib" ? AssetFolder::Lib : AssetFolder::Ref;
    } else if (parts.size() == 5 && root == "runtimes" && to_lower_ascii(parts[2]) == "lib") {
        tfm = parts[3];
        folder = AssetFolder::Runtimes;
    } else {
        return std::nullopt;
    }

    if (!is_runtime_target(tfm)) {
        return std::nullopt;
    }

    return CandidatePath{
        .module_name = std::string(file.substr(0, file.size() - 4)),
        .target_framework = std::string(tfm),
        .folder = folder,
        .priority = tfm_priority(tfm),
    };
}

auto selected_entry_paths(const ArchiveReader& archive) -> std::vector<std::string> {
    std::vector<std::string> paths;
    for (auto& winner : select(archive)) {
        paths.push_back(std::move(winner.path));
    }
    return paths;
}

auto has_code_modules(const ArchiveReader& archive) -> bool {
    return std::any_of(archive.entries().begin(), archive.entries().end(),
                       [](const std::string& path) { return classify_entry(path).has_value(); });
}

auto select_modules(const ArchiveReader& archive) -> ModuleSelection {
    ModuleSelection selection;
    for (auto& winner : select(archive)) {
        auto bytes = archive.read_entry(winner.path);
        if (is_err(bytes)) {
            APIDIFF_LOG_WARN("zip", "Skipping " << winner.path << ": "
                                                << unwrap_err(bytes).message);
            selection.failures.push_back(EntryFailure{
                .module_name = std::move(winner.info.module_name),
                .message = std::move(unwrap_err(bytes).message),
            });
            continue;
        }
        APIDIFF_LOG_DEBUG("zip", "Selected " << winner.path << " (priority "
                                             << winner.info.priority << ")");
        selection.modules.push_back(ModuleCandidate{
            .entry_path = std::move(winner.path),
            .module_name = std::move(winner.info.module_name),
            .target_framework = std::move(winner.info.target_framework),
            .priority = winner.info.priority,
            .bytes = std::move(unwrap(bytes)),
        });
    }
    return selection;
}

} // namespace apidiff::package
