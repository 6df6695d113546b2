#include "package/nuspec.hpp"

#include "log/log.hpp"

#include <pugixml.hpp>
#include <unordered_set>

namespace apidiff::package {

namespace {

/// Element name without an XML namespace prefix.
auto local_name(const pugi::xml_node& node) -> std::string_view {
    std::string_view name = node.name();
    if (auto colon = name.find(':'); colon != std::string_view::npos) {
        return name.substr(colon + 1);
    }
    return name;
}

auto child(const pugi::xml_node& parent, std::string_view name) -> pugi::xml_node {
    for (auto node : parent.children()) {
        if (node.type() == pugi::node_element && local_name(node) == name) {
            return node;
        }
    }
    return {};
}

void collect(const pugi::xml_node& parent, std::vector<std::string>& out,
             std::unordered_set<std::string>& seen) {
    for (auto node : parent.children()) {
        if (node.type() != pugi::node_element) {
            continue;
        }
        auto name = local_name(node);
        if (name == "group") {
            collect(node, out, seen);
        } else if (name == "dependency") {
            std::string id = node.attribute("id").as_string();
            if (!id.empty() && seen.insert(id).second) {
                out.push_back(std::move(id));
            }
        }
    }
}

} // namespace

auto NuspecManifestReader::parse_dependency_ids(std::string_view xml)
    -> Result<std::vector<std::string>, ArchiveError> {
    pugi::xml_document doc;
    const pugi::xml_parse_result res =
        doc.load_buffer(xml.data(), xml.size(), pugi::parse_default, pugi::encoding_auto);
    if (!res) {
        return ArchiveError{std::string("invalid nuspec: ") + res.description()};
    }

    auto package = child(doc, "package");
    auto metadata = child(package, "metadata");
    if (!metadata) {
        return ArchiveError{"invalid nuspec: missing <package><metadata>"};
    }

    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    if (auto deps = child(metadata, "dependencies")) {
        collect(deps, ids, seen);
    }
    return ids;
}

auto NuspecManifestReader::dependency_ids(const ArchiveReader& archive) const
    -> Result<std::vector<std::string>, ArchiveError> {
    for (const auto& path : archive.entries()) {
        if (path.find('/') != std::string::npos || !ends_with_icase(path, ".nuspec")) {
            continue;
        }
        auto bytes = archive.read_entry(path);
        if (is_err(bytes)) {
            return unwrap_err(bytes);
        }
        const auto& data = unwrap(bytes);
        APIDIFF_LOG_DEBUG("zip", "Reading manifest " << path);
        return parse_dependency_ids(
            std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
    }
    return ArchiveError{"archive has no .nuspec manifest"};
}

} // namespace apidiff::package
