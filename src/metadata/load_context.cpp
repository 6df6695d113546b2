#include "metadata/load_context.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace apidiff::metadata {

auto platform_baseline() -> const std::vector<std::string>& {
    static const std::vector<std::string> BASELINE = {
        "mscorlib",
        "netstandard",
        "System",
        "System.Core",
        "System.Private.CoreLib",
        "System.Runtime",
        "System.Runtime.Extensions",
        "System.Runtime.InteropServices",
        "System.Collections",
        "System.Collections.Concurrent",
        "System.Console",
        "System.Linq",
        "System.Linq.Expressions",
        "System.Memory",
        "System.Net.Http",
        "System.Net.Primitives",
        "System.ObjectModel",
        "System.Reflection",
        "System.Text.Encoding.Extensions",
        "System.Text.RegularExpressions",
        "System.Threading",
        "System.Threading.Tasks",
        "System.Threading.Tasks.Extensions",
        "System.Xml",
        "System.Xml.ReaderWriter",
        "Microsoft.CSharp",
        "Microsoft.VisualBasic",
        "Microsoft.Win32.Primitives",
    };
    return BASELINE;
}

auto is_platform_assembly(std::string_view assembly_name) -> bool {
    std::string lower = to_lower_ascii(assembly_name);
    const auto& baseline = platform_baseline();
    return std::any_of(baseline.begin(), baseline.end(),
                       [&](const std::string& name) { return to_lower_ascii(name) == lower; });
}

LoadContext::~LoadContext() {
    if (!modules_.empty()) {
        APIDIFF_LOG_TRACE("metadata", "Disposing load context with " << modules_.size()
                                                                     << " modules");
    }
}

auto LoadContext::add_module(std::string module_name, ByteBuffer bytes)
    -> Result<const Module*, MetadataError> {
    auto skip = [&](MetadataError err) -> MetadataError {
        APIDIFF_LOG_WARN("metadata", "Skipping " << module_name << ": " << err.to_string());
        skipped_.push_back(SkippedModule{module_name, err.message});
        return err;
    };

    auto loaded = Module::load(module_name, std::move(bytes));
    if (is_err(loaded)) {
        return skip(std::move(unwrap_err(loaded)));
    }
    Box<Module>& module = unwrap(loaded);

    std::string key = to_lower_ascii(module->assembly_name());
    if (by_assembly_.count(key) != 0) {
        return skip(MetadataError{"assembly " + module->assembly_name() + " is already loaded", 0});
    }

    const Module* raw = module.get();
    by_assembly_.emplace(std::move(key), raw);
    modules_.push_back(std::move(module));
    APIDIFF_LOG_DEBUG("metadata", "Loaded " << module_name << " as assembly "
                                            << raw->assembly_name());
    return raw;
}

auto LoadContext::find_assembly(std::string_view assembly_name) const -> const Module* {
    auto it = by_assembly_.find(to_lower_ascii(assembly_name));
    return it == by_assembly_.end() ? nullptr : it->second;
}

auto LoadContext::resolve(const Module& from, CodedIndex type) const
    -> std::optional<ResolvedType> {
    if (type.is_null()) {
        return std::nullopt;
    }
    if (type.table == TableId::TypeDef) {
        return ResolvedType{&from, type.row};
    }
    if (type.table != TableId::TypeRef) {
        return std::nullopt;
    }

    const TypeRefTarget& target = from.type_ref_target(type.row);
    const Module* owner = target.assembly_name.empty() ? &from : find_assembly(target.assembly_name);
    if (owner == nullptr) {
        if (!is_platform_assembly(target.assembly_name)) {
            APIDIFF_LOG_DEBUG("metadata", "Unresolved reference " << target.full_name << " in "
                                                                  << target.assembly_name);
        }
        return std::nullopt;
    }
    uint32_t row = owner->find_type(target.full_name);
    if (row == 0) {
        APIDIFF_LOG_DEBUG("metadata", "Type " << target.full_name << " not found in "
                                              << owner->assembly_name());
        return std::nullopt;
    }
    return ResolvedType{owner, row};
}

} // namespace apidiff::metadata
