#include "decompile/decompiler.hpp"

#include "log/log.hpp"
#include "metadata/load_context.hpp"
#include "surface/surface_extractor.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace apidiff::decompile {

using surface::TypeSurface;

namespace {

constexpr const char* INDENT = "    ";

auto read_file(const std::filesystem::path& path) -> Result<ByteBuffer, DecompileError> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return DecompileError{"cannot open " + path.string()};
    }
    ByteBuffer bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return DecompileError{"cannot read " + path.string()};
    }
    return bytes;
}

auto quoted(const std::string& text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void write_obsolete(std::ostringstream& out, const std::optional<std::string>& message,
                    const std::string& indent) {
    if (!message) {
        return;
    }
    out << indent << "[Obsolete";
    if (!message->empty()) {
        out << "(" << quoted(*message) << ")";
    }
    out << "]\n";
}

/// Simple name without the arity suffix.
auto declared_name(const TypeSurface& type) -> std::string {
    std::string name = type.name;
    auto tick = name.find('`');
    if (tick != std::string::npos) {
        name.resize(tick);
    }
    return name;
}

void write_type(std::ostringstream& out, const TypeSurface& type, const std::string& indent) {
    write_obsolete(out, type.obsolete_message, indent);
    out << indent << (type.is_public ? "public " : "internal ") << type.kind << " "
        << declared_name(type);

    std::vector<std::string> bases;
    bool implicit_base = type.kind == surface::kind::STRUCT || type.kind == surface::kind::ENUM;
    if (type.base_type && !implicit_base && *type.base_type != "System.Object") {
        bases.push_back(*type.base_type);
    }
    bases.insert(bases.end(), type.interfaces.begin(), type.interfaces.end());
    for (size_t i = 0; i < bases.size(); ++i) {
        out << (i == 0 ? " : " : ", ") << bases[i];
    }
    out << "\n" << indent << "{\n";

    std::string member_indent = indent + INDENT;
    for (const auto& property : type.properties) {
        out << member_indent << "public " << property.type_name << " " << property.name << " {";
        if (property.can_read) {
            out << " get;";
        }
        if (property.can_write) {
            out << " set;";
        }
        out << " }\n";
    }
    if (!type.properties.empty() && !type.methods.empty()) {
        out << "\n";
    }
    for (const auto& method : type.methods) {
        write_obsolete(out, method.obsolete_message, member_indent);
        out << member_indent << "public ";
        if (method.is_static) {
            out << "static ";
        }
        out << method.return_type << " " << method.name << "(";
        for (size_t i = 0; i < method.parameters.size(); ++i) {
            const auto& parameter = method.parameters[i];
            if (i > 0) {
                out << ", ";
            }
            out << parameter.type_name << " " << parameter.name;
            if (parameter.has_default) {
                out << " = default";
            }
        }
        out << ") { ... }\n";
    }
    out << indent << "}\n";
}

} // namespace

auto OutlineDecompiler::render(const std::vector<TypeSurface>& types) -> std::string {
    std::vector<std::string> namespaces;
    for (const auto& type : types) {
        if (std::find(namespaces.begin(), namespaces.end(), type.namespace_name) ==
            namespaces.end()) {
            namespaces.push_back(type.namespace_name);
        }
    }

    std::ostringstream out;
    bool first = true;
    for (const auto& ns : namespaces) {
        std::string indent;
        if (!first) {
            out << "\n";
        }
        first = false;
        if (!ns.empty()) {
            out << "namespace " << ns << "\n{\n";
            indent = INDENT;
        }
        bool first_type = true;
        for (const auto& type : types) {
            if (type.namespace_name != ns) {
                continue;
            }
            if (!first_type) {
                out << "\n";
            }
            first_type = false;
            write_type(out, type, indent);
        }
        if (!ns.empty()) {
            out << "}\n";
        }
    }
    return out.str();
}

auto OutlineDecompiler::decompile(const std::filesystem::path& module_path,
                                  const std::optional<std::string>& type_full_name)
    -> Result<std::string, DecompileError> {
    auto bytes = read_file(module_path);
    if (is_err(bytes)) {
        return unwrap_err(bytes);
    }

    metadata::LoadContext context;
    auto module = context.add_module(module_path.stem().string(), std::move(unwrap(bytes)));
    if (is_err(module)) {
        return DecompileError{unwrap_err(module).to_string()};
    }

    surface::SurfaceExtractor extractor(context);
    if (!type_full_name) {
        return render(extractor.extract(CancellationToken()));
    }

    const metadata::Module& loaded = *unwrap(module);
    uint32_t row = loaded.find_type(*type_full_name);
    if (row == 0) {
        APIDIFF_LOG_DEBUG("decompile", "Type " << *type_full_name << " not in "
                                               << loaded.module_name());
        return "// Type '" + *type_full_name + "' not found";
    }
    return render({extractor.extract_type(loaded, row)});
}

} // namespace apidiff::decompile
