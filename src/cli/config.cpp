#include "cli/config.hpp"

#include "package/registry.hpp"

#include <cstdlib>

namespace apidiff::cli {

namespace {

auto env_or(const char* name, std::string fallback) -> std::string {
    const char* value = std::getenv(name);
    if (value != nullptr && !is_blank(value)) {
        return value;
    }
    return fallback;
}

} // namespace

auto parse_config(int argc, char* argv[]) -> Result<Config, std::string> {
    Config config;
    config.log = log::parse_log_options(argc, argv);
    config.source = env_or("APIDIFF_SOURCE", package::DEFAULT_SOURCE);

    std::string scratch = env_or("APIDIFF_SCRATCH", "");
    if (!scratch.empty()) {
        config.scratch_root = scratch;
    } else {
        std::error_code ec;
        config.scratch_root = std::filesystem::temp_directory_path(ec);
        if (ec) {
            config.scratch_root = ".";
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            config.help = true;
        } else if (arg.starts_with("--source=")) {
            config.source = arg.substr(9);
            if (is_blank(config.source)) {
                return std::string("--source requires a value");
            }
        } else if (arg.starts_with("--scratch-dir=")) {
            std::string dir = arg.substr(14);
            if (is_blank(dir)) {
                return std::string("--scratch-dir requires a value");
            }
            config.scratch_root = dir;
        } else if (arg == "--include-non-public") {
            config.include_non_public = true;
        } else if (arg == "--json") {
            config.json = true;
        } else if (arg.starts_with("-") && arg != "-") {
            return "Unknown option: " + arg;
        } else if (config.command.empty()) {
            config.command = arg;
        } else {
            config.positional.push_back(arg);
        }
    }

    return config;
}

} // namespace apidiff::cli
