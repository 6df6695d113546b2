//! # CLI Configuration
//!
//! Options shared by every `apidiff` command, assembled from the command
//! line and the environment. Command-line options win over environment
//! variables.
//!
//! | Option | Environment | Default |
//! |--------|-------------|---------|
//! | `--source=<url-or-dir>` | `APIDIFF_SOURCE` | nuget.org service index |
//! | `--scratch-dir=<dir>` | `APIDIFF_SCRATCH` | system temp directory |
//! | `--include-non-public` | | off |
//! | `--json` | | off |
//!
//! Logging options (`--log-level=`, `-v`, ...) are consumed by
//! `log::parse_log_options` and never show up as positional arguments.

#pragma once

#include "common.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace apidiff::cli {

struct Config {
    std::string command;
    std::vector<std::string> positional;

    std::string source;
    std::filesystem::path scratch_root;
    bool include_non_public = false;
    bool json = false;
    bool help = false;

    log::LogConfig log;
};

/// Parses `argv` (program name at index 0). Unknown `--options` are errors.
[[nodiscard]] auto parse_config(int argc, char* argv[]) -> Result<Config, std::string>;

} // namespace apidiff::cli
