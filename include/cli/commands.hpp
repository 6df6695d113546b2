//! # CLI Commands
//!
//! One function per `apidiff` subcommand. Each returns a process exit code:
//! 0 on success, 1 when the request failed, 2 on usage errors. Results go
//! to stdout, diagnostics to stderr.

#pragma once

#include "cli/config.hpp"

namespace apidiff::cli {

/// `apidiff mcp`: serves the package tools over stdio until stdin closes.
auto cmd_mcp(const Config& config) -> int;

/// `apidiff diff <id> <from> <to> [--json]`: markdown report, or the
/// structured diff with `--json`.
auto cmd_diff(const Config& config) -> int;

/// `apidiff surface <id> <version> [--include-non-public]`
auto cmd_surface(const Config& config) -> int;

/// `apidiff decompile <id> <version> [type]`
auto cmd_decompile(const Config& config) -> int;

/// `apidiff obsolete <id> <version>`
auto cmd_obsolete(const Config& config) -> int;

} // namespace apidiff::cli
