//! # CLI Command Dispatcher
//!
//! Parses the command line, initializes logging and routes to the
//! command handlers.
//!
//! ```text
//! apidiff_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ mcp            → cmd_mcp()
//!   ├─ diff           → cmd_diff()
//!   ├─ surface        → cmd_surface()
//!   ├─ decompile      → cmd_decompile()
//!   └─ obsolete       → cmd_obsolete()
//! ```

#include "cli/commands.hpp"
#include "cli/config.hpp"
#include "cli/driver.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>

namespace apidiff::cli {

namespace {

void print_usage() {
    std::cout << R"(apidiff - NuGet package API surface and version diff tool

Usage: apidiff <command> [options]

Commands:
  mcp                                   Run the MCP server on stdio
  diff <id> <from> <to>                 Report API changes between two versions
  surface <id> <version>                Print the API surface as JSON
  decompile <id> <version> [type]       Print outline source of the package
  obsolete <id> <version>               List [Obsolete] types and methods

Options:
  --source=<url-or-dir>   Service index URL or local feed directory
                          (env APIDIFF_SOURCE, default nuget.org)
  --scratch-dir=<dir>     Parent of per-call scratch directories (env APIDIFF_SCRATCH)
  --include-non-public    surface: include non-public types
  --json                  Structured JSON output
  --log-level=<level>     trace, debug, info, warn, error, off
  --log-filter=<spec>     Per-module levels, e.g. "metadata=debug,*=warn"
  --log-file=<path>       Also write logs to a file
  --log-format=<fmt>      text or json
  -v, -vv, -vvv, -q       Verbosity shortcuts
  -h, --help              Show this help
  -V, --version           Show version
)";
}

void print_version() {
    std::cout << "apidiff " << VERSION << "\n";
}

} // namespace

} // namespace apidiff::cli

int apidiff_main(int argc, char* argv[]) {
    using namespace apidiff;

    if (argc >= 2) {
        std::string first = argv[1];
        if (first == "--version" || first == "-V") {
            cli::print_version();
            return 0;
        }
    }

    auto parsed = cli::parse_config(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "apidiff: " << unwrap_err(parsed) << "\n";
        return 2;
    }
    const auto& config = unwrap(parsed);

    log::Logger::init(config.log);

    if (config.command.empty()) {
        cli::print_usage();
        return config.help ? 0 : 2;
    }

    const auto& command = config.command;
    if (command == "mcp") {
        return cli::cmd_mcp(config);
    }
    if (config.help) {
        cli::print_usage();
        return 0;
    }
    if (command == "diff") {
        return cli::cmd_diff(config);
    }
    if (command == "surface") {
        return cli::cmd_surface(config);
    }
    if (command == "decompile") {
        return cli::cmd_decompile(config);
    }
    if (command == "obsolete") {
        return cli::cmd_obsolete(config);
    }

    std::cerr << "apidiff: unknown command '" << command << "'\n";
    cli::print_usage();
    return 2;
}
