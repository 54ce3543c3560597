/**
 * capprobe CLI - Entry Point
 *
 * Report which optional external capabilities are available.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace capprobe::cli::commands {
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_which(CLI::App* app, GlobalOptions& opts);
    void setup_package(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace capprobe::cli;

    CLI::App app{"capprobe - probe optional external capabilities"};
    app.set_version_flag("-V,--version", CAPPROBE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (default: $CAPPROBE_CONFIG)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* list_cmd = app.add_subcommand("list", "List known probes");
    commands::setup_list(list_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Check whether capabilities are available");
    commands::setup_check(check_cmd, opts);

    auto* which_cmd = app.add_subcommand("which", "Print the path behind a probe");
    commands::setup_which(which_cmd, opts);

    auto* package_cmd = app.add_subcommand("package", "Check for a LaTeX package");
    commands::setup_package(package_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
