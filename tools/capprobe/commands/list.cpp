/**
 * capprobe CLI - list command
 *
 * List every probe the registry knows about.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace capprobe::cli::commands {

namespace {

int cmd_list(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    if (!load_config(opts)) {
        return 1;
    }

    auto registry = latex_registry();

    if (opts.json) {
        nlohmann::json result;
        result["registry"] = registry.name();
        result["probes"] = nlohmann::json::array();
        for (const auto& probe : registry.probes()) {
            result["probes"].push_back(probe_to_json(probe));
        }
        output_json(result);
        return 0;
    }

    std::cout << "Probes (" << registry.name() << "):" << std::endl;
    for (const auto& probe : registry.probes()) {
        std::cout << "  " << probe.name() << " [" << kind_to_string(probe.kind()) << "]";
        if (!probe.hint().package.empty()) {
            std::cout << " (package: " << probe.hint().package << ")";
        }
        std::cout << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_list(opts));
    });
}

} // namespace capprobe::cli::commands
