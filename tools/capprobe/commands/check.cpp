/**
 * capprobe CLI - check command
 *
 * Evaluate registry probes and report which capabilities are available.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace capprobe::cli::commands {

namespace {

struct CheckOptions {
    std::vector<std::string> names;
    bool functional = false;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    auto registry = latex_registry();

    // No names: every registered probe
    std::vector<Probe> selected;
    if (check_opts.names.empty()) {
        selected = registry.probes();
    } else {
        for (const auto& name : check_opts.names) {
            auto probe = registry.get(name);
            if (probe.isErr()) {
                print_error(probe.error().message(), opts.json);
                return 1;
            }
            selected.push_back(probe.value());
        }
    }

    auto prober = Prober::create(*config);

    bool all_present = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& probe : selected) {
        ProbeResult result = check_opts.functional ? prober->is_functional(probe)
                                                   : prober->is_present(probe);
        if (!result) {
            all_present = false;
        }

        if (opts.json) {
            auto j = result_to_json(result);
            if (!result) {
                std::string hint = resolution(probe);
                if (!hint.empty()) {
                    j["resolution"] = hint;
                }
            }
            results.push_back(j);
        } else if (!opts.quiet) {
            print_result(result);
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_present;
        j["mode"] = check_opts.functional ? "functional" : "presence";
        j["results"] = results;
        output_json(j);
    }

    return all_present ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("names", check_opts.names, "Probes to evaluate (default: all)");
    app->add_flag("-f,--functional", check_opts.functional,
                  "Also run functional checks (slow: invokes the programs)");

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace capprobe::cli::commands
