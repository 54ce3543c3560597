/**
 * capprobe CLI - which command
 *
 * Print the absolute path behind a registry probe.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace capprobe::cli::commands {

namespace {

struct WhichOptions {
    std::string name;
};

int cmd_which(const GlobalOptions& opts, const WhichOptions& which_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    auto probe = latex_registry().get(which_opts.name);
    if (probe.isErr()) {
        print_error(probe.error().message(), opts.json);
        return 1;
    }

    auto prober = Prober::create(*config);
    auto path = prober->absolute_filename(probe.value());
    if (path.isErr()) {
        print_error(path.error().message(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["name"] = probe.value().name();
        j["path"] = path.value();
        output_json(j);
    } else {
        std::cout << path.value() << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_which(CLI::App* app, GlobalOptions& opts) {
    static WhichOptions which_opts;

    app->add_option("name", which_opts.name, "Probe name (see 'capprobe list')")->required();

    app->callback([&opts]() {
        std::exit(cmd_which(opts, which_opts));
    });
}

} // namespace capprobe::cli::commands
