/**
 * capprobe CLI - package command
 *
 * Check whether a LaTeX package is installed.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace capprobe::cli::commands {

namespace {

struct PackageOptions {
    std::string id;
    bool path = false;
};

int cmd_package(const GlobalOptions& opts, const PackageOptions& pkg_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    Probe probe = latex_package(pkg_opts.id);
    auto prober = Prober::create(*config);
    ProbeResult result = prober->is_present(probe);

    std::optional<std::string> path;
    if (result && pkg_opts.path) {
        auto resolved = prober->absolute_filename(probe);
        if (resolved.isErr()) {
            print_error(resolved.error().message(), opts.json);
            return 1;
        }
        path = resolved.value();
    }

    if (opts.json) {
        auto j = result_to_json(result);
        j["package"] = pkg_opts.id;
        if (path) {
            j["path"] = *path;
        }
        if (!result) {
            std::string hint = resolution(probe);
            if (!hint.empty()) {
                j["resolution"] = hint;
            }
        }
        output_json(j);
    } else if (!opts.quiet) {
        print_result(result);
        if (path) {
            std::cout << *path << std::endl;
        }
        if (!result) {
            std::string hint = resolution(probe);
            if (!hint.empty()) {
                std::cout << hint << std::endl;
            }
        }
    }

    return result ? 0 : 1;
}

} // anonymous namespace

void setup_package(CLI::App* app, GlobalOptions& opts) {
    static PackageOptions pkg_opts;

    app->add_option("id", pkg_opts.id, "Package identifier (e.g. tkz-graph)")->required();
    app->add_flag("--path", pkg_opts.path, "Print the resolved .sty path");

    app->callback([&opts]() {
        std::exit(cmd_package(opts, pkg_opts));
    });
}

} // namespace capprobe::cli::commands
