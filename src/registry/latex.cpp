#include "capprobe/latex.hpp"

#include <algorithm>

namespace capprobe {

InstallHint latex_install_hint() {
    return InstallHint{LATEX_PACKAGE, LATEX_URL};
}

FunctionalCheck latex_functional_check() {
    FunctionalCheck check;
    check.arguments = {"-interaction=nonstopmode"};
    check.input =
        "\\documentclass{article}\n"
        "\\begin{document}\n"
        "$\\alpha+2$\n"
        "\\end{document}";
    check.input_extension = ".tex";
    return check;
}

ExecutableProbe latex_program(const std::string& program) {
    return make_executable_probe(program, program, latex_install_hint(), latex_functional_check());
}

ExecutableProbe latex() { return latex_program("latex"); }
ExecutableProbe pdflatex() { return latex_program("pdflatex"); }
ExecutableProbe xelatex() { return latex_program("xelatex"); }
ExecutableProbe lualatex() { return latex_program("lualatex"); }

ExecutableProbe kpsewhich() {
    return make_executable_probe(TEX_RESOLVER, TEX_RESOLVER, latex_install_hint());
}

StaticFileProbe tex_file(const std::string& name, const std::string& filename) {
    return make_static_file_probe(name, filename, TEX_RESOLVER,
                                  {Probe(pdflatex()), Probe(kpsewhich())},
                                  latex_install_hint());
}

std::string latex_package_name(const std::string& package_name) {
    std::string name = "latex_package_" + package_name;
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

StaticFileProbe latex_package(const std::string& package_name) {
    return tex_file(latex_package_name(package_name), package_name + ".sty");
}

ProbeRegistry latex_registry() {
    ProbeRegistry registry("latex");
    registry.add(latex());
    registry.add(pdflatex());
    registry.add(xelatex());
    registry.add(lualatex());
    registry.add(latex_package("tkz-graph"));
    return registry;
}

std::vector<Probe> all_known_probes() {
    return latex_registry().probes();
}

} // namespace capprobe
