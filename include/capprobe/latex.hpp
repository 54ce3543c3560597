#pragma once

#include "capprobe/probe.hpp"
#include "capprobe/registry.hpp"

#include <string>
#include <vector>

namespace capprobe {

// ============================================================================
// LaTeX Toolchain
// ============================================================================

constexpr const char* LATEX_URL = "https://www.latex-project.org/";
constexpr const char* LATEX_PACKAGE = "texlive";
constexpr const char* TEX_RESOLVER = "kpsewhich";

InstallHint latex_install_hint();

// Compile a one-line article with `-interaction=nonstopmode`
FunctionalCheck latex_functional_check();

// Typesetting program `program` with the LaTeX functional check
ExecutableProbe latex_program(const std::string& program);

ExecutableProbe latex();
ExecutableProbe pdflatex();
ExecutableProbe xelatex();
ExecutableProbe lualatex();

// The resolver tool used by TeX file probes
ExecutableProbe kpsewhich();

// ============================================================================
// TeX Files
// ============================================================================

// File located through kpsewhich; requires pdflatex and kpsewhich to be present
StaticFileProbe tex_file(const std::string& name, const std::string& filename);

// "latex_package_" + package_name, with every '-' replaced by '_'
std::string latex_package_name(const std::string& package_name);

// `<package_name>.sty`. Equal package names give equal probes.
StaticFileProbe latex_package(const std::string& package_name);

// ============================================================================
// Registry
// ============================================================================

// latex, pdflatex, xelatex, lualatex, latex_package("tkz-graph")
ProbeRegistry latex_registry();

std::vector<Probe> all_known_probes();

} // namespace capprobe
