#include <doctest/doctest.h>
#include <capprobe/prober.hpp>

#include "../support/test_doubles.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>

using namespace capprobe;
using capprobe::testing::FakeRunner;
using capprobe::testing::ProberFixture;

namespace {

FunctionalCheck sample_check() {
    FunctionalCheck check;
    check.arguments = {"-interaction=nonstopmode"};
    check.input = "\\documentclass{article}\\begin{document}x\\end{document}";
    check.input_extension = ".tex";
    return check;
}

} // namespace

// ============================================================================
// Presence
// ============================================================================

TEST_CASE("executable probe is present when the locator finds the command") {
    ProberFixture fx;
    fx.locator->install("pdflatex", "/opt/tex/bin/pdflatex");
    auto prober = fx.make();

    auto result = prober->is_present(make_executable_probe("pdflatex", "pdflatex"));
    CHECK(result.present());
    CHECK(result.subject_name() == "pdflatex");
    CHECK_FALSE(result.reason().has_value());
    CHECK(fx.runner->calls() == 0);
}

TEST_CASE("missing executable is a normal negative result") {
    ProberFixture fx;
    auto prober = fx.make();

    auto result = prober->is_present(make_executable_probe("xelatex", "xelatex"));
    CHECK_FALSE(result.present());
    REQUIRE(result.reason().has_value());
    CHECK(result.reason()->find("xelatex") != std::string::npos);
    CHECK(result.reason()->find("not found") != std::string::npos);
}

TEST_CASE("is_present is idempotent and served from the cache") {
    ProberFixture fx;
    fx.resolver->provide("article.cls", "/tex/article.cls");
    fx.locator->install("pdflatex");
    auto prober = fx.make();

    Probe probe = make_static_file_probe("latex_class_article", "article.cls", "kpsewhich",
                                         {make_executable_probe("pdflatex", "pdflatex")});

    auto first = prober->is_present(probe);
    int locator_calls = fx.locator->calls();
    int resolver_calls = fx.resolver->calls();

    auto second = prober->is_present(probe);

    CHECK(first.identical(second));
    CHECK(fx.locator->calls() == locator_calls);
    CHECK(fx.resolver->calls() == resolver_calls);
}

TEST_CASE("negative verdicts are cached too") {
    ProberFixture fx;
    auto prober = fx.make();
    Probe probe = make_executable_probe("lualatex", "lualatex");

    auto first = prober->is_present(probe);
    auto second = prober->is_present(probe);

    CHECK(first.identical(second));
    CHECK(fx.locator->calls() == 1);
}

TEST_CASE("separately constructed equal probes share a verdict") {
    ProberFixture fx;
    fx.locator->install("latex");
    auto prober = fx.make();

    prober->is_present(make_executable_probe("latex", "latex"));
    prober->is_present(make_executable_probe("latex", "latex"));

    CHECK(fx.locator->calls() == 1);
}

// ============================================================================
// Composite
// ============================================================================

TEST_CASE("composite short-circuits at the first absent member") {
    ProberFixture fx;
    fx.locator->install("b");
    auto prober = fx.make();

    Probe a = make_executable_probe("A", "a");
    Probe b = make_executable_probe("B", "b");
    Probe composite = make_composite_probe("AB", {a, b});

    auto result = prober->is_present(composite);
    auto a_result = prober->is_present(a);

    CHECK_FALSE(result.present());
    CHECK(result.subject_name() == "AB");
    REQUIRE(result.reason().has_value());
    CHECK(*result.reason() == *a_result.reason());

    // B was never looked up
    auto lookups = fx.locator->lookups();
    CHECK(std::find(lookups.begin(), lookups.end(), "b") == lookups.end());
}

TEST_CASE("composite reason is the first failing member's reason verbatim") {
    ProberFixture fx;
    fx.locator->install("a");
    auto prober = fx.make();

    Probe inner = make_static_file_probe("graph", "tkz-graph.sty", "kpsewhich");
    Probe composite = make_composite_probe("outer",
                                           {make_executable_probe("A", "a"), inner,
                                            make_executable_probe("C", "c")});

    auto result = prober->is_present(composite);
    CHECK_FALSE(result.present());
    REQUIRE(result.reason().has_value());
    CHECK(*result.reason() == "'tkz-graph.sty' not found by kpsewhich");
}

TEST_CASE("composite with every member present is present without a reason") {
    ProberFixture fx;
    fx.locator->install("a").install("b");
    auto prober = fx.make();

    Probe composite = make_composite_probe(
        "AB", {make_executable_probe("A", "a"), make_executable_probe("B", "b")});

    auto result = prober->is_present(composite);
    CHECK(result.present());
    CHECK_FALSE(result.reason().has_value());
}

TEST_CASE("empty composite is present") {
    ProberFixture fx;
    auto prober = fx.make();
    CHECK(prober->is_present(make_composite_probe("nothing", {})).present());
}

TEST_CASE("composite members are cached individually") {
    ProberFixture fx;
    fx.locator->install("a");
    auto prober = fx.make();

    Probe a = make_executable_probe("A", "a");
    prober->is_present(make_composite_probe("X", {a}));
    prober->is_present(make_composite_probe("Y", {a}));
    prober->is_present(a);

    CHECK(fx.locator->calls() == 1);
}

// ============================================================================
// Static files
// ============================================================================

TEST_CASE("static file probe resolves through the resolver") {
    ProberFixture fx;
    fx.resolver->provide("article.cls", "/usr/share/texmf/tex/latex/base/article.cls");
    auto prober = fx.make();

    Probe probe = make_static_file_probe("latex_class_article", "article.cls", "kpsewhich");
    CHECK(prober->is_present(probe).present());

    auto path = prober->absolute_filename(probe);
    REQUIRE(path.isOk());
    CHECK(path.value() == "/usr/share/texmf/tex/latex/base/article.cls");
    CHECK(fx.resolver->calls() == 1);
}

TEST_CASE("unresolvable static file reports not found by the resolver") {
    ProberFixture fx;
    auto prober = fx.make();

    Probe probe = make_static_file_probe("nonexisting", "xxxxxx-nonexisting-file.tex", "kpsewhich");
    auto result = prober->is_present(probe);

    CHECK_FALSE(result.present());
    REQUIRE(result.reason().has_value());
    CHECK(result.reason()->find("not found") != std::string::npos);
    CHECK(result.reason()->find("xxxxxx-nonexisting-file.tex") != std::string::npos);
}

TEST_CASE("absent resolver dependency gates resolution") {
    ProberFixture fx;
    fx.resolver->provide("tkz-graph.sty", "/tex/tkz-graph.sty");
    auto prober = fx.make();

    Probe resolver_tool = make_executable_probe("kpsewhich", "kpsewhich");
    Probe probe = make_static_file_probe("latex_package_tkz_graph", "tkz-graph.sty", "kpsewhich",
                                         {resolver_tool});

    auto result = prober->is_present(probe);
    auto tool_result = prober->is_present(resolver_tool);

    CHECK_FALSE(result.present());
    REQUIRE(result.reason().has_value());
    CHECK(*result.reason() == *tool_result.reason());
    CHECK(result.reason()->find("kpsewhich") != std::string::npos);
    CHECK(fx.resolver->calls() == 0);
}

TEST_CASE("dependencies are evaluated in order") {
    ProberFixture fx;
    auto prober = fx.make();

    Probe probe = make_static_file_probe(
        "f", "f.sty", "kpsewhich",
        {make_executable_probe("pdflatex", "pdflatex"), make_executable_probe("kpsewhich", "kpsewhich")});

    auto result = prober->is_present(probe);
    REQUIRE(result.reason().has_value());
    CHECK(result.reason()->find("pdflatex") != std::string::npos);

    auto lookups = fx.locator->lookups();
    REQUIRE(lookups.size() == 1);
    CHECK(lookups[0] == "pdflatex");
}

// ============================================================================
// absolute_filename / require / resolution
// ============================================================================

TEST_CASE("absolute_filename signals NOT_PRESENT with the presence reason") {
    ProberFixture fx;
    auto prober = fx.make();

    Probe probe = make_static_file_probe("nonexisting", "nope.tex", "kpsewhich");
    auto path = prober->absolute_filename(probe);
    auto presence = prober->is_present(probe);

    REQUIRE(path.isErr());
    CHECK(path.error().code() == ErrorCode::NOT_PRESENT);
    CHECK(path.error().message() == *presence.reason());
}

TEST_CASE("absolute_filename of an executable is its located path") {
    ProberFixture fx;
    fx.locator->install("pdflatex", "/opt/tex/bin/pdflatex");
    auto prober = fx.make();

    auto path = prober->absolute_filename(make_executable_probe("pdflatex", "pdflatex"));
    REQUIRE(path.isOk());
    CHECK(path.value() == "/opt/tex/bin/pdflatex");
}

TEST_CASE("absolute_filename of a composite is NOT_A_FILE") {
    ProberFixture fx;
    auto prober = fx.make();

    auto path = prober->absolute_filename(make_composite_probe("c", {}));
    REQUIRE(path.isErr());
    CHECK(path.error().code() == ErrorCode::NOT_A_FILE);
}

TEST_CASE("absolute_filename resolves again when the verdict came from a shared cache") {
    ProberFixture fx;
    fx.resolver->provide("article.cls", "/tex/article.cls");
    Probe probe = make_static_file_probe("article", "article.cls", "kpsewhich");

    auto first = fx.make();
    CHECK(first->is_present(probe).present());

    auto second = fx.make();
    auto path = second->absolute_filename(probe);
    REQUIRE(path.isOk());
    CHECK(path.value() == "/tex/article.cls");
    CHECK(fx.resolver->calls() == 2);
}

TEST_CASE("require explains absence and includes install hints") {
    ProberFixture fx;
    auto prober = fx.make();

    Probe probe = make_executable_probe("latex", "latex",
                                        InstallHint{"texlive", "https://www.latex-project.org/"});
    auto required = prober->require(probe);

    REQUIRE(required.isErr());
    CHECK(required.error().code() == ErrorCode::NOT_PRESENT);
    const auto& message = required.error().message();
    CHECK(message.find("latex is not available") != std::string::npos);
    CHECK(message.find("not found on PATH") != std::string::npos);
    CHECK(message.find("'texlive'") != std::string::npos);
    CHECK(message.find("https://www.latex-project.org/") != std::string::npos);
}

TEST_CASE("require succeeds for a present probe") {
    ProberFixture fx;
    fx.locator->install("latex");
    auto prober = fx.make();
    CHECK(prober->require(make_executable_probe("latex", "latex")).isOk());
}

TEST_CASE("resolution text follows the hint") {
    CHECK(resolution(make_executable_probe("x", "x")).empty());
    CHECK(resolution(make_executable_probe("x", "x", InstallHint{"pkg", ""})) ==
          "To install x you can try installing the package 'pkg'.");
    CHECK(resolution(make_executable_probe("x", "x", InstallHint{"", "https://example.org"})) ==
          "Further installation instructions might be available at https://example.org.");
    CHECK(resolution(make_executable_probe("x", "x", InstallHint{"pkg", "https://example.org"})) ==
          "To install x you can try installing the package 'pkg'. "
          "Further installation instructions might be available at https://example.org.");
}

// ============================================================================
// Functional checks
// ============================================================================

TEST_CASE("functional check runs the program on a scratch input") {
    ProberFixture fx;
    fx.locator->install("pdflatex", "/opt/tex/bin/pdflatex");
    auto prober = fx.make();

    Probe probe = make_executable_probe("pdflatex", "pdflatex", {}, sample_check());
    auto result = prober->is_functional(probe);

    CHECK(result.present());
    REQUIRE(fx.runner->calls() == 1);

    auto request = fx.runner->last_request();
    REQUIRE(request.argv.size() == 3);
    CHECK(request.argv[0] == "/opt/tex/bin/pdflatex");
    CHECK(request.argv[1] == "-interaction=nonstopmode");
    CHECK(request.argv[2].size() > 4);
    CHECK(request.argv[2].substr(request.argv[2].size() - 4) == ".tex");
    CHECK_FALSE(request.cwd.empty());
    CHECK(fx.runner->input_existed());

    // The scratch directory is gone once the check is over
    CHECK_FALSE(std::filesystem::exists(request.cwd));
}

TEST_CASE("functional failure downgrades the verdict with a distinct reason") {
    ProberFixture fx;
    fx.locator->install("latex");
    fx.runner = std::make_shared<FakeRunner>(FakeRunner::exited(1));
    auto prober = fx.make();

    Probe probe = make_executable_probe("latex", "latex", {}, sample_check());

    CHECK(prober->is_present(probe).present());
    auto functional = prober->is_functional(probe);

    CHECK_FALSE(functional.present());
    REQUIRE(functional.reason().has_value());
    CHECK(functional.reason()->find("non-zero exit status 1") != std::string::npos);
    CHECK(functional.reason()->find("not found") == std::string::npos);

    // Scratch directory cleaned up on failure as well
    CHECK_FALSE(std::filesystem::exists(fx.runner->last_request().cwd));
}

TEST_CASE("functional reason differs from the not-found reason") {
    ProberFixture present_fx;
    present_fx.locator->install("latex");
    present_fx.runner = std::make_shared<FakeRunner>(FakeRunner::exited(1));
    auto not_functional = present_fx.make()->is_functional(
        make_executable_probe("latex", "latex", {}, sample_check()));

    ProberFixture absent_fx;
    auto not_found = absent_fx.make()->is_functional(
        make_executable_probe("latex", "latex", {}, sample_check()));

    CHECK_FALSE(not_functional.present());
    CHECK_FALSE(not_found.present());
    CHECK(*not_functional.reason() != *not_found.reason());
    CHECK(absent_fx.runner->calls() == 0);
}

TEST_CASE("functional check termination by signal is reported") {
    ProberFixture fx;
    fx.locator->install("latex");
    fx.runner = std::make_shared<FakeRunner>(FakeRunner::signaled(SIGSEGV));
    auto prober = fx.make();

    auto result = prober->is_functional(make_executable_probe("latex", "latex", {}, sample_check()));
    CHECK_FALSE(result.present());
    REQUIRE(result.reason().has_value());
    CHECK(result.reason()->find("signal") != std::string::npos);
}

TEST_CASE("functional check timeout is reported") {
    ProberFixture fx;
    fx.locator->install("latex");
    exec::ExecResult timed_out;
    timed_out.ok = true;
    timed_out.timed_out = true;
    timed_out.term_signal = SIGKILL;
    fx.runner = std::make_shared<FakeRunner>(timed_out);

    ProbeConfig config;
    config.timeout = std::chrono::milliseconds(250);
    auto prober = fx.make(config);

    auto result = prober->is_functional(make_executable_probe("latex", "latex", {}, sample_check()));
    CHECK_FALSE(result.present());
    REQUIRE(result.reason().has_value());
    CHECK(result.reason()->find("timed out after 250 ms") != std::string::npos);
    CHECK(fx.runner->last_request().timeout == std::chrono::milliseconds(250));
}

TEST_CASE("functional verdict is cached") {
    ProberFixture fx;
    fx.locator->install("latex");
    auto prober = fx.make();

    Probe probe = make_executable_probe("latex", "latex", {}, sample_check());
    auto first = prober->is_functional(probe);
    auto second = prober->is_functional(probe);

    CHECK(first.identical(second));
    CHECK(fx.runner->calls() == 1);
}

TEST_CASE("is_functional falls back to is_present without a functional check") {
    ProberFixture fx;
    fx.locator->install("kpsewhich");
    fx.resolver->provide("a.sty", "/tex/a.sty");
    auto prober = fx.make();

    CHECK(prober->is_functional(make_executable_probe("kpsewhich", "kpsewhich")).present());
    CHECK(prober->is_functional(make_static_file_probe("a", "a.sty", "kpsewhich")).present());
    CHECK(prober->is_functional(make_composite_probe("c", {})).present());
    CHECK(fx.runner->calls() == 0);
}

TEST_CASE("scratch root that does not exist makes the check fail, not crash") {
    ProberFixture fx;
    fx.locator->install("latex");
    ProbeConfig config;
    config.scratch_root = "/nonexistent/capprobe/scratch/root";
    auto prober = fx.make(config);

    auto result = prober->is_functional(make_executable_probe("latex", "latex", {}, sample_check()));
    CHECK_FALSE(result.present());
    REQUIRE(result.reason().has_value());
    CHECK(result.reason()->find("could not be prepared") != std::string::npos);
    CHECK(fx.runner->calls() == 0);
}
