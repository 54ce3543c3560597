#include "capprobe/probe.hpp"

namespace capprobe {

bool ExecutableProbe::operator==(const ExecutableProbe& other) const {
    return name == other.name && command == other.command && hint == other.hint &&
           functional_check == other.functional_check;
}

bool StaticFileProbe::operator==(const StaticFileProbe& other) const {
    return name == other.name && filename == other.filename && resolver == other.resolver &&
           dependencies == other.dependencies && hint == other.hint;
}

bool CompositeProbe::operator==(const CompositeProbe& other) const {
    return name == other.name && members == other.members && hint == other.hint;
}

const std::string& Probe::name() const {
    return std::visit([](const auto& p) -> const std::string& { return p.name; }, variant);
}

ProbeKind Probe::kind() const {
    if (std::holds_alternative<ExecutableProbe>(variant)) return ProbeKind::Executable;
    if (std::holds_alternative<StaticFileProbe>(variant)) return ProbeKind::StaticFile;
    return ProbeKind::Composite;
}

const InstallHint& Probe::hint() const {
    return std::visit([](const auto& p) -> const InstallHint& { return p.hint; }, variant);
}

bool Probe::operator==(const Probe& other) const {
    return variant == other.variant;
}

ExecutableProbe make_executable_probe(std::string name,
                                      std::string command,
                                      InstallHint hint,
                                      std::optional<FunctionalCheck> functional_check) {
    ExecutableProbe p;
    p.name = std::move(name);
    p.command = std::move(command);
    p.hint = std::move(hint);
    p.functional_check = std::move(functional_check);
    return p;
}

StaticFileProbe make_static_file_probe(std::string name,
                                       std::string filename,
                                       std::string resolver,
                                       std::vector<Probe> dependencies,
                                       InstallHint hint) {
    StaticFileProbe p;
    p.name = std::move(name);
    p.filename = std::move(filename);
    p.resolver = std::move(resolver);
    p.dependencies = std::move(dependencies);
    p.hint = std::move(hint);
    return p;
}

CompositeProbe make_composite_probe(std::string name,
                                    std::vector<Probe> members,
                                    InstallHint hint) {
    CompositeProbe p;
    p.name = std::move(name);
    p.members = std::move(members);
    p.hint = std::move(hint);
    return p;
}

const std::vector<Probe>& dependencies(const Probe& probe) {
    static const std::vector<Probe> none;
    if (const auto* file = std::get_if<StaticFileProbe>(&probe.variant)) {
        return file->dependencies;
    }
    if (const auto* composite = std::get_if<CompositeProbe>(&probe.variant)) {
        return composite->members;
    }
    return none;
}

std::string probe_key(const Probe& probe, CheckMode mode) {
    return probe_key(probe.kind(), probe.name(), mode);
}

std::string probe_key(ProbeKind kind, const std::string& name, CheckMode mode) {
    return std::string(kind_to_string(kind)) + ":" + name + "#" + check_mode_to_string(mode);
}

} // namespace capprobe
