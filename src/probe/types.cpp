#include "capprobe/types.hpp"

#include <algorithm>
#include <cctype>

namespace capprobe {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<ProbeKind> parse_probe_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "executable") return ProbeKind::Executable;
    if (lower == "static_file") return ProbeKind::StaticFile;
    if (lower == "composite") return ProbeKind::Composite;
    return std::nullopt;
}

ProbeResult ProbeResult::missing(std::string subject_name, std::string reason) {
    if (reason.empty()) {
        reason = "'" + subject_name + "' is not available";
    }
    return ProbeResult(std::move(subject_name), false, std::move(reason));
}

std::string ProbeResult::toString() const {
    std::string out = subject_name_ + ": " + (present_ ? "present" : "absent");
    if (reason_) {
        out += " (" + *reason_ + ")";
    }
    return out;
}

} // namespace capprobe
