#pragma once

#include <optional>
#include <string>
#include <vector>

namespace capprobe {

// ============================================================================
// Probe Kind
// ============================================================================

enum class ProbeKind {
    Executable,
    StaticFile,
    Composite
};

inline const char* kind_to_string(ProbeKind k) {
    switch (k) {
        case ProbeKind::Executable: return "executable";
        case ProbeKind::StaticFile: return "static_file";
        case ProbeKind::Composite: return "composite";
        default: return "unknown";
    }
}

std::optional<ProbeKind> parse_probe_kind(const std::string& s);

// ============================================================================
// Check Mode
// ============================================================================

// Presence and functional verdicts are cached under separate keys
enum class CheckMode {
    Presence,
    Functional
};

inline const char* check_mode_to_string(CheckMode m) {
    switch (m) {
        case CheckMode::Presence: return "presence";
        case CheckMode::Functional: return "functional";
        default: return "unknown";
    }
}

// ============================================================================
// Install Hint
// ============================================================================

// Where a missing capability might come from. Only used to explain absence.
struct InstallHint {
    std::string package;  // distribution package name, e.g. "texlive"
    std::string url;      // documentation URL

    bool empty() const { return package.empty() && url.empty(); }

    bool operator==(const InstallHint& other) const {
        return package == other.package && url == other.url;
    }
    bool operator!=(const InstallHint& other) const { return !(*this == other); }
};

// ============================================================================
// Probe Result
// ============================================================================

class ProbeResult {
public:
    static ProbeResult found(std::string subject_name) {
        return ProbeResult(std::move(subject_name), true, std::nullopt);
    }

    // An empty reason is replaced by a generic one; every negative result explains itself.
    static ProbeResult missing(std::string subject_name, std::string reason);

    const std::string& subject_name() const { return subject_name_; }
    bool present() const { return present_; }
    const std::optional<std::string>& reason() const { return reason_; }

    explicit operator bool() const { return present_; }

    // Two results for the same probe compare by (subject_name, present)
    bool operator==(const ProbeResult& other) const {
        return subject_name_ == other.subject_name_ && present_ == other.present_;
    }
    bool operator!=(const ProbeResult& other) const { return !(*this == other); }

    // Same subject, verdict and reason
    bool identical(const ProbeResult& other) const {
        return *this == other && reason_ == other.reason_;
    }

    std::string toString() const;

private:
    ProbeResult(std::string subject_name, bool present, std::optional<std::string> reason)
        : subject_name_(std::move(subject_name)), present_(present), reason_(std::move(reason)) {}

    std::string subject_name_;
    bool present_;
    std::optional<std::string> reason_;
};

// ============================================================================
// Functional Check
// ============================================================================

// Runs `<program> <arguments...> <scratch file>` from the scratch directory.
// Only the exit status is inspected.
struct FunctionalCheck {
    std::vector<std::string> arguments;
    std::string input;            // content of the scratch input file
    std::string input_extension;  // e.g. ".tex"

    bool operator==(const FunctionalCheck& other) const {
        return arguments == other.arguments && input == other.input &&
               input_extension == other.input_extension;
    }
    bool operator!=(const FunctionalCheck& other) const { return !(*this == other); }
};

} // namespace capprobe
