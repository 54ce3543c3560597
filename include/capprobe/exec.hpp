#pragma once

/**
 * @file exec.hpp
 * @brief Spawn-and-wait for probe subprocesses
 *
 * Probes only ever need to start a program, optionally capture its standard
 * output, and read its exit status. ProcessRunner is the seam tests replace
 * with a double that returns canned results.
 */

#include <chrono>
#include <string>
#include <vector>

namespace capprobe {
namespace exec {

// ============================================================================
// EXECUTION REQUEST / RESULT
// ============================================================================

struct ExecRequest {
    std::vector<std::string> argv;        // argv[0] is the program (absolute or looked up)
    std::string cwd;                      // empty: inherit
    bool capture_stdout = false;          // otherwise stdout goes to /dev/null
    std::chrono::milliseconds timeout{0}; // 0: wait indefinitely; clamped to INT_MAX ms
};

struct ExecResult {
    bool ok = false;        // process was spawned and reaped
    int exit_code = -1;     // valid when exited
    bool exited = false;    // terminated through exit()
    int term_signal = 0;    // non-zero when killed by a signal
    bool timed_out = false; // killed after exceeding the timeout
    std::string output;     // captured stdout
    std::string error;      // spawn / wait failure
};

// Human-readable account of how a process ended, e.g. "exit status 1"
std::string describe_termination(const ExecResult& result);

// ============================================================================
// PROCESS RUNNER
// ============================================================================

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ExecResult run(const ExecRequest& request) = 0;
};

/**
 * Runs requests with fork/execv (Unix).
 *
 * stdin and stderr are connected to /dev/null so that an interactive
 * program cannot block on the terminal. When a timeout is set the child is
 * killed with SIGKILL once it elapses.
 */
class SubprocessRunner : public ProcessRunner {
public:
    ExecResult run(const ExecRequest& request) override;
};

} // namespace exec
} // namespace capprobe
