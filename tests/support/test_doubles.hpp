#pragma once

/**
 * Test doubles for the Prober's external collaborators.
 *
 * Each double answers from a table and counts its invocations so tests can
 * assert that cached or short-circuited evaluations never reach the
 * environment.
 */

#include <capprobe/prober.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace capprobe::testing {

class FakeLocator : public ExecutableLocator {
public:
    // Register `command` as installed at `path`
    FakeLocator& install(const std::string& command, const std::string& path = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        paths_[command] = path.empty() ? "/usr/bin/" + command : path;
        return *this;
    }

    std::optional<std::string> find(const std::string& command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        lookups_.push_back(command);
        auto it = paths_.find(command);
        if (it == paths_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> lookups() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookups_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> paths_;
    std::vector<std::string> lookups_;
    int calls_ = 0;
};

class FakeResolver : public FileResolver {
public:
    // Register `filename` as resolvable to `path`
    FakeResolver& provide(const std::string& filename, const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[filename] = path;
        return *this;
    }

    Result<std::string> resolve(const std::string& tool, const std::string& filename) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        requests_.push_back(filename);
        auto it = files_.find(filename);
        if (it == files_.end()) {
            return Result<std::string>::err(
                Error(ErrorCode::NOT_PRESENT, not_found_by_reason(filename, tool)));
        }
        return Result<std::string>::ok(it->second);
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::vector<std::string> requests_;
    int calls_ = 0;
};

class FakeRunner : public exec::ProcessRunner {
public:
    explicit FakeRunner(exec::ExecResult canned = exited(0)) : canned_(std::move(canned)) {}

    static exec::ExecResult exited(int code) {
        exec::ExecResult r;
        r.ok = true;
        r.exited = true;
        r.exit_code = code;
        return r;
    }

    static exec::ExecResult signaled(int sig) {
        exec::ExecResult r;
        r.ok = true;
        r.term_signal = sig;
        r.exit_code = 128 + sig;
        return r;
    }

    exec::ExecResult run(const exec::ExecRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        requests_.push_back(request);
        // Capture what the check wrote before the scratch directory disappears
        if (!request.argv.empty() && !request.cwd.empty()) {
            auto input = std::filesystem::path(request.cwd) / request.argv.back();
            input_existed_ = std::filesystem::exists(input);
        }
        return canned_;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    exec::ExecRequest last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.back();
    }

    bool input_existed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return input_existed_;
    }

private:
    mutable std::mutex mutex_;
    exec::ExecResult canned_;
    std::vector<exec::ExecRequest> requests_;
    bool input_existed_ = false;
    int calls_ = 0;
};

// A Prober wired to fresh doubles and a private cache
struct ProberFixture {
    std::shared_ptr<FakeLocator> locator = std::make_shared<FakeLocator>();
    std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>();
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    std::shared_ptr<ProbeCache> cache = std::make_shared<ProbeCache>();

    std::unique_ptr<Prober> make(ProbeConfig config = get_default_config()) {
        return std::make_unique<Prober>(std::move(config),
                                        ProberCollaborators{locator, resolver, runner, cache});
    }
};

} // namespace capprobe::testing
