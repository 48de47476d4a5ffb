#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "exec/exec_types.hpp"
#include "exec/language_profile.hpp"

namespace codebox::sandbox {

struct ExecutorOptions {
    // Parent of the per-invocation scratch directories; empty means the
    // system temp directory.
    std::filesystem::path temp_root;
    std::chrono::milliseconds poll_interval{10};
    // Time between SIGTERM and SIGKILL once a deadline has passed.
    std::chrono::milliseconds kill_grace{500};
};

// Runs one source unit under the profile's interpreter. Every call gets a
// private scratch directory that is removed before the call returns.
// Throws exec::ExecError: kTimeout when limits.time_ms elapses (the child
// is killed and reaped first), kInternal for artifact or launch failures.
// A non-zero exit is reported in the result, not thrown.
class SandboxExecutor {
public:
    SandboxExecutor(exec::LanguageProfile profile, ExecutorOptions options = {});

    const exec::LanguageProfile& Profile() const { return profile_; }
    const ExecutorOptions& Options() const { return options_; }

    exec::ExecResult Execute(const std::string& source,
                             const std::vector<std::string>& args,
                             const exec::EnvVars& env,
                             const std::optional<std::string>& stdin_data,
                             const std::optional<exec::Limits>& limits) const;

private:
    exec::LanguageProfile profile_;
    ExecutorOptions options_;
};

}  // namespace codebox::sandbox
