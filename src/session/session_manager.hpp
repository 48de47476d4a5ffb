#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "exec/exec_types.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace codebox::session {

using SessionHandle = std::uint64_t;

// Private file namespace of one session. Guarded by its own mutex so that
// distinct sessions never contend.
class Session {
public:
    explicit Session(exec::Language language);

    const exec::Language& Lang() const { return language_; }

    void PutFile(const std::string& name, exec::Bytes content);
    std::optional<exec::Bytes> GetFile(const std::string& name) const;
    std::vector<std::string> FileNames() const;

    void SetWorkingDir(std::string path);
    std::string WorkingDir() const;

private:
    exec::Language language_;
    std::unordered_map<std::string, exec::Bytes> files_;
    std::string working_dir_ = "/";
    mutable std::mutex mutex_;
};

// Process-wide table of live sessions. Handles start at 1 and are never
// reused, including after Close. All operations except Close throw
// exec::ExecError (kInternal) for an unknown handle.
class SessionManager {
public:
    // first_handle exists so exhaustion can be exercised; callers use the default.
    explicit SessionManager(const sandbox::SandboxExecutor& executor, SessionHandle first_handle = 1);

    SessionHandle Create(const exec::Language& language);
    void Upload(SessionHandle handle, const exec::File& file);
    exec::ExecResult Run(SessionHandle handle,
                         const std::string& entrypoint,
                         const std::vector<std::string>& args,
                         const std::optional<std::string>& stdin_data,
                         const exec::EnvVars& env,
                         const std::optional<exec::Limits>& limits);
    exec::Bytes Download(SessionHandle handle, const std::string& path);
    // dir is accepted for interface compatibility; the namespace is flat.
    std::vector<std::string> ListFiles(SessionHandle handle, const std::string& dir);
    void SetWorkingDir(SessionHandle handle, const std::string& path);
    std::string WorkingDir(SessionHandle handle);
    void Close(SessionHandle handle);

    std::size_t LiveCount() const;

private:
    std::shared_ptr<Session> Find(SessionHandle handle) const;

    const sandbox::SandboxExecutor& executor_;
    std::unordered_map<SessionHandle, std::shared_ptr<Session>> sessions_;
    SessionHandle next_handle_ = 1;
    mutable std::mutex mutex_;
};

}  // namespace codebox::session
