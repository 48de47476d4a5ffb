#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "exec/exec_error.hpp"
#include "exec/exec_types.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "session/session_manager.hpp"

namespace codebox::api {

// The host-facing operation set. Every call returns a Result; no
// exception escapes.
class ExecService {
public:
    ExecService(exec::LanguageProfile profile, sandbox::ExecutorOptions options = {});

    // Throws exec::ExecError (kUnsupportedLanguage) when config names a
    // language without a profile.
    static std::unique_ptr<ExecService> FromConfig(const config::EngineConfig& config);

    const exec::LanguageProfile& Profile() const { return executor_.Profile(); }

    // Stateless run. Picks main.<ext> or index.<ext>, else the first file.
    exec::Result<exec::ExecResult> Run(const exec::Language& language,
                                       const std::vector<exec::File>& files,
                                       const std::optional<std::string>& stdin_data,
                                       const std::vector<std::string>& args,
                                       const exec::EnvVars& env,
                                       const std::optional<exec::Limits>& limits);

    exec::Result<session::SessionHandle> CreateSession(const exec::Language& language);
    exec::Result<void> Upload(session::SessionHandle handle, const exec::File& file);
    exec::Result<exec::ExecResult> RunSession(session::SessionHandle handle,
                                              const std::string& entrypoint,
                                              const std::vector<std::string>& args,
                                              const std::optional<std::string>& stdin_data,
                                              const exec::EnvVars& env,
                                              const std::optional<exec::Limits>& limits);
    exec::Result<exec::Bytes> Download(session::SessionHandle handle, const std::string& path);
    exec::Result<std::vector<std::string>> ListFiles(session::SessionHandle handle,
                                                     const std::string& dir);
    exec::Result<void> SetWorkingDir(session::SessionHandle handle, const std::string& path);
    void CloseSession(session::SessionHandle handle);

private:
    sandbox::SandboxExecutor executor_;
    session::SessionManager sessions_;
};

}  // namespace codebox::api
