#include "session/session_manager.hpp"

#include <limits>

#include "content/content_codec.hpp"
#include "exec/exec_error.hpp"
#include "utils/logging.hpp"
#include "utils/utf8.hpp"

namespace codebox::session {
namespace {

constexpr const char* kTag = "session";

exec::ExecError NotFound() {
    return exec::ExecError::Internal("Session not found");
}

}  // namespace

Session::Session(exec::Language language)
    : language_(std::move(language)) {}

void Session::PutFile(const std::string& name, exec::Bytes content) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.insert_or_assign(name, std::move(content));
}

std::optional<exec::Bytes> Session::GetFile(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(name);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> Session::FileNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(files_.size());
    for (const auto& [name, content] : files_) {
        names.push_back(name);
    }
    return names;
}

void Session::SetWorkingDir(std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    working_dir_ = std::move(path);
}

std::string Session::WorkingDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return working_dir_;
}

SessionManager::SessionManager(const sandbox::SandboxExecutor& executor, SessionHandle first_handle)
    : executor_(executor)
    , next_handle_(first_handle) {}

SessionHandle SessionManager::Create(const exec::Language& language) {
    if (language.kind != executor_.Profile().kind) {
        throw exec::ExecError::UnsupportedLanguage(exec::ToString(language.kind));
    }
    auto session = std::make_shared<Session>(language);
    std::lock_guard<std::mutex> lock(mutex_);
    if (next_handle_ == std::numeric_limits<SessionHandle>::max()) {
        throw exec::ExecError::Internal("Session handles exhausted");
    }
    const auto handle = next_handle_++;
    sessions_.emplace(handle, std::move(session));
    utils::Log(utils::LogLevel::kDebug, kTag, "created session " + std::to_string(handle));
    return handle;
}

void SessionManager::Upload(SessionHandle handle, const exec::File& file) {
    auto session = Find(handle);
    session->PutFile(file.name, content::Decode(file));
}

exec::ExecResult SessionManager::Run(SessionHandle handle,
                                     const std::string& entrypoint,
                                     const std::vector<std::string>& args,
                                     const std::optional<std::string>& stdin_data,
                                     const exec::EnvVars& env,
                                     const std::optional<exec::Limits>& limits) {
    // The run works from a snapshot of the entrypoint, so a concurrent
    // Upload or Close cannot change what is executed mid-flight.
    auto session = Find(handle);
    if (session->Lang().kind != executor_.Profile().kind) {
        throw exec::ExecError::UnsupportedLanguage(exec::ToString(session->Lang().kind));
    }
    auto code = session->GetFile(entrypoint);
    if (!code.has_value()) {
        throw exec::ExecError::Internal("Entrypoint file '" + entrypoint + "' not found");
    }
    if (!utils::IsValidUtf8(*code)) {
        throw exec::ExecError::Internal(
            "Invalid UTF-8 in " + std::string(exec::ToString(executor_.Profile().kind)) + " code");
    }
    return executor_.Execute(*code, args, env, stdin_data, limits);
}

exec::Bytes SessionManager::Download(SessionHandle handle, const std::string& path) {
    auto content = Find(handle)->GetFile(path);
    if (!content.has_value()) {
        throw exec::ExecError::Internal("File '" + path + "' not found");
    }
    return std::move(*content);
}

std::vector<std::string> SessionManager::ListFiles(SessionHandle handle, const std::string&) {
    return Find(handle)->FileNames();
}

void SessionManager::SetWorkingDir(SessionHandle handle, const std::string& path) {
    Find(handle)->SetWorkingDir(path);
}

std::string SessionManager::WorkingDir(SessionHandle handle) {
    return Find(handle)->WorkingDir();
}

void SessionManager::Close(SessionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(handle) > 0) {
        utils::Log(utils::LogLevel::kDebug, kTag, "closed session " + std::to_string(handle));
    }
}

std::size_t SessionManager::LiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::shared_ptr<Session> SessionManager::Find(SessionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(handle);
    if (it == sessions_.end()) {
        throw NotFound();
    }
    return it->second;
}

}  // namespace codebox::session
