#include "api/exec_service.hpp"

#include <filesystem>
#include <type_traits>

#include "content/content_codec.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/utf8.hpp"

namespace codebox::api {
namespace {

template <typename T, typename Fn>
exec::Result<T> Guarded(Fn&& fn) {
    try {
        if constexpr (std::is_void_v<T>) {
            fn();
            return exec::Result<void>();
        } else {
            return exec::Result<T>(fn());
        }
    } catch (const exec::ExecError& ex) {
        return exec::ToBoundaryError(ex);
    } catch (const std::filesystem::filesystem_error& ex) {
        return exec::IoError(ex.what());
    } catch (const std::exception& ex) {
        return exec::InternalError(ex.what());
    }
}

const exec::File* SelectEntrypoint(const exec::LanguageProfile& profile,
                                   const std::vector<exec::File>& files) {
    for (const auto& file : files) {
        if (exec::IsConventionalEntrypoint(profile, file.name)) {
            return &file;
        }
    }
    return files.empty() ? nullptr : &files.front();
}

}  // namespace

ExecService::ExecService(exec::LanguageProfile profile, sandbox::ExecutorOptions options)
    : executor_(std::move(profile), std::move(options))
    , sessions_(executor_) {}

std::unique_ptr<ExecService> ExecService::FromConfig(const config::EngineConfig& config) {
    const auto kind = exec::ParseLanguageKind(config.language);
    const auto builtin = kind.has_value() ? exec::BuiltinProfile(*kind) : std::nullopt;
    if (!builtin.has_value()) {
        throw exec::ExecError::UnsupportedLanguage(config.language);
    }
    auto profile = *builtin;
    if (!config.interpreters.empty()) {
        profile.interpreters = config.interpreters;
    }
    sandbox::ExecutorOptions options{};
    options.temp_root = config.temp_dir;
    options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    options.kill_grace = std::chrono::milliseconds(config.kill_grace_ms);
    utils::Log(utils::LogLevel::kInfo, "engine",
               std::string("serving ") + exec::ToString(profile.kind) + " via " +
               utils::Join(profile.interpreters, ", "));
    return std::make_unique<ExecService>(std::move(profile), std::move(options));
}

exec::Result<exec::ExecResult> ExecService::Run(const exec::Language& language,
                                                const std::vector<exec::File>& files,
                                                const std::optional<std::string>& stdin_data,
                                                const std::vector<std::string>& args,
                                                const exec::EnvVars& env,
                                                const std::optional<exec::Limits>& limits) {
    return Guarded<exec::ExecResult>([&] {
        const auto kind_name = std::string(exec::ToString(Profile().kind));
        if (language.kind != Profile().kind) {
            throw exec::ExecError::UnsupportedLanguage(exec::ToString(language.kind));
        }
        const auto* entry = SelectEntrypoint(Profile(), files);
        if (entry == nullptr) {
            throw exec::ExecError::Internal("No " + kind_name + " files provided");
        }
        const auto code = content::Decode(*entry);
        if (!utils::IsValidUtf8(code)) {
            throw exec::ExecError::Internal("Invalid UTF-8 in " + kind_name + " code");
        }
        return executor_.Execute(code, args, env, stdin_data, limits);
    });
}

exec::Result<session::SessionHandle> ExecService::CreateSession(const exec::Language& language) {
    return Guarded<session::SessionHandle>([&] { return sessions_.Create(language); });
}

exec::Result<void> ExecService::Upload(session::SessionHandle handle, const exec::File& file) {
    return Guarded<void>([&] { sessions_.Upload(handle, file); });
}

exec::Result<exec::ExecResult> ExecService::RunSession(session::SessionHandle handle,
                                                       const std::string& entrypoint,
                                                       const std::vector<std::string>& args,
                                                       const std::optional<std::string>& stdin_data,
                                                       const exec::EnvVars& env,
                                                       const std::optional<exec::Limits>& limits) {
    return Guarded<exec::ExecResult>([&] {
        return sessions_.Run(handle, entrypoint, args, stdin_data, env, limits);
    });
}

exec::Result<exec::Bytes> ExecService::Download(session::SessionHandle handle, const std::string& path) {
    return Guarded<exec::Bytes>([&] { return sessions_.Download(handle, path); });
}

exec::Result<std::vector<std::string>> ExecService::ListFiles(session::SessionHandle handle,
                                                              const std::string& dir) {
    return Guarded<std::vector<std::string>>([&] { return sessions_.ListFiles(handle, dir); });
}

exec::Result<void> ExecService::SetWorkingDir(session::SessionHandle handle, const std::string& path) {
    return Guarded<void>([&] { sessions_.SetWorkingDir(handle, path); });
}

void ExecService::CloseSession(session::SessionHandle handle) {
    sessions_.Close(handle);
}

}  // namespace codebox::api
