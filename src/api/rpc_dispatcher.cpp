#include "api/rpc_dispatcher.hpp"

#include <cstdint>
#include <optional>
#include <vector>

#include "api/json_codec.hpp"
#include "content/content_codec.hpp"
#include "utils/logging.hpp"

namespace codebox::api {
namespace {

constexpr const char* kTag = "rpc";

nlohmann::json Reply(nlohmann::json value) {
    return {{"ok", true}, {"value", std::move(value)}};
}

nlohmann::json Failure(const exec::Error& error) {
    return {{"ok", false}, {"error", ToJson(error)}};
}

template <typename T>
nlohmann::json Reply(const exec::Result<T>& result) {
    if (!result.Ok()) {
        return Failure(result.GetError());
    }
    return Reply(nlohmann::json(result.Value()));
}

nlohmann::json Reply(const exec::Result<exec::ExecResult>& result) {
    if (!result.Ok()) {
        return Failure(result.GetError());
    }
    return Reply(ToJson(result.Value()));
}

nlohmann::json Reply(const exec::Result<void>& result) {
    if (!result.Ok()) {
        return Failure(result.GetError());
    }
    return Reply(nlohmann::json(nullptr));
}

std::string RequireString(const nlohmann::json& request, const char* key) {
    if (!request.contains(key) || !request[key].is_string()) {
        throw exec::ExecError::Internal(std::string("missing string '") + key + "'");
    }
    return request[key].get<std::string>();
}

// nullopt for a number no live session can carry (negative or fractional).
std::optional<session::SessionHandle> HandleFrom(const nlohmann::json& request) {
    if (!request.contains("session") || !request["session"].is_number()) {
        throw exec::ExecError::Internal("missing session handle");
    }
    const auto& value = request["session"];
    if (value.is_number_unsigned()) {
        return value.get<session::SessionHandle>();
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<session::SessionHandle>(value.get<std::int64_t>());
    }
    return std::nullopt;
}

session::SessionHandle RequireHandle(const nlohmann::json& request) {
    const auto handle = HandleFrom(request);
    if (!handle.has_value()) {
        throw exec::ExecError::Internal("Session not found");
    }
    return *handle;
}

std::vector<std::string> ArgsFrom(const nlohmann::json& request) {
    std::vector<std::string> args;
    if (!request.contains("args")) {
        return args;
    }
    for (const auto& item : request["args"]) {
        if (!item.is_string()) {
            throw exec::ExecError::Internal("args must be strings");
        }
        args.push_back(item.get<std::string>());
    }
    return args;
}

// Accepts {"K": "V"} or [["K", "V"], ...].
exec::EnvVars EnvFrom(const nlohmann::json& request) {
    exec::EnvVars env;
    if (!request.contains("env")) {
        return env;
    }
    const auto& source = request["env"];
    if (source.is_object()) {
        for (const auto& item : source.items()) {
            if (!item.value().is_string()) {
                throw exec::ExecError::Internal("env values must be strings");
            }
            env.emplace_back(item.key(), item.value().get<std::string>());
        }
        return env;
    }
    for (const auto& pair : source) {
        if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string() || !pair[1].is_string()) {
            throw exec::ExecError::Internal("env entries must be [name, value] pairs");
        }
        env.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
    }
    return env;
}

std::optional<std::string> StdinFrom(const nlohmann::json& request) {
    if (!request.contains("stdin") || request["stdin"].is_null()) {
        return std::nullopt;
    }
    if (!request["stdin"].is_string()) {
        throw exec::ExecError::Internal("stdin must be a string");
    }
    return request["stdin"].get<std::string>();
}

std::optional<exec::Limits> LimitsFrom(const nlohmann::json& request) {
    if (!request.contains("limits")) {
        return std::nullopt;
    }
    return LimitsFromJson(request["limits"]);
}

}  // namespace

RpcDispatcher::RpcDispatcher(ExecService& service)
    : service_(service) {}

nlohmann::json RpcDispatcher::Dispatch(const nlohmann::json& request) {
    try {
        if (!request.is_object()) {
            throw exec::ExecError::Internal("request must be an object");
        }
        const auto op = RequireString(request, "op");
        if (op == "executor.run") {
            std::vector<exec::File> files;
            if (request.contains("files")) {
                for (const auto& item : request["files"]) {
                    files.push_back(FileFromJson(item));
                }
            }
            return Reply(service_.Run(LanguageFromJson(request.value("language", nlohmann::json())),
                                      files,
                                      StdinFrom(request),
                                      ArgsFrom(request),
                                      EnvFrom(request),
                                      LimitsFrom(request)));
        }
        if (op == "session.create") {
            return Reply(service_.CreateSession(
                LanguageFromJson(request.value("language", nlohmann::json()))));
        }
        if (op == "session.close") {
            if (const auto handle = HandleFrom(request)) {
                service_.CloseSession(*handle);
            }
            return Reply(nlohmann::json(nullptr));
        }
        const auto handle = RequireHandle(request);
        if (op == "session.upload") {
            return Reply(service_.Upload(handle, FileFromJson(request.value("file", nlohmann::json()))));
        }
        if (op == "session.run") {
            return Reply(service_.RunSession(handle,
                                             RequireString(request, "entrypoint"),
                                             ArgsFrom(request),
                                             StdinFrom(request),
                                             EnvFrom(request),
                                             LimitsFrom(request)));
        }
        if (op == "session.download") {
            const auto result = service_.Download(handle, RequireString(request, "path"));
            if (!result.Ok()) {
                return Failure(result.GetError());
            }
            return Reply(nlohmann::json{
                {"encoding", "base64"},
                {"content", content::EncodeBase64(result.Value())}
            });
        }
        if (op == "session.list_files") {
            return Reply(service_.ListFiles(handle, request.value("dir", std::string())));
        }
        if (op == "session.set_working_dir") {
            return Reply(service_.SetWorkingDir(handle, RequireString(request, "path")));
        }
        throw exec::ExecError::Internal("unknown op '" + op + "'");
    } catch (const exec::ExecError& ex) {
        return Failure(exec::ToBoundaryError(ex));
    } catch (const nlohmann::json::exception& ex) {
        return Failure(exec::InternalError(std::string("malformed request: ") + ex.what()));
    }
}

std::string RpcDispatcher::DispatchLine(const std::string& line) {
    auto request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        utils::Log(utils::LogLevel::kWarn, kTag, "rejecting unparsable request line");
        return Failure(exec::InternalError("malformed request: not JSON")).dump();
    }
    return Dispatch(request).dump();
}

}  // namespace codebox::api
