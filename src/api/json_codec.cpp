#include "api/json_codec.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace codebox::api {
namespace {

template <typename T>
nlohmann::json OptionalJson(const std::optional<T>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Non-negative integer that fits T, or nullopt.
template <typename T>
std::optional<T> FittingUnsigned(const nlohmann::json& value) {
    std::uint64_t wide = 0;
    if (value.is_number_unsigned()) {
        wide = value.get<std::uint64_t>();
    } else if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        wide = static_cast<std::uint64_t>(value.get<std::int64_t>());
    } else {
        return std::nullopt;
    }
    if (wide > std::numeric_limits<T>::max()) {
        return std::nullopt;
    }
    return static_cast<T>(wide);
}

// Unenforced limits never fail a request; unusable values are dropped.
template <typename T>
std::optional<T> LenientLimit(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) {
        return std::nullopt;
    }
    return FittingUnsigned<T>(json[key]);
}

}  // namespace

nlohmann::json ToJson(const exec::StageResult& stage) {
    return {
        {"stdout", stage.stdout_text},
        {"stderr", stage.stderr_text},
        {"exit_code", OptionalJson(stage.exit_code)},
        {"signal", OptionalJson(stage.signal)}
    };
}

nlohmann::json ToJson(const exec::ExecResult& result) {
    return {
        {"compile", result.compile.has_value() ? ToJson(*result.compile) : nlohmann::json(nullptr)},
        {"run", ToJson(result.run)},
        {"time_ms", OptionalJson(result.time_ms)},
        {"memory_bytes", OptionalJson(result.memory_bytes)}
    };
}

nlohmann::json ToJson(const exec::Error& error) {
    nlohmann::json json = {{"kind", exec::ToString(error.kind)}};
    if (error.stage.has_value()) {
        json["stage"] = ToJson(*error.stage);
    }
    if (error.kind == exec::ErrorKind::kInternal) {
        json["message"] = error.message;
    }
    return json;
}

exec::Language LanguageFromJson(const nlohmann::json& json) {
    exec::Language language{};
    const auto& kind = json.is_object() ? json.value("kind", nlohmann::json()) : json;
    if (!kind.is_string()) {
        throw exec::ExecError::Internal("language kind must be a string");
    }
    language.kind = exec::ParseLanguageKind(kind.get<std::string>()).value_or(exec::LanguageKind::kUnknown);
    if (json.is_object() && json.contains("version") && json["version"].is_string()) {
        language.version = json["version"].get<std::string>();
    }
    return language;
}

exec::File FileFromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("name") || !json["name"].is_string()) {
        throw exec::ExecError::Internal("file requires a string 'name'");
    }
    exec::File file{};
    file.name = json["name"].get<std::string>();
    if (json.contains("content")) {
        const auto& content = json["content"];
        if (content.is_string()) {
            file.content = content.get<std::string>();
        } else if (content.is_array()) {
            for (const auto& byte : content) {
                if (!byte.is_number_unsigned() || byte.get<unsigned int>() > 0xFF) {
                    throw exec::ExecError::Internal("file content bytes must be 0..255");
                }
                file.content.push_back(static_cast<char>(byte.get<unsigned int>()));
            }
        } else {
            throw exec::ExecError::Internal("file content must be a string or a byte array");
        }
    }
    if (json.contains("encoding") && !json["encoding"].is_null()) {
        const auto& encoding = json["encoding"];
        const auto parsed = encoding.is_string()
            ? exec::ParseEncoding(encoding.get<std::string>())
            : std::nullopt;
        if (!parsed.has_value()) {
            throw exec::ExecError::Internal("unknown encoding " + encoding.dump());
        }
        file.encoding = parsed;
    }
    return file;
}

std::optional<exec::Limits> LimitsFromJson(const nlohmann::json& json) {
    if (json.is_null()) {
        return std::nullopt;
    }
    if (!json.is_object()) {
        throw exec::ExecError::Internal("limits must be an object");
    }
    exec::Limits limits{};
    if (json.contains("time_ms") && !json["time_ms"].is_null()) {
        limits.time_ms = FittingUnsigned<std::uint64_t>(json["time_ms"]);
        if (!limits.time_ms.has_value()) {
            throw exec::ExecError::Internal("limit 'time_ms' must be a non-negative integer");
        }
    }
    limits.memory_bytes = LenientLimit<std::uint64_t>(json, "memory");
    limits.file_size_bytes = LenientLimit<std::uint64_t>(json, "file_size");
    limits.max_processes = LenientLimit<std::uint32_t>(json, "max_processes");
    return limits;
}

}  // namespace codebox::api
