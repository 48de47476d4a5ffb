#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::config {
namespace {

constexpr const char* kTag = "config";

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto override_path = GetEnv("CODEBOX_CONFIG");
    if (!override_path.empty()) {
        return override_path;
    }
    return GetHomePath() / ".codebox" / "config.json";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::Log(utils::LogLevel::kWarn, kTag, "ignoring non-numeric value '" + value + "'");
        return fallback;
    }
}

void ApplyLogLevel(Config& config, const std::string& value) {
    const auto level = utils::ParseLogLevel(value);
    if (!level.has_value()) {
        utils::Log(utils::LogLevel::kWarn, kTag, "unknown log level '" + value + "'");
        return;
    }
    config.log.min_level = *level;
}

void ApplyFile(Config& config, const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        utils::Log(utils::LogLevel::kWarn, kTag, "cannot open " + path.string());
        return;
    }
    try {
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::Log(utils::LogLevel::kError, kTag,
                   "keeping defaults, failed to parse " + path.string() + ": " + ex.what());
    }
}

}  // namespace

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("engine") && data["engine"].is_object()) {
        const auto& engine = data["engine"];
        if (engine.contains("language") && engine["language"].is_string()) {
            config.engine.language = engine["language"].get<std::string>();
        }
        if (engine.contains("interpreters") && engine["interpreters"].is_array()) {
            config.engine.interpreters.clear();
            for (const auto& item : engine["interpreters"]) {
                if (item.is_string()) {
                    config.engine.interpreters.push_back(item.get<std::string>());
                }
            }
        }
        if (engine.contains("tempDir") && engine["tempDir"].is_string()) {
            config.engine.temp_dir = engine["tempDir"].get<std::string>();
        }
        if (engine.contains("pollIntervalMs") && engine["pollIntervalMs"].is_number_integer()) {
            config.engine.poll_interval_ms = engine["pollIntervalMs"].get<int>();
        }
        if (engine.contains("killGraceMs") && engine["killGraceMs"].is_number_integer()) {
            config.engine.kill_grace_ms = engine["killGraceMs"].get<int>();
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            ApplyLogLevel(config, log["level"].get<std::string>());
        }
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    ApplyFile(config, path);
    return config;
}

Config LoadConfig() {
    Config config = LoadConfigFromFile(GetConfigPath());

    const auto language = GetEnvFallback("CODEBOX_ENGINE__LANGUAGE", "CODEBOX_LANGUAGE");
    if (!language.empty()) {
        config.engine.language = language;
    }

    const auto interpreters = GetEnvFallback("CODEBOX_ENGINE__INTERPRETERS", "CODEBOX_INTERPRETERS");
    if (!interpreters.empty()) {
        config.engine.interpreters = utils::SplitCsv(interpreters);
    }

    const auto temp_dir = GetEnvFallback("CODEBOX_ENGINE__TEMP_DIR", "CODEBOX_TEMP_DIR");
    if (!temp_dir.empty()) {
        config.engine.temp_dir = temp_dir;
    }

    const auto poll_interval = GetEnvFallback(
        "CODEBOX_ENGINE__POLL_INTERVAL_MS",
        "CODEBOX_POLL_INTERVAL_MS");
    if (!poll_interval.empty()) {
        config.engine.poll_interval_ms = ParseInt(poll_interval, config.engine.poll_interval_ms);
    }

    const auto kill_grace = GetEnvFallback("CODEBOX_ENGINE__KILL_GRACE_MS", "CODEBOX_KILL_GRACE_MS");
    if (!kill_grace.empty()) {
        config.engine.kill_grace_ms = ParseInt(kill_grace, config.engine.kill_grace_ms);
    }

    const auto log_level = GetEnvFallback("CODEBOX_LOG__LEVEL", "CODEBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        ApplyLogLevel(config, log_level);
    }

    return config;
}

}  // namespace codebox::config
