#pragma once

#include <optional>

#include "exec/exec_error.hpp"
#include "exec/exec_types.hpp"
#include "nlohmann/json.hpp"

namespace codebox::api {

nlohmann::json ToJson(const exec::StageResult& stage);
nlohmann::json ToJson(const exec::ExecResult& result);
nlohmann::json ToJson(const exec::Error& error);

// Request parsing. Throws exec::ExecError (kInternal) on malformed input.
exec::Language LanguageFromJson(const nlohmann::json& json);
exec::File FileFromJson(const nlohmann::json& json);
// Unknown keys are accepted and ignored.
std::optional<exec::Limits> LimitsFromJson(const nlohmann::json& json);

}  // namespace codebox::api
