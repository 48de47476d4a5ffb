#pragma once

#include <optional>
#include <string>
#include <vector>

#include "exec/exec_types.hpp"

namespace codebox::exec {

struct LanguageProfile {
    LanguageKind kind = LanguageKind::kUnknown;
    std::string extension;
    // Tried in order until one spawns.
    std::vector<std::string> interpreters;
};

std::optional<LanguageProfile> BuiltinProfile(LanguageKind kind);

// main.<ext> or index.<ext>
bool IsConventionalEntrypoint(const LanguageProfile& profile, const std::string& name);

}  // namespace codebox::exec
