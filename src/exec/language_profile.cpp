#include "exec/language_profile.hpp"

namespace codebox::exec {

std::optional<LanguageProfile> BuiltinProfile(LanguageKind kind) {
    switch (kind) {
        case LanguageKind::kJavascript:
            return LanguageProfile{kind, "js", {"node", "nodejs"}};
        case LanguageKind::kPython:
            return LanguageProfile{kind, "py", {"python3", "python"}};
        case LanguageKind::kUnknown:
            break;
    }
    return std::nullopt;
}

bool IsConventionalEntrypoint(const LanguageProfile& profile, const std::string& name) {
    return name == "main." + profile.extension || name == "index." + profile.extension;
}

}  // namespace codebox::exec
