#include "exec/exec_types.hpp"

#include <algorithm>
#include <cctype>

namespace codebox::exec {
namespace {

std::string Lowered(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

}  // namespace

const char* ToString(LanguageKind kind) {
    switch (kind) {
        case LanguageKind::kJavascript: return "javascript";
        case LanguageKind::kPython: return "python";
        case LanguageKind::kUnknown: return "unknown";
    }
    return "unknown";
}

std::optional<LanguageKind> ParseLanguageKind(const std::string& name) {
    const auto lowered = Lowered(name);
    if (lowered == "javascript" || lowered == "js" || lowered == "node") {
        return LanguageKind::kJavascript;
    }
    if (lowered == "python" || lowered == "py") {
        return LanguageKind::kPython;
    }
    return std::nullopt;
}

const char* ToString(Encoding encoding) {
    switch (encoding) {
        case Encoding::kUtf8: return "utf8";
        case Encoding::kBase64: return "base64";
        case Encoding::kHex: return "hex";
    }
    return "utf8";
}

std::optional<Encoding> ParseEncoding(const std::string& name) {
    const auto lowered = Lowered(name);
    if (lowered == "utf8" || lowered == "utf-8") {
        return Encoding::kUtf8;
    }
    if (lowered == "base64") {
        return Encoding::kBase64;
    }
    if (lowered == "hex") {
        return Encoding::kHex;
    }
    return std::nullopt;
}

}  // namespace codebox::exec
