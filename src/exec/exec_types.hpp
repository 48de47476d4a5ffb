#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace codebox::exec {

// Raw byte payloads travel in std::string; nothing assumes they are text.
using Bytes = std::string;

using EnvVars = std::vector<std::pair<std::string, std::string>>;

enum class LanguageKind {
    kJavascript,
    kPython,
    kUnknown
};

struct Language {
    LanguageKind kind = LanguageKind::kUnknown;
    std::optional<std::string> version;
};

enum class Encoding {
    kUtf8,
    kBase64,
    kHex
};

struct File {
    std::string name;
    Bytes content;
    std::optional<Encoding> encoding;
};

// Only time_ms is enforced; the remaining fields are accepted and carried.
struct Limits {
    std::optional<std::uint64_t> time_ms;
    std::optional<std::uint64_t> memory_bytes;
    std::optional<std::uint64_t> file_size_bytes;
    std::optional<std::uint32_t> max_processes;
};

struct StageResult {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    std::optional<int> signal;
};

struct ExecResult {
    std::optional<StageResult> compile;
    StageResult run;
    std::optional<std::uint64_t> time_ms;
    std::optional<std::uint64_t> memory_bytes;
};

const char* ToString(LanguageKind kind);
std::optional<LanguageKind> ParseLanguageKind(const std::string& name);

const char* ToString(Encoding encoding);
std::optional<Encoding> ParseEncoding(const std::string& name);

}  // namespace codebox::exec
