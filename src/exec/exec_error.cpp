#include "exec/exec_error.hpp"

#include <sstream>

namespace codebox::exec {
namespace {

StageResult FailedStage(const std::string& message) {
    StageResult stage{};
    stage.stderr_text = message;
    stage.exit_code = 1;
    return stage;
}

}  // namespace

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kUnsupportedLanguage: return "unsupported-language";
        case ErrorKind::kCompilationFailed: return "compilation-failed";
        case ErrorKind::kRuntimeFailed: return "runtime-failed";
        case ErrorKind::kTimeout: return "timeout";
        case ErrorKind::kResourceExceeded: return "resource-exceeded";
        case ErrorKind::kInternal: return "internal";
    }
    return "internal";
}

Error ToBoundaryError(const ExecError& error) {
    Error result{};
    result.kind = error.Kind();
    switch (error.Kind()) {
        case ErrorKind::kCompilationFailed:
        case ErrorKind::kRuntimeFailed:
            result.stage = FailedStage(error.what());
            break;
        case ErrorKind::kInternal:
            result.message = error.what();
            break;
        case ErrorKind::kUnsupportedLanguage:
        case ErrorKind::kTimeout:
        case ErrorKind::kResourceExceeded:
            break;
    }
    return result;
}

Error IoError(const std::string& detail) {
    return InternalError("IO error: " + detail);
}

Error InternalError(const std::string& message) {
    Error result{};
    result.kind = ErrorKind::kInternal;
    result.message = message;
    return result;
}

std::string Describe(const Error& error) {
    std::ostringstream oss;
    oss << ToString(error.kind);
    if (!error.message.empty()) {
        oss << ": " << error.message;
    }
    if (error.stage.has_value() && !error.stage->stderr_text.empty()) {
        oss << ": " << error.stage->stderr_text;
    }
    return oss.str();
}

}  // namespace codebox::exec
