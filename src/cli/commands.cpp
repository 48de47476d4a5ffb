#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "api/exec_service.hpp"
#include "api/json_codec.hpp"
#include "api/rpc_dispatcher.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace {

constexpr const char* kVersion = "0.3.0";

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  codebox run [--time-ms N] [--stdin PATH] [--env K=V]... [--encoding E] FILE... [-- ARGS...]\n"
              << "  codebox serve     read JSON requests from stdin, one per line\n"
              << "  codebox version\n";
}

std::optional<std::string> ReadWholeFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

int Fail(const codebox::exec::Error& error) {
    std::cout << codebox::api::ToJson(error).dump(2) << std::endl;
    return 1;
}

int RunFiles(codebox::api::ExecService& service, int argc, char** argv) {
    std::vector<codebox::exec::File> files;
    std::vector<std::string> args;
    codebox::exec::EnvVars env;
    std::optional<std::string> stdin_data;
    std::optional<codebox::exec::Limits> limits;
    std::optional<codebox::exec::Encoding> encoding;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--") {
            for (++i; i < argc; ++i) {
                args.emplace_back(argv[i]);
            }
            break;
        }
        if (arg == "--time-ms" && has_value) {
            codebox::exec::Limits parsed{};
            try {
                parsed.time_ms = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                return Fail(codebox::exec::InternalError("--time-ms expects an integer"));
            }
            limits = parsed;
        } else if (arg == "--stdin" && has_value) {
            stdin_data = ReadWholeFile(argv[++i]);
            if (!stdin_data.has_value()) {
                return Fail(codebox::exec::IoError(std::string("cannot read ") + argv[i]));
            }
        } else if (arg == "--env" && has_value) {
            const std::string pair = argv[++i];
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                return Fail(codebox::exec::InternalError("--env expects NAME=VALUE"));
            }
            env.emplace_back(pair.substr(0, eq), pair.substr(eq + 1));
        } else if (arg == "--encoding" && has_value) {
            encoding = codebox::exec::ParseEncoding(argv[++i]);
            if (!encoding.has_value()) {
                return Fail(codebox::exec::InternalError(std::string("unknown encoding ") + argv[i]));
            }
        } else {
            auto content = ReadWholeFile(arg);
            if (!content.has_value()) {
                return Fail(codebox::exec::IoError("cannot read " + arg));
            }
            codebox::exec::File file{};
            file.name = std::filesystem::path(arg).filename().string();
            file.content = std::move(*content);
            file.encoding = encoding;
            files.push_back(std::move(file));
        }
    }

    codebox::exec::Language language{};
    language.kind = service.Profile().kind;
    const auto result = service.Run(language, files, stdin_data, args, env, limits);
    if (!result.Ok()) {
        return Fail(result.GetError());
    }
    std::cout << codebox::api::ToJson(result.Value()).dump(2) << std::endl;
    return 0;
}

int Serve(codebox::api::ExecService& service) {
    codebox::api::RpcDispatcher dispatcher(service);
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        std::cout << dispatcher.DispatchLine(line) << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "help" || std::string(argv[1]) == "--help") {
        PrintUsage();
        return argc < 2 ? 1 : 0;
    }
    const std::string command = argv[1];
    if (command == "version") {
        std::cout << "codebox " << kVersion << std::endl;
        return 0;
    }
    if (command != "run" && command != "serve") {
        PrintUsage();
        return 1;
    }

    const auto config = codebox::config::LoadConfig();
    codebox::utils::ApplyLogConfig(config.log);

    std::unique_ptr<codebox::api::ExecService> service;
    try {
        service = codebox::api::ExecService::FromConfig(config.engine);
    } catch (const codebox::exec::ExecError& ex) {
        codebox::utils::Log(codebox::utils::LogLevel::kError, "config", ex.what());
        return Fail(codebox::exec::ToBoundaryError(ex));
    }

    if (command == "serve") {
        return Serve(*service);
    }
    return RunFiles(*service, argc, argv);
}
