#pragma once

#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace codebox::config {

struct EngineConfig {
    std::string language = "javascript";
    // Empty keeps the built-in candidates of the language.
    std::vector<std::string> interpreters;
    std::string temp_dir;
    int poll_interval_ms = 10;
    int kill_grace_ms = 500;
};

struct Config {
    EngineConfig engine;
    utils::LogConfig log;
};

}  // namespace codebox::config
