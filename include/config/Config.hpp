#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace pith::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum pith  = spdlog::level::info;   // CLI lifecycle
    spdlog::level::level_enum sync  = spdlog::level::info;   // Discovery and pruning
    spdlog::level::level_enum build = spdlog::level::info;   // Build summaries and artifact failures
    spdlog::level::level_enum watch = spdlog::level::info;   // Watcher ticks
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    std::filesystem::path log_dir{};  // empty: console only
};

struct WatchConfig {
    std::chrono::seconds interval{2};
};

struct Config {
    LoggingConfig logging;
    WatchConfig watch;
};

// Missing sections keep their defaults. Throws YAML::Exception on a malformed file.
Config loadConfig(const std::filesystem::path& path);

std::string dumpConfig(const Config& config);

}
