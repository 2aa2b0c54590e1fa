#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pith::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["pith"]  = to_std_string(spdlog::level::to_string_view(rhs.pith));
        node["sync"]  = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["build"] = to_std_string(spdlog::level::to_string_view(rhs.build));
        node["watch"] = to_std_string(spdlog::level::to_string_view(rhs.watch));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.pith  = spdlog::level::from_str(node["pith"].as<std::string>("info"));
        rhs.sync  = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.build = spdlog::level::from_str(node["build"].as<std::string>("info"));
        rhs.watch = spdlog::level::from_str(node["watch"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["levels"] = rhs.levels;
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        rhs.log_dir = node["log_dir"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<WatchConfig> {
    static Node encode(const WatchConfig& rhs) {
        Node node;
        node["interval_seconds"] = rhs.interval.count();
        return node;
    }

    static bool decode(const Node& node, WatchConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto seconds = node["interval_seconds"].as<long>(2);
        if (seconds <= 0) return false;
        rhs.interval = std::chrono::seconds(seconds);
        return true;
    }
};

}
