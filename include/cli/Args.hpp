#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace pith::cli {

struct Args {
    std::string command;
    std::filesystem::path source;
    std::optional<std::filesystem::path> output, config;
    std::optional<std::chrono::seconds> interval;
    bool json = false;
    bool help = false;
    YAML::Node attributes{YAML::NodeType::Map};  // construction attributes from --set/--ignore
};

// argv without the program name. Throws std::invalid_argument on bad usage.
Args parseArgs(const std::vector<std::string>& argv);

std::string usage();

}
