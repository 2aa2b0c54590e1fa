#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace pith::config {

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& section) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, section))
        throw YAML::Exception(node.Mark(), fmt::format("invalid '{}' section", key));
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());
    if (!root || root.IsNull()) return cfg;

    decodeSection(root, "logging", cfg.logging);
    decodeSection(root, "watch", cfg.watch);

    return cfg;
}

std::string dumpConfig(const Config& config) {
    YAML::Node root;
    root["logging"] = config.logging;
    root["watch"] = config.watch;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
