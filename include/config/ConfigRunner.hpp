#pragma once

#include <functional>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace pith::project {
class Project;
}

namespace pith::config {

class Api;

using Hook = std::function<void(Api&)>;

// Runs the project's control file, then every registered configure hook.
//
// A fault aborts the run with project::ConfigurationError. Mutations applied
// before the fault stay applied; there is no rollback. Reapplying the same
// document is harmless: ignore patterns are a set and helpers are overwritten
// in place.
class ConfigRunner {
public:
    static constexpr const auto* CONTROL_FILE = "_pith/config.yaml";

    explicit ConfigRunner(project::Project& project) : project_(project) {}

    void run() const;

    void addHook(Hook hook);

    [[nodiscard]] std::size_t hookCount() const { return hooks_.size(); }

    // Top-level keys: ignore, attributes, helpers.
    static void apply(const YAML::Node& document, Api& api);

private:
    project::Project& project_;
    std::vector<Hook> hooks_;
};

}
