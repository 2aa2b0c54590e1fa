#pragma once

#include "project/HelperRegistry.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

namespace pith::project {
class Project;
}

namespace pith::config {

// The only surface the control file and configure hooks can mutate a Project
// through. Every failure is reported as project::ConfigurationError.
class Api {
public:
    explicit Api(project::Project& project) : project_(project) {}

    Api& ignore(const std::string& pattern);

    Api& helper(const std::string& name, project::Helper helper);

    // Recognized keys: ignore, assume_content_negotiation, assume_directory_index.
    Api& set(const std::string& key, const YAML::Node& value);

    // Applies every key of a mapping, in document order.
    Api& apply(const YAML::Node& attributes);

    [[nodiscard]] project::Project& project() const { return project_; }

    [[nodiscard]] static bool recognizes(const std::string& key);

private:
    project::Project& project_;
};

// Helper returning fixed text; "{0}", "{1}", ... take positional arguments.
project::Helper textHelper(std::string text);

}
