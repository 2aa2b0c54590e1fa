#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pith::project {

class Project;
class Artifact;

struct HelperCall {
    const Project& project;
    Artifact* artifact = nullptr;  // null when called outside a build
    std::vector<std::string> args;
};

using Helper = std::function<std::string(const HelperCall&)>;

// Named callables available to templates. A Project creates exactly one and
// never replaces it, so holders of the registry see every later definition.
class HelperRegistry {
public:
    // Overwrites any helper already registered under the name.
    void define(const std::string& name, Helper helper);

    bool remove(const std::string& name);

    [[nodiscard]] bool contains(const std::string& name) const { return helpers_.contains(name); }

    [[nodiscard]] const Helper* find(const std::string& name) const;

    // Throws std::runtime_error for an unknown name.
    std::string call(const std::string& name, const HelperCall& call) const;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const { return helpers_.size(); }

private:
    std::unordered_map<std::string, Helper> helpers_;
};

}
