#include "config/Api.hpp"
#include "project/Project.hpp"
#include "project/errors.hpp"

#include <fmt/args.h>
#include <fmt/format.h>
#include <functional>
#include <unordered_map>

using namespace pith::config;
using namespace pith::project;

namespace {

using Setter = std::function<void(Project&, const std::string&, const YAML::Node&)>;

bool asBool(const std::string& key, const YAML::Node& value) {
    if (!value.IsScalar()) throw ConfigurationError(fmt::format("Attribute '{}' expects a boolean", key));
    try {
        return value.as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError(fmt::format("Attribute '{}' expects a boolean, got '{}'", key, value.Scalar()));
    }
}

void addIgnores(Project& project, const std::string& key, const YAML::Node& value) {
    if (value.IsScalar()) {
        Api(project).ignore(value.Scalar());
        return;
    }
    if (!value.IsSequence())
        throw ConfigurationError(fmt::format("Attribute '{}' expects a pattern or a list of patterns", key));

    for (const auto& item : value) {
        if (!item.IsScalar()) throw ConfigurationError(fmt::format("Attribute '{}' contains a non-string pattern", key));
        Api(project).ignore(item.Scalar());
    }
}

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"ignore", addIgnores},
        {"assume_content_negotiation", [](Project& p, const std::string& k, const YAML::Node& v) {
            p.setAssumeContentNegotiation(asBool(k, v));
        }},
        {"assume_directory_index", [](Project& p, const std::string& k, const YAML::Node& v) {
            p.setAssumeDirectoryIndex(asBool(k, v));
        }},
    };
    return table;
}

}

Api& Api::ignore(const std::string& pattern) {
    try {
        project_.ignore(pattern);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }
    return *this;
}

Api& Api::helper(const std::string& name, project::Helper helper) {
    try {
        project_.helpers()->define(name, std::move(helper));
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }
    return *this;
}

Api& Api::set(const std::string& key, const YAML::Node& value) {
    const auto it = setters().find(key);
    if (it == setters().end()) throw ConfigurationError(fmt::format("Unknown project attribute '{}'", key));
    it->second(project_, key, value);
    return *this;
}

Api& Api::apply(const YAML::Node& attributes) {
    if (!attributes || attributes.IsNull()) return *this;
    if (!attributes.IsMap()) throw ConfigurationError("Project attributes must be a mapping");

    for (const auto& kv : attributes) {
        if (!kv.first.IsScalar()) throw ConfigurationError("Project attribute names must be scalars");
        set(kv.first.Scalar(), kv.second);
    }
    return *this;
}

bool Api::recognizes(const std::string& key) { return setters().contains(key); }

pith::project::Helper pith::config::textHelper(std::string text) {
    return [text = std::move(text)](const HelperCall& call) {
        fmt::dynamic_format_arg_store<fmt::format_context> args;
        for (const auto& arg : call.args) args.push_back(arg);
        return fmt::vformat(text, args);
    };
}
