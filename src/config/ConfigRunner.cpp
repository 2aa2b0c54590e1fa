#include "config/ConfigRunner.hpp"
#include "config/Api.hpp"
#include "project/Project.hpp"
#include "project/errors.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace pith::config;
using namespace pith::project;

namespace fs = std::filesystem;

namespace {

std::string scalarKey(const YAML::Node& key) {
    if (!key.IsScalar()) throw ConfigurationError(fmt::format("{} has a non-scalar key", ConfigRunner::CONTROL_FILE));
    return key.Scalar();
}

}

void ConfigRunner::run() const {
    Api api(project_);

    if (const auto file = project_.sourceRoot() / CONTROL_FILE; fs::is_regular_file(file)) {
        YAML::Node document;
        try {
            document = YAML::LoadFile(file.string());
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(fmt::format("{}: {}", file.string(), e.what()));
        }

        project_.logger()->debug("[ConfigRunner] Applying {}", file.string());
        apply(document, api);
    }

    for (const auto& hook : hooks_) {
        try {
            hook(api);
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConfigurationError(fmt::format("Configure hook failed: {}", e.what()));
        }
    }
}

void ConfigRunner::addHook(Hook hook) {
    if (!hook) throw std::invalid_argument("Configure hook has no callable");
    hooks_.push_back(std::move(hook));
}

void ConfigRunner::apply(const YAML::Node& document, Api& api) {
    if (!document || document.IsNull()) return;
    if (!document.IsMap()) throw ConfigurationError(fmt::format("{} must be a mapping", CONTROL_FILE));

    for (const auto& kv : document) {
        const auto key = scalarKey(kv.first);
        const auto& value = kv.second;

        if (key == "ignore") api.set("ignore", value);
        else if (key == "attributes") api.apply(value);
        else if (key == "helpers") {
            if (value.IsNull()) continue;
            if (!value.IsMap()) throw ConfigurationError("'helpers' must map names to text");
            for (const auto& helper : value) {
                const auto name = scalarKey(helper.first);
                if (!helper.second.IsScalar())
                    throw ConfigurationError(fmt::format("Helper '{}' must be defined as text", name));
                api.helper(name, textHelper(helper.second.Scalar()));
            }
        } else throw ConfigurationError(fmt::format("Unknown key '{}' in {}", key, CONTROL_FILE));
    }
}
