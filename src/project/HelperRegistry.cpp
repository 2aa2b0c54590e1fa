#include "project/HelperRegistry.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace pith::project;

void HelperRegistry::define(const std::string& name, Helper helper) {
    if (name.empty() || std::ranges::any_of(name, [](const unsigned char c) { return std::isspace(c); }))
        throw std::invalid_argument(fmt::format("Invalid helper name: '{}'", name));
    if (!helper) throw std::invalid_argument(fmt::format("Helper '{}' has no callable", name));

    helpers_.insert_or_assign(name, std::move(helper));
}

bool HelperRegistry::remove(const std::string& name) { return helpers_.erase(name) > 0; }

const Helper* HelperRegistry::find(const std::string& name) const {
    const auto it = helpers_.find(name);
    return it == helpers_.end() ? nullptr : &it->second;
}

std::string HelperRegistry::call(const std::string& name, const HelperCall& call) const {
    const auto* helper = find(name);
    if (!helper) throw std::runtime_error(fmt::format("Unknown helper '{}'", name));
    return (*helper)(call);
}

std::vector<std::string> HelperRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(helpers_.size());
    for (const auto& [name, _] : helpers_) out.push_back(name);
    std::ranges::sort(out);
    return out;
}
