#include "project/IgnoreSet.hpp"

#include <fnmatch.h>
#include <stdexcept>

using namespace pith::project;

namespace fs = std::filesystem;

const std::set<std::string>& IgnoreSet::defaults() {
    static const std::set<std::string> patterns = {
        "_*", ".git", ".gitignore", ".svn", ".sass-cache", "*~", "*.sw[op]"
    };
    return patterns;
}

IgnoreSet::IgnoreSet() : patterns_(defaults()) {}

bool IgnoreSet::add(const std::string& pattern) {
    if (pattern.empty()) throw std::invalid_argument("Ignore pattern must not be empty");
    return patterns_.insert(pattern).second;
}

bool IgnoreSet::matches(const fs::path& relPath) const {
    const auto rel = relPath.lexically_normal();
    if (rel.empty()) return false;

    for (const auto& pattern : patterns_) {
        const bool anchored = pattern.find('/') != std::string::npos;
        fs::path prefix;

        for (const auto& component : rel) {
            if (component.empty()) continue;

            if (!anchored) {
                if (::fnmatch(pattern.c_str(), component.c_str(), 0) == 0) return true;
                continue;
            }

            prefix /= component;
            if (::fnmatch(pattern.c_str(), prefix.generic_string().c_str(), FNM_PATHNAME) == 0) return true;
        }
    }

    return false;
}
