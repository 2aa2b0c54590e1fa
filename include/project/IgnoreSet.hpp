#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace pith::project {

class IgnoreSet {
public:
    static const std::set<std::string>& defaults();

    IgnoreSet();

    // Returns false when the pattern was already registered.
    bool add(const std::string& pattern);

    // Patterns without '/' match any single component of the path; patterns
    // with '/' match the whole path, or one of its leading directories.
    [[nodiscard]] bool matches(const std::filesystem::path& relPath) const;

    [[nodiscard]] bool contains(const std::string& pattern) const { return patterns_.contains(pattern); }
    [[nodiscard]] const std::set<std::string>& patterns() const { return patterns_; }
    [[nodiscard]] std::size_t size() const { return patterns_.size(); }

private:
    std::set<std::string> patterns_;
};

}
