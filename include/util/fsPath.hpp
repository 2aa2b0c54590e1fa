#pragma once

#include <filesystem>

namespace fs = std::filesystem;

namespace pith::util {

inline fs::path stripTrailingSlash(const fs::path& path) {
    auto norm = path.lexically_normal();
    if (norm.has_relative_path() && !norm.has_filename()) return norm.parent_path();
    return norm;
}

// Lexical containment. A path is considered to lie under itself.
inline bool isUnder(const fs::path& path, const fs::path& root) {
    const auto p = stripTrailingSlash(path);
    const auto r = stripTrailingSlash(root);
    if (r.empty()) return false;

    auto pit = p.begin();
    for (auto rit = r.begin(); rit != r.end(); ++rit, ++pit)
        if (pit == p.end() || *pit != *rit) return false;
    return true;
}

inline bool escapesRoot(const fs::path& relPath) {
    const auto norm = relPath.lexically_normal();
    return norm.empty() || norm.is_absolute() || *norm.begin() == "..";
}

inline fs::path makeRoot(const fs::path& path) {
    return stripTrailingSlash(fs::weakly_canonical(fs::absolute(path)));
}

}
