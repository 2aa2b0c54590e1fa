#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace spdlog {
class logger;
}

namespace fs = std::filesystem;

namespace pith::core {

// Enumerates regular files under a root, never descending into the excluded
// directory even when it is nested under the root.
class Scanner {
public:
    // Receives paths relative to the root. Rejecting a directory prunes it.
    using Filter = std::function<bool(const fs::path& relPath, bool isDirectory)>;

    Scanner(fs::path root, fs::path excluded, std::shared_ptr<spdlog::logger> log);

    // Relative paths, sorted.
    [[nodiscard]] std::vector<fs::path> scan(const Filter& admit = nullptr) const;

private:
    fs::path root_, excluded_;
    std::shared_ptr<spdlog::logger> log_;
};

}
