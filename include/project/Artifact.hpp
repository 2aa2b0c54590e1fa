#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pith::render {
class Renderer;
}

namespace pith::project {

class Project;

// One generated output. Owned by the Entry that produces it.
class Artifact {
public:
    Artifact(const Project& project,
             const std::filesystem::path& sourcePath,
             const std::filesystem::path& path,
             std::shared_ptr<const render::Renderer> renderer);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] const std::filesystem::path& sourcePath() const { return sourcePath_; }
    [[nodiscard]] std::filesystem::path absolutePath() const;
    [[nodiscard]] std::string href() const;
    [[nodiscard]] const render::Renderer& renderer() const { return *renderer_; }

    // Renders and writes the output. A failure is recorded in error(), never
    // thrown, and leaves no output file behind.
    bool build();

    [[nodiscard]] const std::optional<std::string>& error() const { return error_; }
    [[nodiscard]] bool hasError() const { return error_.has_value(); }
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> builtAt() const { return builtAt_; }

    // Source-relative files other than sourcePath() read by the last build,
    // with their mtime when read (absent if the file could not be stat'ed).
    void recordDependency(const std::filesystem::path& relPath);
    [[nodiscard]] const std::map<std::filesystem::path, std::optional<std::filesystem::file_time_type>>&
    dependencies() const { return dependencies_; }

    // Re-stats every dependency. Returns true when any moved since it was
    // recorded or last refreshed.
    bool refreshDependencies();

private:
    const Project& project_;
    std::filesystem::path sourcePath_, path_;
    std::shared_ptr<const render::Renderer> renderer_;
    std::optional<std::string> error_;
    std::optional<std::chrono::system_clock::time_point> builtAt_;
    std::map<std::filesystem::path, std::optional<std::filesystem::file_time_type>> dependencies_;

    [[nodiscard]] std::optional<std::filesystem::file_time_type> stat(const std::filesystem::path& relPath) const;
};

void to_json(nlohmann::json& j, const Artifact& artifact);

}
