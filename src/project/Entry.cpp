#include "project/Entry.hpp"
#include "project/Artifact.hpp"
#include "project/Project.hpp"
#include "render/Renderer.hpp"

#include <nlohmann/json.hpp>

using namespace pith::project;

namespace fs = std::filesystem;

Entry::Entry(const Project& project, const fs::path& path)
    : project_(project), path_(path.lexically_normal()) {
    std::error_code ec;
    if (const auto mtime = fs::last_write_time(absolutePath(), ec); !ec) modifiedAt_ = mtime;

    if (isControlFile()) return;

    if (auto renderer = project_.rendererFor(path_))
        artifact_ = std::make_shared<Artifact>(project_, path_, renderer->outputPath(path_), std::move(renderer));
}

fs::path Entry::absolutePath() const { return project_.sourceRoot() / path_; }

bool Entry::isControlFile() const { return path_ == Project::controlPath(); }

Entry::Validation Entry::sync() {
    if (project_.ignores(path_)) return Validation::Invalid;

    std::error_code ec;
    const auto abs = absolutePath();
    if (!fs::is_regular_file(abs, ec)) return Validation::Invalid;

    const auto mtime = fs::last_write_time(abs, ec);
    if (ec) return Validation::Invalid;

    const bool dependencyMoved = artifact_ && artifact_->refreshDependencies();
    if (modifiedAt_ && *modifiedAt_ == mtime && !dependencyMoved) return Validation::Unchanged;
    modifiedAt_ = mtime;
    return Validation::Modified;
}

void pith::project::to_json(nlohmann::json& j, const Entry& entry) {
    j = {
        {"path", entry.path().generic_string()},
        {"control_file", entry.isControlFile()},
        {"artifact", entry.artifact() ? nlohmann::json(entry.artifact()->path().generic_string()) : nlohmann::json()}
    };
}
