#include "project/Artifact.hpp"
#include "project/Project.hpp"
#include "render/Renderer.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace pith::project;

namespace fs = std::filesystem;

Artifact::Artifact(const Project& project,
                   const fs::path& sourcePath,
                   const fs::path& path,
                   std::shared_ptr<const render::Renderer> renderer)
    : project_(project),
      sourcePath_(sourcePath.lexically_normal()),
      path_(path.lexically_normal()),
      renderer_(std::move(renderer)) {
    if (!renderer_) throw std::invalid_argument("Artifact requires a renderer: " + path_.string());
}

fs::path Artifact::absolutePath() const { return project_.outputRoot() / path_; }

std::string Artifact::href() const { return hrefFor(path_, project_.attributes()); }

bool Artifact::build() {
    error_.reset();
    dependencies_.clear();
    const auto target = absolutePath();

    try {
        const auto rendered = renderer_->render(render::Context{project_, *this});
        fs::create_directories(target.parent_path());
        util::writeFile(target, rendered);
        builtAt_ = std::chrono::system_clock::now();
        project_.logger()->debug("[Artifact] Built {} ({})", path_.generic_string(), renderer_->name());
        return true;
    } catch (const std::exception& e) {
        error_ = e.what();
        project_.logger()->error("[Artifact] Failed to build {}: {}", path_.generic_string(), e.what());
    }

    std::error_code ec;
    fs::remove(target, ec);
    if (ec) project_.logger()->warn("[Artifact] Could not remove stale output {}: {}", target.string(), ec.message());
    return false;
}

void Artifact::recordDependency(const fs::path& relPath) {
    const auto rel = relPath.lexically_normal();
    dependencies_.insert_or_assign(rel, stat(rel));
}

bool Artifact::refreshDependencies() {
    bool moved = false;
    for (auto& [rel, mtime] : dependencies_) {
        const auto current = stat(rel);
        if (current == mtime) continue;
        mtime = current;
        moved = true;
    }
    return moved;
}

std::optional<fs::file_time_type> Artifact::stat(const fs::path& relPath) const {
    std::error_code ec;
    const auto mtime = fs::last_write_time(project_.sourceRoot() / relPath, ec);
    if (ec) return std::nullopt;
    return mtime;
}

void pith::project::to_json(nlohmann::json& j, const Artifact& artifact) {
    auto dependencies = nlohmann::json::array();
    for (const auto& [rel, _] : artifact.dependencies()) dependencies.push_back(rel.generic_string());

    j = {
        {"path", artifact.path().generic_string()},
        {"source", artifact.sourcePath().generic_string()},
        {"href", artifact.href()},
        {"renderer", artifact.renderer().name()},
        {"dependencies", dependencies},
        {"error", artifact.error() ? nlohmann::json(*artifact.error()) : nlohmann::json()}
    };
}
