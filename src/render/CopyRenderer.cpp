#include "render/CopyRenderer.hpp"
#include "project/Artifact.hpp"
#include "project/Project.hpp"
#include "util/files.hpp"

using namespace pith::render;

std::filesystem::path CopyRenderer::outputPath(const std::filesystem::path& sourcePath) const {
    return sourcePath.lexically_normal();
}

std::string CopyRenderer::render(const Context& ctx) const {
    return util::readFileToString(ctx.project.sourceRoot() / ctx.artifact.sourcePath());
}
