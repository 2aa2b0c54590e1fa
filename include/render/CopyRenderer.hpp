#pragma once

#include "render/Renderer.hpp"

namespace pith::render {

class CopyRenderer final : public Renderer {
public:
    [[nodiscard]] std::string name() const override { return "copy"; }
    [[nodiscard]] bool handles(const std::filesystem::path&) const override { return true; }
    [[nodiscard]] std::filesystem::path outputPath(const std::filesystem::path& sourcePath) const override;
    [[nodiscard]] std::string render(const Context& ctx) const override;
};

}
