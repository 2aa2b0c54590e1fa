#pragma once

#include "render/Renderer.hpp"

#include <string_view>
#include <vector>

namespace pith::project {
class HelperRegistry;
struct HelperCall;
}

namespace pith::render {

// Expands "{{ helper arg \"quoted arg\" }}" expressions in sources ending in
// ".tmpl". The suffix is dropped from the output path.
class TemplateRenderer final : public Renderer {
public:
    static constexpr const auto* EXTENSION = ".tmpl";

    [[nodiscard]] std::string name() const override { return "template"; }
    [[nodiscard]] bool handles(const std::filesystem::path& sourcePath) const override;
    [[nodiscard]] std::filesystem::path outputPath(const std::filesystem::path& sourcePath) const override;
    [[nodiscard]] std::string render(const Context& ctx) const override;

    static std::string expand(std::string_view text,
                              const project::HelperRegistry& helpers,
                              const project::HelperCall& base);

    static std::vector<std::string> tokenize(const std::string& expression);
};

}
