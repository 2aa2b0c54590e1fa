#pragma once

#include <filesystem>
#include <string>

namespace pith::project {
class Project;
class Artifact;
}

namespace pith::render {

struct Context {
    const project::Project& project;
    project::Artifact& artifact;
};

class Renderer {
public:
    virtual ~Renderer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual bool handles(const std::filesystem::path& sourcePath) const = 0;

    [[nodiscard]] virtual std::filesystem::path outputPath(const std::filesystem::path& sourcePath) const = 0;

    // Throws on failure; the caller records the message on the artifact.
    [[nodiscard]] virtual std::string render(const Context& ctx) const = 0;
};

}
