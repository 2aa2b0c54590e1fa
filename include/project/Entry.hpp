#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace pith::render {
class Renderer;
}

namespace pith::project {

class Project;
class Artifact;

// One source file under the project's source root.
class Entry {
public:
    enum class Validation { Unchanged, Modified, Invalid };

    Entry(const Project& project, const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] std::filesystem::path absolutePath() const;

    // Null for the control file and for sources no renderer handles.
    [[nodiscard]] const std::shared_ptr<Artifact>& artifact() const { return artifact_; }

    [[nodiscard]] bool isControlFile() const;

    [[nodiscard]] std::optional<std::filesystem::file_time_type> modifiedAt() const { return modifiedAt_; }

    // Re-checks the source against the filesystem and the current ignore rules.
    // A moved dependency of its artifact also counts as Modified.
    Validation sync();

private:
    const Project& project_;
    std::filesystem::path path_;
    std::optional<std::filesystem::file_time_type> modifiedAt_;
    std::shared_ptr<Artifact> artifact_;
};

void to_json(nlohmann::json& j, const Entry& entry);

}
