#pragma once

#include "config/ConfigRunner.hpp"
#include "project/Attributes.hpp"
#include "project/IgnoreSet.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include <yaml-cpp/yaml.h>

namespace spdlog {
class logger;
}

namespace pith::render {
class Renderer;
}

namespace pith::project {

class Entry;
class Artifact;
class HelperRegistry;

// Relative paths touched by one sync cycle. Diagnostic only.
struct SyncReport {
    std::vector<std::string> added, removed, modified;

    [[nodiscard]] bool empty() const { return added.empty() && removed.empty() && modified.empty(); }
};

// Keeps a map of source entries and the artifacts they produce consistent
// with the filesystem, and builds the artifacts into the output root.
//
// Not thread-safe and not reentrant: a Project must be driven by one
// execution context at a time (see services::Watcher). Read-only accessors
// may run concurrently with each other, never with sync()/build() or any
// mutator.
class Project {
public:
    using Clock = std::chrono::system_clock;

    // Deletes outputRoot recursively once all attributes are applied. Throws
    // ConfigurationError for unknown attributes, and when the output root
    // would contain the source root.
    explicit Project(const std::filesystem::path& sourceRoot,
                     const std::optional<std::filesystem::path>& outputRoot = std::nullopt,
                     const YAML::Node& attributes = YAML::Node());

    ~Project();

    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;

    [[nodiscard]] const std::filesystem::path& sourceRoot() const { return sourceRoot_; }
    [[nodiscard]] const std::filesystem::path& outputRoot() const { return outputRoot_; }

    // Source-relative path of the control file. Never ignored, never built.
    [[nodiscard]] static std::filesystem::path controlPath();

    bool ignore(const std::string& pattern);
    [[nodiscard]] const IgnoreSet& ignorePatterns() const { return ignorePatterns_; }
    [[nodiscard]] bool ignores(const std::filesystem::path& relPath) const;

    [[nodiscard]] const Attributes& attributes() const { return attributes_; }
    void setAssumeContentNegotiation(bool value) { attributes_.assume_content_negotiation = value; }
    void setAssumeDirectoryIndex(bool value) { attributes_.assume_directory_index = value; }

    [[nodiscard]] const std::shared_ptr<HelperRegistry>& helpers() const { return helpers_; }

    // Runs on every sync, after the control file.
    void onConfigure(config::Hook hook);

    // Takes precedence over the renderers already registered. Only entries
    // discovered afterwards pick it up.
    void addRenderer(std::shared_ptr<const render::Renderer> renderer);
    [[nodiscard]] std::shared_ptr<const render::Renderer> rendererFor(const std::filesystem::path& relPath) const;

    // Load config, prune entries that no longer qualify, discover new ones.
    // Throws ConfigurationError when the control file or a hook fails.
    SyncReport sync();

    // Syncs only when the previous throttled sync is at least `period` old.
    std::optional<SyncReport> syncEvery(std::chrono::seconds period);
    std::optional<SyncReport> syncEvery(std::chrono::seconds period, Clock::time_point now);

    // Sync, then build every artifact in sequence. Artifact failures are
    // recorded on the artifacts; see hasErrors().
    void build();

    [[nodiscard]] bool hasErrors() const;

    [[nodiscard]] std::shared_ptr<Entry> entry(const std::filesystem::path& relPath) const;
    [[nodiscard]] std::shared_ptr<Artifact> artifact(const std::filesystem::path& relPath) const;

    [[nodiscard]] std::vector<std::shared_ptr<Entry>> entries() const;
    [[nodiscard]] std::vector<std::shared_ptr<Artifact>> artifacts() const;
    [[nodiscard]] std::vector<std::shared_ptr<Entry>> configEntries() const;

    [[nodiscard]] std::optional<std::filesystem::file_time_type> lastBuiltAt() const;
    [[nodiscard]] uint64_t buildGeneration() const { return buildGeneration_; }

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }
    void setLogger(std::shared_ptr<spdlog::logger> logger);

private:
    std::filesystem::path sourceRoot_, outputRoot_;
    IgnoreSet ignorePatterns_;
    Attributes attributes_;
    std::shared_ptr<HelperRegistry> helpers_;
    std::vector<std::shared_ptr<const render::Renderer>> renderers_;
    std::unique_ptr<config::ConfigRunner> configRunner_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::unordered_map<std::string, std::shared_ptr<Artifact>> artifacts_;
    std::optional<Clock::time_point> nextSyncAt_;
    uint64_t buildGeneration_ = 0;
    std::shared_ptr<spdlog::logger> logger_;

    void loadConfig();
    void validateKnownEntries(SyncReport& report);
    void findNewEntries(SyncReport& report);
    void registerArtifact(const std::shared_ptr<Entry>& entry);
    void registerBuiltinHelpers();

    [[nodiscard]] bool admits(const std::filesystem::path& relPath, bool isDirectory) const;

    static std::string key(const std::filesystem::path& relPath);
};

void to_json(nlohmann::json& j, const Project& project);

}
