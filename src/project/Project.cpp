#include "project/Project.hpp"
#include "project/Artifact.hpp"
#include "project/Entry.hpp"
#include "project/HelperRegistry.hpp"
#include "project/errors.hpp"
#include "config/Api.hpp"
#include "core/Scanner.hpp"
#include "render/CopyRenderer.hpp"
#include "render/TemplateRenderer.hpp"
#include "util/files.hpp"
#include "util/fsPath.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <algorithm>
#include <stdexcept>

using namespace pith::project;
using namespace pith::util;

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> nullLogger() {
    return std::make_shared<spdlog::logger>("pith", std::make_shared<spdlog::sinks::null_sink_mt>());
}

}

Project::Project(const fs::path& sourceRoot,
                 const std::optional<fs::path>& outputRoot,
                 const YAML::Node& attributes)
    : sourceRoot_(makeRoot(sourceRoot)),
      outputRoot_(makeRoot(outputRoot ? *outputRoot : sourceRoot / "_out")),
      helpers_(std::make_shared<HelperRegistry>()),
      configRunner_(std::make_unique<config::ConfigRunner>(*this)),
      logger_(nullLogger()) {
    if (isUnder(sourceRoot_, outputRoot_))
        throw ConfigurationError(fmt::format("Output root {} must not contain the source root {}",
                                             outputRoot_.string(), sourceRoot_.string()));

    renderers_.push_back(std::make_shared<render::TemplateRenderer>());
    renderers_.push_back(std::make_shared<render::CopyRenderer>());
    registerBuiltinHelpers();

    config::Api(*this).apply(attributes);

    fs::remove_all(outputRoot_);
}

Project::~Project() = default;

fs::path Project::controlPath() { return fs::path(config::ConfigRunner::CONTROL_FILE); }

bool Project::ignore(const std::string& pattern) { return ignorePatterns_.add(pattern); }

bool Project::ignores(const fs::path& relPath) const {
    const auto rel = relPath.lexically_normal();
    return rel != controlPath() && ignorePatterns_.matches(rel);
}

void Project::onConfigure(config::Hook hook) { configRunner_->addHook(std::move(hook)); }

void Project::addRenderer(std::shared_ptr<const render::Renderer> renderer) {
    if (!renderer) throw std::invalid_argument("Renderer must not be null");
    renderers_.insert(renderers_.begin(), std::move(renderer));
}

std::shared_ptr<const pith::render::Renderer> Project::rendererFor(const fs::path& relPath) const {
    for (const auto& renderer : renderers_)
        if (renderer->handles(relPath)) return renderer;
    return nullptr;
}

SyncReport Project::sync() {
    loadConfig();

    SyncReport report;
    validateKnownEntries(report);
    findNewEntries(report);

    if (!report.empty())
        logger_->info("[Project] Synced {}: {} added, {} removed, {} modified",
                      sourceRoot_.string(), report.added.size(), report.removed.size(), report.modified.size());
    return report;
}

std::optional<SyncReport> Project::syncEvery(const std::chrono::seconds period) {
    return syncEvery(period, Clock::now());
}

std::optional<SyncReport> Project::syncEvery(const std::chrono::seconds period, const Clock::time_point now) {
    if (nextSyncAt_ && now < *nextSyncAt_) return std::nullopt;

    auto report = sync();
    nextSyncAt_ = now + period;
    return report;
}

void Project::build() {
    sync();
    fs::create_directories(outputRoot_);

    size_t failures = 0;
    const auto targets = artifacts();
    for (const auto& artifact : targets)
        if (!artifact->build()) ++failures;

    fs::last_write_time(outputRoot_, fs::file_time_type::clock::now());
    ++buildGeneration_;

    if (failures > 0)
        logger_->warn("[Project] Build #{} finished with {} of {} artifacts failing",
                      buildGeneration_, failures, targets.size());
    else logger_->info("[Project] Build #{} finished: {} artifacts", buildGeneration_, targets.size());
}

bool Project::hasErrors() const {
    return std::ranges::any_of(artifacts_, [](const auto& kv) { return kv.second->hasError(); });
}

std::shared_ptr<Entry> Project::entry(const fs::path& relPath) const {
    const auto it = entries_.find(key(relPath));
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<Artifact> Project::artifact(const fs::path& relPath) const {
    const auto it = artifacts_.find(key(relPath));
    return it == artifacts_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Entry>> Project::entries() const {
    std::vector<std::shared_ptr<Entry>> out;
    out.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) out.push_back(entry);
    std::ranges::sort(out, {}, [](const auto& e) { return e->path(); });
    return out;
}

std::vector<std::shared_ptr<Artifact>> Project::artifacts() const {
    std::vector<std::shared_ptr<Artifact>> out;
    out.reserve(artifacts_.size());
    for (const auto& [_, artifact] : artifacts_) out.push_back(artifact);
    std::ranges::sort(out, {}, [](const auto& a) { return a->path(); });
    return out;
}

std::vector<std::shared_ptr<Entry>> Project::configEntries() const {
    if (auto control = entry(controlPath())) return {control};
    return {};
}

std::optional<fs::file_time_type> Project::lastBuiltAt() const {
    std::error_code ec;
    const auto mtime = fs::last_write_time(outputRoot_, ec);
    if (ec) return std::nullopt;
    return mtime;
}

void Project::setLogger(std::shared_ptr<spdlog::logger> logger) {
    logger_ = logger ? std::move(logger) : nullLogger();
}

void Project::loadConfig() {
    try {
        configRunner_->run();
    } catch (const ConfigurationError& e) {
        logger_->error("[Project] Configuration failed, sync aborted: {}", e.what());
        throw;
    }
}

void Project::validateKnownEntries(SyncReport& report) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& entry = it->second;

        switch (entry->sync()) {
            case Entry::Validation::Invalid: {
                if (const auto& artifact = entry->artifact()) {
                    const auto owned = artifacts_.find(key(artifact->path()));
                    if (owned != artifacts_.end() && owned->second == artifact) artifacts_.erase(owned);
                }
                logger_->debug("[Project] Dropped {}", it->first);
                report.removed.push_back(it->first);
                it = entries_.erase(it);
                continue;
            }
            case Entry::Validation::Modified:
                report.modified.push_back(it->first);
                break;
            case Entry::Validation::Unchanged:
                break;
        }
        ++it;
    }

    std::ranges::sort(report.removed);
    std::ranges::sort(report.modified);
}

void Project::findNewEntries(SyncReport& report) {
    const core::Scanner scanner(sourceRoot_, outputRoot_, logger_);

    for (const auto& rel : scanner.scan([this](const fs::path& p, const bool isDir) { return admits(p, isDir); })) {
        auto k = key(rel);
        if (entries_.contains(k)) continue;

        entries_.emplace(k, std::make_shared<Entry>(*this, rel));
        logger_->debug("[Project] Discovered {}", k);
        report.added.push_back(std::move(k));
    }

    // Registration runs over every entry, in path order, so an artifact whose
    // output path was held by a removed entry takes the slot over.
    for (const auto& entry : entries()) registerArtifact(entry);
}

void Project::registerArtifact(const std::shared_ptr<Entry>& entry) {
    const auto& artifact = entry->artifact();
    if (!artifact) return;

    const auto [it, inserted] = artifacts_.try_emplace(key(artifact->path()), artifact);
    if (!inserted && it->second != artifact)
        logger_->warn("[Project] {} and another source both produce {}; keeping the first",
                      entry->path().generic_string(), it->first);
}

void Project::registerBuiltinHelpers() {
    helpers_->define("include", [](const HelperCall& call) {
        if (call.args.size() != 1) throw std::invalid_argument("include expects exactly one path");
        const fs::path rel(call.args.front());
        if (escapesRoot(rel))
            throw std::invalid_argument(fmt::format("include path escapes the source root: {}", call.args.front()));
        if (call.artifact) call.artifact->recordDependency(rel);
        return readFileToString(call.project.sourceRoot() / rel.lexically_normal());
    });

    helpers_->define("href", [](const HelperCall& call) {
        if (call.args.size() != 1) throw std::invalid_argument("href expects exactly one output path");
        return hrefFor(call.args.front(), call.project.attributes());
    });
}

bool Project::admits(const fs::path& relPath, const bool isDirectory) const {
    const auto control = controlPath();
    if (isDirectory && isUnder(control, relPath)) return true;
    return !ignores(relPath);
}

std::string Project::key(const fs::path& relPath) { return relPath.lexically_normal().generic_string(); }

void pith::project::to_json(nlohmann::json& j, const Project& project) {
    auto entries = nlohmann::json::array();
    for (const auto& entry : project.entries()) entries.push_back(nlohmann::json(*entry));

    auto artifacts = nlohmann::json::array();
    for (const auto& artifact : project.artifacts()) artifacts.push_back(nlohmann::json(*artifact));

    j = {
        {"source_root", project.sourceRoot().string()},
        {"output_root", project.outputRoot().string()},
        {"ignore", project.ignorePatterns().patterns()},
        {"build_generation", project.buildGeneration()},
        {"has_errors", project.hasErrors()},
        {"entries", entries},
        {"artifacts", artifacts}
    };
}
