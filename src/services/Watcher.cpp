#include "services/Watcher.hpp"
#include "project/Project.hpp"
#include "project/errors.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <stdexcept>
#include <thread>

using namespace pith::services;
using namespace pith::project;
using namespace pith::log;

Watcher::Watcher(std::shared_ptr<Project> project, const std::chrono::seconds interval)
    : AsyncService("Watcher", Registry::watch()), project_(std::move(project)), interval_(interval) {
    if (!project_) throw std::invalid_argument("Watcher requires a project");
    if (interval_.count() <= 0) throw std::invalid_argument("Watcher interval must be positive");
}

Watcher::~Watcher() { stop(); }

bool Watcher::tick(const Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    if (retryAt_ && now < *retryAt_) return false;
    retryAt_.reset();

    try {
        const auto report = project_->syncEvery(interval_, now);
        if (!report) return false;
        if (built_ && report->empty()) return false;

        project_->build();
        built_ = true;
        ++builds_;

        if (project_->hasErrors()) log_->warn("[Watcher] Build #{} has errors", project_->buildGeneration());
        else log_->info("[Watcher] Build #{} complete", project_->buildGeneration());
        return true;
    } catch (const ConfigurationError& e) {
        log_->error("[Watcher] Skipping cycle, retrying in {}s: {}", interval_.count(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        log_->error("[Watcher] Build aborted, retrying in {}s: {}", interval_.count(), e.what());
    }
    retryAt_ = now + interval_;
    return false;
}

void Watcher::runLoop() {
    log_->info("[Watcher] Polling {} every {}s", project_->sourceRoot().string(), interval_.count());

    while (!interruptFlag_.load()) {
        tick(Clock::now());
        std::this_thread::sleep_for(TICK);
    }
}
