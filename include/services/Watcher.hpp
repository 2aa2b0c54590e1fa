#pragma once

#include "services/AsyncService.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace pith::project {
class Project;
}

namespace pith::services {

// Single owner of a Project in long-running processes. Every call on the
// project goes through this object's mutex; the worker polls with
// Project::syncEvery and rebuilds when a sync reports changes.
class Watcher final : public AsyncService {
public:
    using Clock = std::chrono::system_clock;

    static constexpr std::chrono::milliseconds TICK{100};

    Watcher(std::shared_ptr<project::Project> project, std::chrono::seconds interval);

    ~Watcher() override;

    // Runs fn(project) under the watcher's lock and returns its result.
    template <typename Fn>
    decltype(auto) withProject(Fn&& fn) {
        std::scoped_lock lock(mutex_);
        return std::forward<Fn>(fn)(*project_);
    }

    // One polling step. Returns true when it ran a build. After a failed cycle
    // the next attempt waits a full interval.
    bool tick(Clock::time_point now);

    [[nodiscard]] uint64_t builds() const { return builds_.load(); }

protected:
    void runLoop() override;

private:
    std::shared_ptr<project::Project> project_;
    std::chrono::seconds interval_;
    std::mutex mutex_;
    bool built_ = false;
    std::optional<Clock::time_point> retryAt_;
    std::atomic<uint64_t> builds_{0};
};

}
