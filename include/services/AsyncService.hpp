#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace spdlog {
class logger;
}

namespace pith::services {

// Owns one worker thread running runLoop(). Derived classes must call stop()
// from their own destructor, before their state goes away.
class AsyncService {
public:
    AsyncService(std::string name, std::shared_ptr<spdlog::logger> log);
    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    // Restartable once the previous run has ended.
    virtual void start();
    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] const std::string& name() const { return name_; }

protected:
    std::string name_;
    std::shared_ptr<spdlog::logger> log_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};

    virtual void runLoop() = 0;

    [[nodiscard]] bool onWorkerThread() const { return std::this_thread::get_id() == worker_.get_id(); }

private:
    std::thread worker_;

    void work();
};

}
