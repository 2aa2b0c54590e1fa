#include "services/AsyncService.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace pith::services;

AsyncService::AsyncService(std::string name, std::shared_ptr<spdlog::logger> log)
    : name_(std::move(name)), log_(std::move(log)) {
    if (!log_) throw std::invalid_argument("Service " + name_ + " requires a logger");
}

AsyncService::~AsyncService() {
    if (!worker_.joinable()) return;
    interruptFlag_.store(true);
    if (onWorkerThread()) worker_.detach();
    else worker_.join();
}

void AsyncService::start() {
    if (running_.exchange(true)) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false);
    worker_ = std::thread(&AsyncService::work, this);
    log_->info("[{}] Started", name_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    interruptFlag_.store(true);
    if (onWorkerThread()) return;

    worker_.join();
    running_.store(false);
    log_->info("[{}] Stopped", name_);
}

void AsyncService::work() {
    try {
        runLoop();
    } catch (const std::exception& e) {
        log_->error("[{}] Worker exited with an error: {}", name_, e.what());
    }
    running_.store(false);
}
