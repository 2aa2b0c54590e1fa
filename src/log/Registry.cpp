#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <vector>

namespace pith::log {

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.log_dir.empty()) {
        std::filesystem::create_directories(cnf.log_dir);
        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (cnf.log_dir / "pith.log").string(), max_bytes_, max_files_);
        file_sink_->set_level(cnf.levels.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cnf.levels.subsystem_levels;
    makeLogger("pith",  sub.pith);
    makeLogger("sync",  sub.sync);
    makeLogger("build", sub.build);
    makeLogger("watch", sub.watch);

    initialized_ = true;
    pith()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

}
