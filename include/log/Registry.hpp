#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pith::log {

class Registry {
public:
    // Creates every subsystem logger with the levels from config::ConfigRegistry.
    static void init();

    // Throws std::runtime_error for unknown names or before init().
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> pith()  { return get("pith"); }
    static std::shared_ptr<spdlog::logger> sync()  { return get("sync"); }
    static std::shared_ptr<spdlog::logger> build() { return get("build"); }
    static std::shared_ptr<spdlog::logger> watch() { return get("watch"); }

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t max_files_ = 3;
};

}
