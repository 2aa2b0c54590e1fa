#pragma once

#include "config/Config.hpp"

#include <mutex>
#include <optional>

namespace pith::config {

class ConfigRegistry {
public:
    // Without a path, or when the file does not exist, defaults apply.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

}
