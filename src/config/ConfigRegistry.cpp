#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace pith::config {

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    std::call_once(init_flag_, [&]() {
        if (path) config_ = loadConfig(*path);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
