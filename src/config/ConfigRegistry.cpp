#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace pc::config {

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    std::call_once(init_flag_, [&]() {
        config_ = path ? loadConfig(*path) : Config{};
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace pc::config
