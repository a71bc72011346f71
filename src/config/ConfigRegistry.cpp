#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace mv::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path);
        applyEnvOverrides(config_, processEnv);
        initialized_ = true;
    });
}

void ConfigRegistry::init(Config config) {
    std::call_once(init_flag_, [&]() {
        config_ = std::move(config);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

std::filesystem::path ConfigRegistry::configPathFromEnv() {
    if (const auto p = processEnv("MEDIAVAULT_CONFIG")) return *p;
    return DEFAULT_CONFIG_PATH;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace mv::config
