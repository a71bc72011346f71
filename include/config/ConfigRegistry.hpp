#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace mv::config {

class ConfigRegistry {
public:
    static constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/mediavault/config.yaml";

    // Loads the YAML file (if present) and overlays the process environment.
    static void init(const std::filesystem::path& path);
    static void init(Config config);
    static const Config& get();

    static std::filesystem::path configPathFromEnv();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace mv::config
