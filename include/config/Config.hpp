#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace mv::config {

constexpr static uintmax_t DEFAULT_MAX_UPLOAD_SIZE_BYTES = static_cast<uintmax_t>(100) * 1024 * 1024; // 100MB

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    unsigned int threads = 4;
    std::vector<std::string> allowed_origins = {"http://localhost:4200"};
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "mediavault";
    std::string user = "mediavault";
    std::string password;
    unsigned int pool_size = 4;
    std::string users_table = "users";
    std::string media_table = "media";

    [[nodiscard]] std::string connectionString() const;
};

struct ObjectStoreConfig {
    std::string endpoint = "https://s3.amazonaws.com";
    std::string region = "us-east-1";
    std::string access_key;
    std::string secret_key;
    std::string bucket = "media-files";
    bool path_style = true;
    std::chrono::hours signed_url_ttl = std::chrono::hours(24 * 365);
    std::chrono::seconds connect_timeout = std::chrono::seconds(10);
    // a transfer below 1 byte/s for this long is aborted
    std::chrono::seconds stall_timeout = std::chrono::seconds(30);
};

struct AuthConfig {
    std::string jwt_secret;
    std::string jwt_algorithm = "HS256";
    unsigned int token_expiry_minutes = 1440;
    std::string issuer = "mediavault";
    unsigned long long pwhash_ops_limit = 3;        // crypto_pwhash_OPSLIMIT_MODERATE
    size_t pwhash_mem_limit = 268435456;            // crypto_pwhash_MEMLIMIT_MODERATE
};

struct ThumbnailConfig {
    unsigned int max_width = 300;
    unsigned int max_height = 300;
    int quality = 85;
};

struct MediaConfig {
    uintmax_t max_upload_size_bytes = DEFAULT_MAX_UPLOAD_SIZE_BYTES;
    std::vector<std::string> allowed_image_types = {"image/jpeg", "image/png", "image/gif", "image/webp"};
    std::vector<std::string> allowed_video_types = {"video/mp4", "video/mpeg", "video/quicktime", "video/webm"};
    ThumbnailConfig thumbnails;
    size_t max_description_length = 500;
    unsigned int max_page_size = 100;
};

struct DevConfig {
    bool enabled = false;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mediavault = spdlog::level::info;   // Startup/shutdown
    spdlog::level::level_enum auth       = spdlog::level::warn;   // Failed logins, token errors
    spdlog::level::level_enum db         = spdlog::level::err;    // Unreachable DB, failed tx
    spdlog::level::level_enum cloud      = spdlog::level::warn;   // S3 errors
    spdlog::level::level_enum media      = spdlog::level::info;
    spdlog::level::level_enum thumb      = spdlog::level::warn;   // Failed renders only
    spdlog::level::level_enum http       = spdlog::level::warn;   // 5xx, invalid auth, etc.
    spdlog::level::level_enum types      = spdlog::level::err;    // Schema violations
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    std::filesystem::path log_dir;  // empty = console only
};

struct Config {
    ServerConfig server;
    DatabaseConfig database;
    ObjectStoreConfig object_store;
    AuthConfig auth;
    MediaConfig media;
    DevConfig dev;
    LoggingConfig logging;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

Config loadConfig(const std::filesystem::path& path);

// Overlays MEDIAVAULT_* variables on top of cfg
void applyEnvOverrides(Config& cfg, const EnvLookup& lookup);

std::optional<std::string> processEnv(const std::string& name);

std::vector<std::string> splitList(const std::string& csv);

} // namespace mv::config
