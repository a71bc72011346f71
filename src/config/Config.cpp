#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace mv::config {

static std::string quoteConnValue(const std::string& v) {
    std::string out = "'";
    for (const char c : v) {
        if (c == '\\' || c == '\'') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string DatabaseConfig::connectionString() const {
    return fmt::format("host={} port={} dbname={} user={} password={} options='-c TimeZone=UTC'",
                       quoteConnValue(host), port, quoteConnValue(name), quoteConnValue(user),
                       quoteConnValue(password));
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["object_store"]) YAML::convert<ObjectStoreConfig>::decode(node, cfg.object_store);
    if (auto node = root["auth"]) YAML::convert<AuthConfig>::decode(node, cfg.auth);
    if (auto node = root["media"]) YAML::convert<MediaConfig>::decode(node, cfg.media);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["dev"]) YAML::convert<DevConfig>::decode(node, cfg.dev);

    return cfg;
}

std::optional<std::string> processEnv(const std::string& name) {
    if (const char* v = std::getenv(name.c_str())) return std::string(v);
    return std::nullopt;
}

static std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitList(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        auto end = csv.find(',', start);
        if (end == std::string::npos) end = csv.size();
        if (auto item = trim(csv.substr(start, end - start)); !item.empty()) out.push_back(std::move(item));
        start = end + 1;
    }
    return out;
}

static constexpr uintmax_t MiB = 1024 * 1024;

// Non-negative and no larger than max
template <typename T>
static T parseNumber(const std::string& var, const std::string& value, const T max = std::numeric_limits<T>::max()) {
    try {
        size_t pos = 0;
        const auto n = std::stoll(value, &pos);
        if (pos != value.size() || n < 0) throw std::invalid_argument(value);
        if (static_cast<unsigned long long>(n) > static_cast<unsigned long long>(max)) throw std::out_of_range(value);
        return static_cast<T>(n);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid numeric value for {}: '{}'", var, value));
    }
}

static bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes" || value == "on";
}

void applyEnvOverrides(Config& cfg, const EnvLookup& lookup) {
    const auto str = [&](const std::string& var, std::string& target) {
        if (const auto v = lookup(var)) target = *v;
    };
    const auto list = [&](const std::string& var, std::vector<std::string>& target) {
        if (const auto v = lookup(var)) target = splitList(*v);
    };
    const auto num = [&]<typename T>(const std::string& var, T& target) {
        if (const auto v = lookup(var)) target = parseNumber<T>(var, trim(*v));
    };

    str("MEDIAVAULT_HOST", cfg.server.host);
    num("MEDIAVAULT_PORT", cfg.server.port);
    num("MEDIAVAULT_THREADS", cfg.server.threads);
    list("MEDIAVAULT_ALLOWED_ORIGINS", cfg.server.allowed_origins);

    str("MEDIAVAULT_DB_HOST", cfg.database.host);
    num("MEDIAVAULT_DB_PORT", cfg.database.port);
    str("MEDIAVAULT_DB_NAME", cfg.database.name);
    str("MEDIAVAULT_DB_USER", cfg.database.user);
    str("MEDIAVAULT_DB_PASSWORD", cfg.database.password);
    num("MEDIAVAULT_DB_POOL_SIZE", cfg.database.pool_size);
    str("MEDIAVAULT_DB_USERS_TABLE", cfg.database.users_table);
    str("MEDIAVAULT_DB_MEDIA_TABLE", cfg.database.media_table);

    str("MEDIAVAULT_S3_ENDPOINT", cfg.object_store.endpoint);
    str("MEDIAVAULT_S3_REGION", cfg.object_store.region);
    str("MEDIAVAULT_S3_ACCESS_KEY", cfg.object_store.access_key);
    str("MEDIAVAULT_S3_SECRET_KEY", cfg.object_store.secret_key);
    str("MEDIAVAULT_S3_BUCKET", cfg.object_store.bucket);
    if (const auto v = lookup("MEDIAVAULT_S3_PATH_STYLE")) cfg.object_store.path_style = parseBool(trim(*v));
    if (const auto v = lookup("MEDIAVAULT_SIGNED_URL_TTL_HOURS"))
        cfg.object_store.signed_url_ttl = std::chrono::hours(parseNumber<long>("MEDIAVAULT_SIGNED_URL_TTL_HOURS", trim(*v)));
    if (const auto v = lookup("MEDIAVAULT_S3_CONNECT_TIMEOUT"))
        cfg.object_store.connect_timeout = std::chrono::seconds(parseNumber<long>("MEDIAVAULT_S3_CONNECT_TIMEOUT", trim(*v)));
    if (const auto v = lookup("MEDIAVAULT_S3_STALL_TIMEOUT"))
        cfg.object_store.stall_timeout = std::chrono::seconds(parseNumber<long>("MEDIAVAULT_S3_STALL_TIMEOUT", trim(*v)));

    str("MEDIAVAULT_JWT_SECRET", cfg.auth.jwt_secret);
    str("MEDIAVAULT_JWT_ALGORITHM", cfg.auth.jwt_algorithm);
    num("MEDIAVAULT_JWT_EXPIRY_MINUTES", cfg.auth.token_expiry_minutes);

    if (const auto v = lookup("MEDIAVAULT_MAX_FILE_SIZE_MB"))
        cfg.media.max_upload_size_bytes =
            parseNumber<uintmax_t>("MEDIAVAULT_MAX_FILE_SIZE_MB", trim(*v), std::numeric_limits<uintmax_t>::max() / MiB) * MiB;
    list("MEDIAVAULT_ALLOWED_IMAGE_TYPES", cfg.media.allowed_image_types);
    list("MEDIAVAULT_ALLOWED_VIDEO_TYPES", cfg.media.allowed_video_types);

    if (const auto v = lookup("MEDIAVAULT_LOG_DIR")) cfg.logging.log_dir = *v;
    if (const auto v = lookup("MEDIAVAULT_DEV")) cfg.dev.enabled = parseBool(trim(*v));
}

} // namespace mv::config
