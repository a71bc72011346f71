#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mv::config;

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["threads"] = rhs.threads;
        node["allowed_origins"] = rhs.allowed_origins;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(8000);
        rhs.threads = node["threads"].as<unsigned int>(4);
        if (node["allowed_origins"]) rhs.allowed_origins = node["allowed_origins"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        node["users_table"] = rhs.users_table;
        node["media_table"] = rhs.media_table;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("mediavault");
        rhs.user = node["user"].as<std::string>("mediavault");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        rhs.users_table = node["users_table"].as<std::string>("users");
        rhs.media_table = node["media_table"].as<std::string>("media");
        return true;
    }
};

template<>
struct convert<ObjectStoreConfig> {
    static Node encode(const ObjectStoreConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["bucket"] = rhs.bucket;
        node["path_style"] = rhs.path_style;
        node["signed_url_ttl_hours"] = rhs.signed_url_ttl.count();
        node["connect_timeout_seconds"] = rhs.connect_timeout.count();
        node["stall_timeout_seconds"] = rhs.stall_timeout.count();
        return node;
    }

    static bool decode(const Node& node, ObjectStoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("https://s3.amazonaws.com");
        rhs.region = node["region"].as<std::string>("us-east-1");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_key = node["secret_key"].as<std::string>("");
        rhs.bucket = node["bucket"].as<std::string>("media-files");
        rhs.path_style = node["path_style"].as<bool>(true);
        rhs.signed_url_ttl = std::chrono::hours(node["signed_url_ttl_hours"].as<long>(24 * 365));
        rhs.connect_timeout = std::chrono::seconds(node["connect_timeout_seconds"].as<long>(10));
        rhs.stall_timeout = std::chrono::seconds(node["stall_timeout_seconds"].as<long>(30));
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static Node encode(const AuthConfig& rhs) {
        Node node;
        node["jwt_algorithm"] = rhs.jwt_algorithm;
        node["token_expiry_minutes"] = rhs.token_expiry_minutes;
        node["issuer"] = rhs.issuer;
        node["pwhash_ops_limit"] = rhs.pwhash_ops_limit;
        node["pwhash_mem_limit"] = rhs.pwhash_mem_limit;
        return node;
    }

    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.jwt_secret = node["jwt_secret"].as<std::string>("");
        rhs.jwt_algorithm = node["jwt_algorithm"].as<std::string>("HS256");
        rhs.token_expiry_minutes = node["token_expiry_minutes"].as<unsigned int>(1440);
        rhs.issuer = node["issuer"].as<std::string>("mediavault");
        rhs.pwhash_ops_limit = node["pwhash_ops_limit"].as<unsigned long long>(3);
        rhs.pwhash_mem_limit = node["pwhash_mem_limit"].as<size_t>(268435456);
        return true;
    }
};

template<>
struct convert<ThumbnailConfig> {
    static Node encode(const ThumbnailConfig& rhs) {
        Node node;
        node["max_width"] = rhs.max_width;
        node["max_height"] = rhs.max_height;
        node["quality"] = rhs.quality;
        return node;
    }

    static bool decode(const Node& node, ThumbnailConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_width = node["max_width"].as<unsigned int>(300);
        rhs.max_height = node["max_height"].as<unsigned int>(300);
        rhs.quality = node["quality"].as<int>(85);
        return true;
    }
};

template<>
struct convert<MediaConfig> {
    static Node encode(const MediaConfig& rhs) {
        Node node;
        node["max_file_size_mb"] = rhs.max_upload_size_bytes / (1024 * 1024);
        node["allowed_image_types"] = rhs.allowed_image_types;
        node["allowed_video_types"] = rhs.allowed_video_types;
        node["thumbnails"] = rhs.thumbnails;
        node["max_description_length"] = rhs.max_description_length;
        node["max_page_size"] = rhs.max_page_size;
        return node;
    }

    static bool decode(const Node& node, MediaConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_upload_size_bytes = node["max_file_size_mb"].as<uintmax_t>(100) * 1024 * 1024;
        if (node["allowed_image_types"]) rhs.allowed_image_types = node["allowed_image_types"].as<std::vector<std::string>>();
        if (node["allowed_video_types"]) rhs.allowed_video_types = node["allowed_video_types"].as<std::vector<std::string>>();
        if (node["thumbnails"]) rhs.thumbnails = node["thumbnails"].as<ThumbnailConfig>();
        rhs.max_description_length = node["max_description_length"].as<size_t>(500);
        rhs.max_page_size = node["max_page_size"].as<unsigned int>(100);
        return true;
    }
};

template<>
struct convert<DevConfig> {
    static Node encode(const DevConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        return node;
    }

    static bool decode(const Node& node, DevConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(false);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mediavault"] = to_std_string(spdlog::level::to_string_view(rhs.mediavault));
        node["auth"]       = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["db"]         = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["cloud"]      = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["media"]      = to_std_string(spdlog::level::to_string_view(rhs.media));
        node["thumb"]      = to_std_string(spdlog::level::to_string_view(rhs.thumb));
        node["http"]       = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["types"]      = to_std_string(spdlog::level::to_string_view(rhs.types));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mediavault = spdlog::level::from_str(node["mediavault"].as<std::string>("info"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.media = spdlog::level::from_str(node["media"].as<std::string>("info"));
        rhs.thumb = spdlog::level::from_str(node["thumb"].as<std::string>("warn"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.types = spdlog::level::from_str(node["types"].as<std::string>("err"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
