#pragma once

#include "config/Config.hpp"

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>
#include <unordered_map>

namespace mv::auth { class AuthManager; struct Claims; }
namespace mv::media { class MediaManager; }

namespace mv::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_response = boost::beast::http::response<boost::beast::http::string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

using QueryParams = std::unordered_map<std::string, std::string>;

std::string url_decode(const std::string& value);
QueryParams parse_query_params(const std::string& target);

// Maps the REST surface under /api onto the auth and media components.
// Every handler runs inside one boundary that turns exceptions into the error envelope.
class Router {
public:
    static constexpr const auto* API_PREFIX = "/api";
    static constexpr const auto* SERVICE_NAME = "mediavault";
    static constexpr const auto* SERVICE_VERSION = "1.0.0";

    Router(std::shared_ptr<auth::AuthManager> auth,
           std::shared_ptr<media::MediaManager> media,
           config::ServerConfig server,
           bool exposeErrorDetails);

    string_response route(const request& req) const;

private:
    std::shared_ptr<auth::AuthManager> auth_;
    std::shared_ptr<media::MediaManager> media_;
    config::ServerConfig server_;
    bool exposeErrorDetails_;

    string_response dispatch(const request& req, const std::string& path, const QueryParams& query) const;

    string_response handleRegister(const request& req) const;
    string_response handleLogin(const request& req) const;
    string_response handleUpload(const request& req) const;
    string_response handleList(const request& req, const QueryParams& query) const;
    string_response handleSearch(const request& req, const QueryParams& query) const;
    string_response handleGet(const request& req, const std::string& id) const;
    string_response handleUpdate(const request& req, const std::string& id) const;
    string_response handleDelete(const request& req, const std::string& id) const;

    [[nodiscard]] auth::Claims authenticate(const request& req) const;

    string_response errorResponse(const request& req, const std::exception& e) const;
    void applyCors(const request& req, string_response& res) const;
    [[nodiscard]] bool originAllowed(const std::string& origin) const;
};

string_response makeJsonResponse(const request& req, const nlohmann::json& j, status s = status::ok);

}
