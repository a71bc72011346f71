#include "protocols/http/Router.hpp"
#include "protocols/http/multipart.hpp"
#include "auth/AuthManager.hpp"
#include "media/MediaManager.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "types/Page.hpp"
#include "types/User.hpp"
#include "util/memoryStream.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace mv::protocols::http;
using namespace mv::error;

std::string mv::protocols::http::url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%') {
            int hex = 0;
            const auto* first = value.data() + i + 1;
            if (i + 2 >= value.length() ||
                !std::isxdigit(static_cast<unsigned char>(first[0])) ||
                !std::isxdigit(static_cast<unsigned char>(first[1])) ||
                std::from_chars(first, first + 2, hex, 16).ptr != first + 2)
                throw ValidationError("Invalid percent-encoding in URL");
            result.push_back(static_cast<char>(hex));
            i += 2;
        }
        else if (value[i] == '+') result.push_back(' ');
        else result.push_back(value[i]);
    }
    return result;
}

QueryParams mv::protocols::http::parse_query_params(const std::string& target) {
    QueryParams params;

    const auto pos = target.find('?');
    if (pos == std::string::npos) return params;

    const std::string query = target.substr(pos + 1);
    std::istringstream stream(query);
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        if (eq != std::string::npos) params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        else params[url_decode(pair)] = "";
    }

    return params;
}

string_response mv::protocols::http::makeJsonResponse(const request& req, const nlohmann::json& j, const status s) {
    string_response res{s, req.version()};
    res.set(field::server, Router::SERVICE_NAME);
    res.set(field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = j.dump();
    res.prepare_payload();
    return res;
}

static string_response makeEmptyResponse(const request& req, const status s) {
    string_response res{s, req.version()};
    res.set(field::server, Router::SERVICE_NAME);
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

static nlohmann::json parseJsonBody(const request& req) {
    const auto j = nlohmann::json::parse(req.body(), nullptr, false);
    if (j.is_discarded()) throw ValidationError("Request body must be valid JSON");
    if (!j.is_object()) throw ValidationError("Request body must be a JSON object");
    return j;
}

static std::string requireString(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || !j.at(key).is_string()) throw ValidationError(key + " is required");
    return j.at(key).get<std::string>();
}

static unsigned int uintParam(const QueryParams& query, const std::string& key, const unsigned int fallback) {
    const auto it = query.find(key);
    if (it == query.end()) return fallback;

    const auto& raw = it->second;
    unsigned long long value = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (raw.empty() || ec != std::errc{} || ptr != raw.data() + raw.size() ||
        value > std::numeric_limits<unsigned int>::max())
        throw ValidationError(key + " must be a non-negative integer");
    return static_cast<unsigned int>(value);
}

static mv::types::PageRequest pageParams(const QueryParams& query) {
    return {uintParam(query, "page", 1), uintParam(query, "pageSize", mv::types::PageRequest::DEFAULT_PAGE_SIZE)};
}

static status statusFor(const Code code) {
    switch (code) {
    case Code::Validation:
    case Code::UnsupportedType:
    case Code::Conflict:        return status::bad_request;
    case Code::Unauthorized:    return status::unauthorized;
    case Code::Forbidden:       return status::forbidden;
    case Code::NotFound:        return status::not_found;
    case Code::PayloadTooLarge: return status::payload_too_large;
    case Code::BackendUnavailable:
    case Code::Internal:
    default:                    return status::internal_server_error;
    }
}

Router::Router(std::shared_ptr<auth::AuthManager> auth,
               std::shared_ptr<media::MediaManager> media,
               config::ServerConfig server,
               const bool exposeErrorDetails)
    : auth_(std::move(auth)),
      media_(std::move(media)),
      server_(std::move(server)),
      exposeErrorDetails_(exposeErrorDetails) {
    if (!auth_ || !media_) throw std::invalid_argument("Router requires auth and media managers");
}

string_response Router::route(const request& req) const {
    string_response res;
    try {
        const std::string target(req.target());
        const auto path = target.substr(0, target.find('?'));
        res = dispatch(req, path, parse_query_params(target));
    } catch (const std::exception& e) {
        res = errorResponse(req, e);
    }

    applyCors(req, res);
    log::Registry::http()->debug("[Router] {} {} -> {}", std::string(req.method_string()),
                                 std::string(req.target()), res.result_int());
    return res;
}

string_response Router::dispatch(const request& req, const std::string& path, const QueryParams& query) const {
    const std::string prefix = API_PREFIX;
    const auto method = req.method();

    if (method == verb::options) return makeEmptyResponse(req, status::no_content);

    if (!path.starts_with(prefix)) throw NotFound("Not found");
    const auto route = path.substr(prefix.size());

    if (route == "/health" && method == verb::get)
        return makeJsonResponse(req, {{"status", "healthy"}, {"service", SERVICE_NAME}, {"version", SERVICE_VERSION}});

    if (route == "/auth/register" && method == verb::post) return handleRegister(req);
    if (route == "/auth/login" && method == verb::post) return handleLogin(req);

    if (route == "/media" || route == "/media/") {
        if (method == verb::post) return handleUpload(req);
        if (method == verb::get) return handleList(req, query);
    }

    if (route == "/media/search" && method == verb::get) return handleSearch(req, query);

    constexpr std::string_view mediaPrefix = "/media/";
    if (route.starts_with(mediaPrefix)) {
        const auto id = route.substr(mediaPrefix.size());
        if (!id.empty() && id.find('/') == std::string::npos && id != "search") {
            if (method == verb::get) return handleGet(req, id);
            if (method == verb::put) return handleUpdate(req, id);
            if (method == verb::delete_) return handleDelete(req, id);
        }
    }

    throw NotFound("Not found");
}

auth::Claims Router::authenticate(const request& req) const {
    const auto it = req.find(field::authorization);
    return auth_->authenticate(it == req.end() ? std::string{} : std::string(it->value()));
}

string_response Router::handleRegister(const request& req) const {
    const auto body = parseJsonBody(req);
    const auto result = auth_->registerUser(requireString(body, "username"), requireString(body, "email"),
                                            requireString(body, "password"));
    return makeJsonResponse(req, result);
}

string_response Router::handleLogin(const request& req) const {
    const auto body = parseJsonBody(req);
    const auto result = auth_->login(requireString(body, "email"), requireString(body, "password"));
    return makeJsonResponse(req, result);
}

string_response Router::handleUpload(const request& req) const {
    const auto claims = authenticate(req);

    const auto contentType = req.find(field::content_type);
    if (contentType == req.end()) throw ValidationError("Expected multipart/form-data request body");

    const std::string_view body = req.body();
    const auto parts = multipart::parse(body, multipart::boundaryFrom(std::string(contentType->value())));

    const auto* file = multipart::find(parts, "file");
    if (!file || !file->filename || file->filename->empty()) throw ValidationError("No file provided");

    media::UploadRequest upload;
    upload.owner_id = claims.subject_id;
    upload.filename = *file->filename;
    upload.content_type = file->content_type;
    upload.size = file->body.size();
    if (const auto* d = multipart::find(parts, "description")) upload.description = std::string(d->body);
    if (const auto* t = multipart::find(parts, "tags")) upload.tags = std::string(t->body);

    util::MemoryIStream content(file->body);
    const auto record = media_->upload(upload, content);
    return makeJsonResponse(req, *record, status::created);
}

string_response Router::handleList(const request& req, const QueryParams& query) const {
    const auto claims = authenticate(req);

    std::optional<std::string> mediaType;
    if (const auto it = query.find("mediaType"); it != query.end() && !it->second.empty()) mediaType = it->second;

    return makeJsonResponse(req, media_->list(claims.subject_id, pageParams(query), mediaType));
}

string_response Router::handleSearch(const request& req, const QueryParams& query) const {
    const auto claims = authenticate(req);

    const auto it = query.find("query");
    if (it == query.end() || it->second.empty()) throw ValidationError("query must not be empty");

    return makeJsonResponse(req, media_->search(claims.subject_id, it->second, pageParams(query)));
}

string_response Router::handleGet(const request& req, const std::string& id) const {
    const auto claims = authenticate(req);
    return makeJsonResponse(req, *media_->get(id, claims.subject_id));
}

string_response Router::handleUpdate(const request& req, const std::string& id) const {
    const auto claims = authenticate(req);

    types::MediaPatch patch;
    types::from_json(parseJsonBody(req), patch);

    return makeJsonResponse(req, *media_->update(id, claims.subject_id, std::move(patch)));
}

string_response Router::handleDelete(const request& req, const std::string& id) const {
    const auto claims = authenticate(req);
    if (!media_->remove(id, claims.subject_id)) throw NotFound("Media not found");
    return makeEmptyResponse(req, status::no_content);
}

string_response Router::errorResponse(const request& req, const std::exception& e) const {
    nlohmann::json err;
    status s;

    if (const auto* typed = dynamic_cast<const Error*>(&e)) {
        s = statusFor(typed->code());
        if (s == status::internal_server_error) {
            log::Registry::http()->error("[Router] {} {} failed: {}{}", std::string(req.method_string()),
                                         std::string(req.target()), typed->what(),
                                         typed->details() ? " (" + *typed->details() + ")" : "");
            err = {{"code", std::string(to_string(Code::Internal))}, {"message", "Internal server error"}};
            if (exposeErrorDetails_)
                err["details"] = typed->details() ? std::string(typed->what()) + ": " + *typed->details()
                                                  : std::string(typed->what());
        } else {
            const auto* authErr = dynamic_cast<const AuthError*>(&e);
            err = {
                {"code", std::string(authErr ? to_string(authErr->reason()) : to_string(typed->code()))},
                {"message", typed->what()}
            };
            if (typed->details()) err["details"] = *typed->details();
            if (s == status::unauthorized)
                log::Registry::http()->warn("[Router] {} {} unauthorized: {}", std::string(req.method_string()),
                                            std::string(req.target()), typed->what());
        }
    } else {
        s = status::internal_server_error;
        log::Registry::http()->error("[Router] {} {} failed: {}", std::string(req.method_string()),
                                     std::string(req.target()), e.what());
        err = {{"code", std::string(to_string(Code::Internal))}, {"message", "Internal server error"}};
        if (exposeErrorDetails_) err["details"] = e.what();
    }

    auto res = makeJsonResponse(req, {{"error", err}}, s);
    if (s == status::unauthorized) res.set(field::www_authenticate, "Bearer");
    return res;
}

bool Router::originAllowed(const std::string& origin) const {
    return std::ranges::any_of(server_.allowed_origins, [&](const std::string& o) { return o == "*" || o == origin; });
}

void Router::applyCors(const request& req, string_response& res) const {
    const auto it = req.find(field::origin);
    if (it == req.end()) return;

    const std::string origin(it->value());
    if (!originAllowed(origin)) return;

    res.set(field::access_control_allow_origin, origin);
    res.set(field::access_control_allow_credentials, "true");
    res.set(field::vary, "Origin");

    if (req.method() == verb::options) {
        res.set(field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
        res.set(field::access_control_allow_headers, "Authorization, Content-Type");
        res.set(field::access_control_max_age, "600");
    }
}
