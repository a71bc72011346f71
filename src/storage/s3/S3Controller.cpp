#include "storage/s3/S3Controller.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <pugixml.hpp>
#include <stdexcept>

using namespace mv::storage::s3;
using namespace mv::util;

static constexpr const auto* UNSIGNED_PAYLOAD = "UNSIGNED-PAYLOAD";

Endpoint mv::storage::s3::parseEndpoint(const std::string& endpoint) {
    Endpoint out{"https", endpoint};
    if (const auto pos = endpoint.find("://"); pos != std::string::npos) {
        out.scheme = endpoint.substr(0, pos);
        out.host = endpoint.substr(pos + 3);
    }
    if (const auto slash = out.host.find('/'); slash != std::string::npos) out.host.resize(slash);
    if (out.host.empty()) throw std::invalid_argument("Object store endpoint has no host: '" + endpoint + "'");
    return out;
}

std::string mv::storage::s3::describeError(const std::string& body) {
    pugi::xml_document doc;
    if (const auto result = doc.load_string(body.c_str()); !result) return body.substr(0, 256);

    const auto root = doc.child("Error");
    if (!root) return body.substr(0, 256);

    const std::string code = root.child_value("Code");
    const std::string message = root.child_value("Message");
    if (message.empty()) return code;
    return code + ": " + message;
}

S3Controller::S3Controller(config::ObjectStoreConfig cfg, Clock clock)
    : cfg_(std::move(cfg)),
      endpoint_(parseEndpoint(cfg_.endpoint)),
      creds_{cfg_.access_key, cfg_.secret_key, cfg_.region},
      clock_(std::move(clock)),
      timeouts_{cfg_.connect_timeout, cfg_.stall_timeout} {
    if (cfg_.bucket.empty()) throw std::invalid_argument("S3Controller requires a bucket name");
    ensureCurlGlobalInit();
}

S3Controller::Paths S3Controller::constructPaths(const std::string& key) const {
    const auto escapedKey = escapeKeyPreserveSlashes(key);
    if (cfg_.path_style) {
        const auto canonical = "/" + cfg_.bucket + "/" + escapedKey;
        return {endpoint_.host, canonical, endpoint_.scheme + "://" + endpoint_.host + canonical};
    }
    const auto host = cfg_.bucket + "." + endpoint_.host;
    const auto canonical = "/" + escapedKey;
    return {host, canonical, endpoint_.scheme + "://" + host + canonical};
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& host,
                                                               const std::string& payloadHash,
                                                               const Timestamp now) const {
    return {
        {"host", host},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", amzDate(now)}
    };
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const Paths& paths,
                                   const std::string& payloadHash) const {
    const auto now = clock_();
    const auto base = buildHeaderMap(paths.host, payloadHash, now);
    const auto auth = buildAuthorizationHeader(creds_, method, paths.canonical, base, payloadHash, now);

    SList out;
    out.add("Authorization: " + auth);
    for (const auto& [k, v] : base) out.add(k + ": " + v);
    return out;
}

void S3Controller::putObject(const std::string& key, std::istream& in, const uint64_t size,
                             const std::string& contentType) const {
    const auto paths = constructPaths(key);

    SList hdrs = makeSigHeaders("PUT", paths, UNSIGNED_PAYLOAD);
    hdrs.add("Content-Type: " + contentType);
    hdrs.add("Expect:");

    const auto resp = performCurl(timeouts_, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, paths.url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &in);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* buf, size_t sz, size_t nm, void* ud) -> size_t {
                auto* is = static_cast<std::istream*>(ud);
                is->read(buf, static_cast<std::streamsize>(sz * nm));
                return static_cast<size_t>(is->gcount());
            });
    });

    if (!resp.ok()) {
        const auto detail = resp.curl != CURLE_OK ? std::string(curl_easy_strerror(resp.curl)) : describeError(resp.body);
        log::Registry::cloud()->error("[S3Controller] putObject {} failed: CURL={} HTTP={} {}",
                                      key, static_cast<int>(resp.curl), resp.http, detail);
        throw error::BackendUnavailable("object store", fmt::format("PUT {} failed (HTTP {}): {}", key, resp.http, detail));
    }

    log::Registry::cloud()->debug("[S3Controller] Uploaded {} ({} bytes)", key, size);
}

bool S3Controller::deleteObject(const std::string& key) const {
    const auto paths = constructPaths(key);
    const SList hdrs = makeSigHeaders("DELETE", paths, sha256Hex(""));

    const auto resp = performCurl(timeouts_, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, paths.url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.curl == CURLE_OK && resp.http == 404) {
        log::Registry::cloud()->debug("[S3Controller] deleteObject {}: not found", key);
        return false;
    }

    if (!resp.ok()) {
        const auto detail = resp.curl != CURLE_OK ? std::string(curl_easy_strerror(resp.curl)) : describeError(resp.body);
        log::Registry::cloud()->error("[S3Controller] deleteObject {} failed: CURL={} HTTP={} {}",
                                      key, static_cast<int>(resp.curl), resp.http, detail);
        throw error::BackendUnavailable("object store", fmt::format("DELETE {} failed (HTTP {}): {}", key, resp.http, detail));
    }

    return true;
}

std::string S3Controller::presignGet(const std::string& key, std::chrono::seconds ttl) const {
    ttl = std::clamp(ttl, std::chrono::seconds{1}, MAX_PRESIGN_EXPIRY);
    const auto paths = constructPaths(key);
    return paths.url + "?" + buildPresignedQuery(creds_, "GET", paths.host, paths.canonical, ttl, clock_());
}
