#pragma once

#include "config/Config.hpp"
#include "util/curlWrappers.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <string>

namespace mv::storage::s3 {

// SigV4 maximum for query-string authentication
constexpr std::chrono::seconds MAX_PRESIGN_EXPIRY{604800};

struct Endpoint {
    std::string scheme;  // "https"
    std::string host;    // host[:port]
};

Endpoint parseEndpoint(const std::string& endpoint);

// Summarises an S3 <Error> XML body as "Code: Message"; falls back to the raw body
std::string describeError(const std::string& body);

class S3Controller {
public:
    explicit S3Controller(config::ObjectStoreConfig cfg, util::Clock clock = util::systemNow);

    // Streaming PUT with an unsigned payload; throws error::BackendUnavailable
    void putObject(const std::string& key, std::istream& in, uint64_t size, const std::string& contentType) const;

    // false on 404; throws error::BackendUnavailable otherwise
    bool deleteObject(const std::string& key) const;

    [[nodiscard]] std::string presignGet(const std::string& key, std::chrono::seconds ttl) const;

    [[nodiscard]] const std::string& bucket() const { return cfg_.bucket; }

private:
    config::ObjectStoreConfig cfg_;
    Endpoint endpoint_;
    util::SigV4Credentials creds_;
    util::Clock clock_;
    util::CurlTimeouts timeouts_;

    struct Paths {
        std::string host;
        std::string canonical;
        std::string url;
    };

    [[nodiscard]] Paths constructPaths(const std::string& key) const;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& host,
                                                                    const std::string& payloadHash,
                                                                    util::Timestamp now) const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const Paths& paths,
                                             const std::string& payloadHash) const;
};

}
