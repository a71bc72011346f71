#pragma once

#include "util/timestamp.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace mv::util {

struct SigV4Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region;
    std::string service = "s3";
};

std::string sha256Hex(std::string_view data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);

// RFC 3986 encoding as required by SigV4 canonical requests
std::string uriEncode(std::string_view in, bool encodeSlash = true);
inline std::string escapeKeyPreserveSlashes(const std::string_view key) { return uriEncode(key, false); }

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

std::string credentialScope(const SigV4Credentials& creds, Timestamp now);

std::string signString(const SigV4Credentials& creds, Timestamp now, const std::string& stringToSign);

// Header-signed request; headers must contain host and x-amz-date, keys lowercase
std::string buildAuthorizationHeader(const SigV4Credentials& creds,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     Timestamp now,
                                     const std::string& canonicalQuery = "");

// Query-string signed request (presigned URL); returns the full query string including X-Amz-Signature
std::string buildPresignedQuery(const SigV4Credentials& creds,
                                const std::string& method,
                                const std::string& host,
                                const std::string& canonicalPath,
                                std::chrono::seconds expires,
                                Timestamp now);

void ensureCurlGlobalInit();

}
