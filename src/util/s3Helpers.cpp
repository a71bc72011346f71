#include "util/s3Helpers.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <curl/curl.h>
#include <cctype>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>

namespace mv::util {

static constexpr const auto* SIGV4_ALGORITHM = "AWS4-HMAC-SHA256";

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static std::string toHex(const unsigned char* data, const size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return oss.str();
}

std::string sha256Hex(const std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    const auto raw = hmacSha256Raw(rawKey, data);
    return toHex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

std::string uriEncode(const std::string_view in, const bool encodeSlash) {
    std::ostringstream out;
    out << std::uppercase << std::hex;
    for (const char ch : in) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out << ch;
        else if (c == '/' && !encodeSlash) out << ch;
        else out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return out.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string credentialScope(const SigV4Credentials& creds, const Timestamp now) {
    return getDate(now) + "/" + creds.region + "/" + creds.service + "/aws4_request";
}

std::string signString(const SigV4Credentials& creds, const Timestamp now, const std::string& stringToSign) {
    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_key, getDate(now));
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService = hmacSha256Raw(kRegion, creds.service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");
    return hmacSha256HexFromRaw(kSigning, stringToSign);
}

static std::string makeStringToSign(const SigV4Credentials& creds, const Timestamp now,
                                    const std::string& canonicalRequest) {
    std::ostringstream sts;
    sts << SIGV4_ALGORITHM << "\n"
        << amzDate(now) << "\n"
        << credentialScope(creds, now) << "\n"
        << sha256Hex(canonicalRequest);
    return sts.str();
}

std::string buildAuthorizationHeader(const SigV4Credentials& creds,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const Timestamp now,
                                     const std::string& canonicalQuery) {
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end()) signedHeaders += ";";
    }

    std::ostringstream canonicalRequest;
    canonicalRequest << method << "\n"
                     << canonicalPath << "\n"
                     << canonicalQuery << "\n"
                     << canonicalHeaders << "\n"
                     << signedHeaders << "\n"
                     << payloadHash;

    const auto signature = signString(creds, now, makeStringToSign(creds, now, canonicalRequest.str()));

    std::ostringstream authHeader;
    authHeader << SIGV4_ALGORITHM << " "
               << "Credential=" << creds.access_key << "/" << credentialScope(creds, now) << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;
    return authHeader.str();
}

std::string buildPresignedQuery(const SigV4Credentials& creds,
                                const std::string& method,
                                const std::string& host,
                                const std::string& canonicalPath,
                                const std::chrono::seconds expires,
                                const Timestamp now) {
    // Parameters are already in canonical (sorted) order
    std::ostringstream query;
    query << "X-Amz-Algorithm=" << SIGV4_ALGORITHM
          << "&X-Amz-Credential=" << uriEncode(creds.access_key + "/" + credentialScope(creds, now))
          << "&X-Amz-Date=" << amzDate(now)
          << "&X-Amz-Expires=" << expires.count()
          << "&X-Amz-SignedHeaders=host";
    const auto canonicalQuery = query.str();

    std::ostringstream canonicalRequest;
    canonicalRequest << method << "\n"
                     << canonicalPath << "\n"
                     << canonicalQuery << "\n"
                     << "host:" << host << "\n"
                     << "\n"
                     << "host" << "\n"
                     << "UNSIGNED-PAYLOAD";

    const auto signature = signString(creds, now, makeStringToSign(creds, now, canonicalRequest.str()));
    return canonicalQuery + "&X-Amz-Signature=" + signature;
}

}
