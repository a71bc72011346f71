#include "storage/S3ObjectStore.hpp"
#include "storage/ObjectName.hpp"
#include "crypto/uuid.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace mv::storage;

S3ObjectStore::S3ObjectStore(const config::ObjectStoreConfig& cfg, util::Clock clock, RandomSuffix random)
    : s3_(cfg, clock),
      clock_(std::move(clock)),
      random_(random ? std::move(random) : RandomSuffix([] { return ids::random_hex(4); })),
      defaultTtl_(std::min(std::chrono::duration_cast<std::chrono::seconds>(cfg.signed_url_ttl),
                           s3::MAX_PRESIGN_EXPIRY)) {
    if (cfg.signed_url_ttl > s3::MAX_PRESIGN_EXPIRY)
        log::Registry::cloud()->info("[S3ObjectStore] signed_url_ttl of {}h exceeds the SigV4 limit, "
                                     "URLs are signed for 7 days and re-signed on every read",
                                     cfg.signed_url_ttl.count());
}

StoredObject S3ObjectStore::upload(std::istream& content, const uint64_t size, const std::string& ownerId,
                                   const std::string& filename, const std::string& contentType) {
    return uploadAs(content, size, makeObjectName(ownerId, clock_(), random_(), filename), contentType);
}

StoredObject S3ObjectStore::uploadAs(std::istream& content, const uint64_t size, const std::string& name,
                                     const std::string& contentType) {
    s3_.putObject(name, content, size, contentType);
    return {name, signUrl(name, defaultTtl_)};
}

bool S3ObjectStore::remove(const std::string& name) {
    return s3_.deleteObject(name);
}

std::string S3ObjectStore::signUrl(const std::string& name, const std::chrono::seconds ttl) {
    return s3_.presignGet(name, std::min(ttl, s3::MAX_PRESIGN_EXPIRY));
}
