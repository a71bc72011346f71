#pragma once

#include "storage/ObjectStore.hpp"
#include "storage/s3/S3Controller.hpp"
#include "util/timestamp.hpp"

#include <functional>
#include <string>

namespace mv::storage {

class S3ObjectStore final : public ObjectStore {
public:
    using RandomSuffix = std::function<std::string()>;

    S3ObjectStore(const config::ObjectStoreConfig& cfg, util::Clock clock = util::systemNow,
                  RandomSuffix random = nullptr);

    StoredObject upload(std::istream& content, uint64_t size, const std::string& ownerId,
                        const std::string& filename, const std::string& contentType) override;

    StoredObject uploadAs(std::istream& content, uint64_t size, const std::string& name,
                          const std::string& contentType) override;

    bool remove(const std::string& name) override;

    std::string signUrl(const std::string& name, std::chrono::seconds ttl) override;

    // configured ttl capped at the SigV4 maximum
    [[nodiscard]] std::chrono::seconds defaultTtl() const override { return defaultTtl_; }

private:
    s3::S3Controller s3_;
    util::Clock clock_;
    RandomSuffix random_;
    std::chrono::seconds defaultTtl_;
};

}
