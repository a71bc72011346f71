#pragma once

#include "storage/ObjectStore.hpp"
#include "storage/ObjectName.hpp"
#include "error/Error.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mv::test {

class MemoryObjectStore final : public storage::ObjectStore {
public:
    struct Upload {
        std::string name, filename, contentType;
        uint64_t size = 0;
    };

    explicit MemoryObjectStore(util::Clock clock = util::systemNow) : clock_(std::move(clock)) {}

    storage::StoredObject upload(std::istream& content, const uint64_t size, const std::string& ownerId,
                                 const std::string& filename, const std::string& contentType) override {
        std::scoped_lock lock(mtx_);
        if (failUploads_) throw error::BackendUnavailable("object store", "simulated upload failure");
        const auto name = storage::makeObjectName(ownerId, clock_(), fmt::format("{:08x}", ++counter_), filename);
        return store(content, size, name, filename, contentType);
    }

    storage::StoredObject uploadAs(std::istream& content, const uint64_t size, const std::string& name,
                                   const std::string& contentType) override {
        std::scoped_lock lock(mtx_);
        const auto filename = name.substr(name.rfind('/') + 1);
        if (failUploads_ || (failThumbnailUploads_ && filename.starts_with("thumb_")))
            throw error::BackendUnavailable("object store", "simulated upload failure");
        return store(content, size, name, filename, contentType);
    }

    bool remove(const std::string& name) override {
        std::scoped_lock lock(mtx_);
        removed_.push_back(name);
        if (failRemoves_) throw error::BackendUnavailable("object store", "simulated delete failure");
        return objects_.erase(name) > 0;
    }

    std::string signUrl(const std::string& name, const std::chrono::seconds ttl) override {
        std::scoped_lock lock(mtx_);
        return signLocked(name, ttl);
    }

    std::chrono::seconds defaultTtl() const override { return std::chrono::hours(24 * 7); }

    void failUploads(const bool fail) { std::scoped_lock lock(mtx_); failUploads_ = fail; }
    void failThumbnailUploads(const bool fail) { std::scoped_lock lock(mtx_); failThumbnailUploads_ = fail; }
    void failRemoves(const bool fail) { std::scoped_lock lock(mtx_); failRemoves_ = fail; }

    bool contains(const std::string& name) const { std::scoped_lock lock(mtx_); return objects_.contains(name); }
    size_t size() const { std::scoped_lock lock(mtx_); return objects_.size(); }
    std::string content(const std::string& name) const { std::scoped_lock lock(mtx_); return objects_.at(name); }
    std::vector<Upload> uploads() const { std::scoped_lock lock(mtx_); return uploads_; }
    std::vector<std::string> removed() const { std::scoped_lock lock(mtx_); return removed_; }

private:
    mutable std::mutex mtx_;
    util::Clock clock_;
    std::map<std::string, std::string> objects_;
    std::vector<Upload> uploads_;
    std::vector<std::string> removed_;
    uint32_t counter_ = 0;
    bool failUploads_ = false, failThumbnailUploads_ = false, failRemoves_ = false;

    storage::StoredObject store(std::istream& content, const uint64_t size, const std::string& name,
                                const std::string& filename, const std::string& contentType) {
        std::string bytes(size, '\0');
        if (!content.read(bytes.data(), static_cast<std::streamsize>(size)))
            throw error::BackendUnavailable("object store", "short read from upload stream");

        objects_[name] = std::move(bytes);
        uploads_.push_back({name, filename, contentType, size});
        return {name, signLocked(name, defaultTtl())};
    }

    std::string signLocked(const std::string& name, const std::chrono::seconds ttl) const {
        const auto signedAt = std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch());
        return fmt::format("memory://media-files/{}?signed={}&expires={}", name, signedAt.count(), ttl.count());
    }
};

}
