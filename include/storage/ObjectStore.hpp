#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <string>

namespace mv::storage {

struct StoredObject {
    std::string name;  // {owner}/{timestamp}_{random}{ext}
    std::string url;   // signed, read-only
};

// Blob storage for original files and thumbnails. Failures throw error::BackendUnavailable.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Streams size bytes from content under a freshly generated name
    virtual StoredObject upload(std::istream& content,
                                uint64_t size,
                                const std::string& ownerId,
                                const std::string& filename,
                                const std::string& contentType) = 0;

    // Streams size bytes from content under a caller-chosen name
    virtual StoredObject uploadAs(std::istream& content,
                                  uint64_t size,
                                  const std::string& name,
                                  const std::string& contentType) = 0;

    // false when the object did not exist
    virtual bool remove(const std::string& name) = 0;

    virtual std::string signUrl(const std::string& name, std::chrono::seconds ttl) = 0;

    // Lifetime of the URLs returned by upload and expected by readers of stored records
    [[nodiscard]] virtual std::chrono::seconds defaultTtl() const = 0;
};

}
