#pragma once

#include "types/Media.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

namespace mv::types {

struct PageRequest {
    static constexpr unsigned int DEFAULT_PAGE_SIZE = 20;

    unsigned int page = 1;  // 1-indexed
    unsigned int page_size = DEFAULT_PAGE_SIZE;

    [[nodiscard]] uint64_t offset() const { return static_cast<uint64_t>(page - 1) * page_size; }
};

template <typename T>
struct Page {
    std::vector<std::shared_ptr<T>> items;
    uint64_t total = 0;  // all matches, independent of the window
    unsigned int page = 1;
    unsigned int page_size = PageRequest::DEFAULT_PAGE_SIZE;
};

using MediaPage = Page<MediaRecord>;

inline void to_json(nlohmann::json& j, const MediaPage& p) {
    nlohmann::json items;
    to_json(items, p.items);
    j = {
        {"items", items},
        {"total", p.total},
        {"page", p.page},
        {"pageSize", p.page_size}
    };
}

}
