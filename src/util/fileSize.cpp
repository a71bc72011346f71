#include "util/fileSize.hpp"

#include <array>
#include <fmt/format.h>

namespace mv::util {

std::string formatFileSize(const uintmax_t bytes) {
    static constexpr std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};

    auto size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < units.size() - 1) {
        size /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", size, units[unit]);
}

}
