#include "storage/ObjectName.hpp"

#include <filesystem>

namespace mv::storage {

std::string fileExtension(const std::string& filename) {
    // client names may carry a directory part
    return std::filesystem::path(filename).filename().extension().string();
}

std::string fileStem(const std::string& filename) {
    return std::filesystem::path(filename).filename().stem().string();
}

std::string makeObjectName(const std::string& ownerId, const util::Timestamp now,
                           const std::string& random, const std::string& filename) {
    return ownerId + "/" + util::compactTimestamp(now) + "_" + random + fileExtension(filename);
}

std::string thumbnailObjectName(const std::string& objectName) {
    const auto slash = objectName.rfind('/');
    const auto dir = slash == std::string::npos ? std::string() : objectName.substr(0, slash + 1);
    return dir + "thumb_" + fileStem(objectName.substr(dir.size())) + ".jpg";
}

}
