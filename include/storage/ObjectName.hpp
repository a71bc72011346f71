#pragma once

#include "util/timestamp.hpp"

#include <string>

namespace mv::storage {

// {ownerId}/{YYYYmmddHHMMSS}_{random}{.ext}, keeping the extension of filename as given
std::string makeObjectName(const std::string& ownerId, util::Timestamp now,
                           const std::string& random, const std::string& filename);

// {ownerId}/thumb_{YYYYmmddHHMMSS}_{random}.jpg for the object named objectName
std::string thumbnailObjectName(const std::string& objectName);

std::string fileExtension(const std::string& filename);
std::string fileStem(const std::string& filename);

}
