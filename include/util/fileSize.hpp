#pragma once

#include <cstdint>
#include <string>

namespace mv::util {

// Human readable size with two decimals, e.g. "1.50 MB"
std::string formatFileSize(uintmax_t bytes);

}
