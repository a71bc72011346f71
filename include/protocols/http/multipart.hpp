#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mv::protocols::http::multipart {

struct Part {
    std::string name;
    std::optional<std::string> filename;
    std::string content_type;     // empty when the part carries none
    std::string_view body;        // view into the request body
};

// Extracts the boundary parameter from a multipart/form-data Content-Type
std::string boundaryFrom(std::string_view contentType);

// Throws error::ValidationError on malformed input
std::vector<Part> parse(std::string_view body, std::string_view boundary);

const Part* find(const std::vector<Part>& parts, std::string_view name);

}
