#include "protocols/http/multipart.hpp"
#include "error/Error.hpp"

#include <algorithm>
#include <cctype>

namespace mv::protocols::http::multipart {

static constexpr std::string_view CRLF = "\r\n";

static std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

static bool iequals(const std::string_view a, const std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

// Splits `value; k=v; k2="v 2"` into parameters; returns the leading value
static std::string_view parseParams(std::string_view header,
                                    std::vector<std::pair<std::string, std::string>>& params) {
    const auto semi = header.find(';');
    const auto value = trim(header.substr(0, semi));
    if (semi == std::string_view::npos) return value;

    auto rest = header.substr(semi + 1);
    while (!rest.empty()) {
        rest = trim(rest);
        const auto eq = rest.find('=');
        if (eq == std::string_view::npos) break;
        std::string key(trim(rest.substr(0, eq)));
        std::ranges::transform(key, key.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        rest.remove_prefix(eq + 1);
        rest = trim(rest);

        std::string val;
        if (!rest.empty() && rest.front() == '"') {
            size_t i = 1;
            for (; i < rest.size() && rest[i] != '"'; ++i) {
                if (rest[i] == '\\' && i + 1 < rest.size()) ++i;
                val.push_back(rest[i]);
            }
            if (i >= rest.size()) throw error::ValidationError("Malformed multipart header: unterminated quote");
            rest.remove_prefix(i + 1);
            const auto next = rest.find(';');
            rest = next == std::string_view::npos ? std::string_view{} : rest.substr(next + 1);
        } else {
            const auto next = rest.find(';');
            val = std::string(trim(rest.substr(0, next)));
            rest = next == std::string_view::npos ? std::string_view{} : rest.substr(next + 1);
        }
        params.emplace_back(std::move(key), std::move(val));
    }
    return value;
}

std::string boundaryFrom(const std::string_view contentType) {
    std::vector<std::pair<std::string, std::string>> params;
    const auto type = parseParams(contentType, params);
    if (!iequals(type, "multipart/form-data")) throw error::ValidationError("Expected multipart/form-data request body");

    for (const auto& [k, v] : params)
        if (k == "boundary" && !v.empty()) return v;
    throw error::ValidationError("multipart/form-data body has no boundary");
}

static Part parseHeaders(std::string_view headers) {
    Part part;
    bool disposition = false;

    while (!headers.empty()) {
        const auto eol = headers.find(CRLF);
        const auto line = headers.substr(0, eol);
        headers = eol == std::string_view::npos ? std::string_view{} : headers.substr(eol + CRLF.size());
        if (line.empty()) continue;

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) throw error::ValidationError("Malformed multipart part header");
        const auto name = trim(line.substr(0, colon));
        const auto value = trim(line.substr(colon + 1));

        if (iequals(name, "Content-Disposition")) {
            std::vector<std::pair<std::string, std::string>> params;
            if (!iequals(parseParams(value, params), "form-data"))
                throw error::ValidationError("Multipart part is not form-data");
            for (auto& [k, v] : params) {
                if (k == "name") part.name = std::move(v);
                else if (k == "filename") part.filename = std::move(v);
            }
            disposition = true;
        } else if (iequals(name, "Content-Type")) {
            part.content_type = std::string(value);
        }
    }

    if (!disposition || part.name.empty()) throw error::ValidationError("Multipart part has no field name");
    return part;
}

std::vector<Part> parse(const std::string_view body, const std::string_view boundary) {
    if (boundary.empty()) throw error::ValidationError("multipart/form-data body has no boundary");

    const std::string delimiter = "--" + std::string(boundary);
    const std::string separator = std::string(CRLF) + delimiter;

    // the first delimiter may follow a preamble
    auto pos = body.find(delimiter);
    if (pos == std::string_view::npos ||
        (pos != 0 && (pos < CRLF.size() || body.substr(pos - CRLF.size(), CRLF.size()) != CRLF)))
        throw error::ValidationError("Malformed multipart body: missing opening boundary");
    pos += delimiter.size();

    std::vector<Part> parts;
    while (true) {
        if (body.substr(pos, 2) == "--") return parts;  // closing delimiter
        if (body.substr(pos, CRLF.size()) != CRLF) throw error::ValidationError("Malformed multipart body: bad boundary line");
        pos += CRLF.size();

        const auto headersEnd = body.find("\r\n\r\n", pos);
        const auto emptyHeaders = body.substr(pos, CRLF.size()) == CRLF;
        if (!emptyHeaders && headersEnd == std::string_view::npos)
            throw error::ValidationError("Malformed multipart body: unterminated part headers");

        Part part = parseHeaders(emptyHeaders ? std::string_view{} : body.substr(pos, headersEnd - pos));
        const auto contentStart = emptyHeaders ? pos + CRLF.size() : headersEnd + 4;

        const auto contentEnd = body.find(separator, contentStart);
        if (contentEnd == std::string_view::npos) throw error::ValidationError("Malformed multipart body: missing closing boundary");

        part.body = body.substr(contentStart, contentEnd - contentStart);
        parts.push_back(std::move(part));

        pos = contentEnd + separator.size();
    }
}

const Part* find(const std::vector<Part>& parts, const std::string_view name) {
    const auto it = std::ranges::find_if(parts, [&](const Part& p) { return p.name == name; });
    return it == parts.end() ? nullptr : &*it;
}

}
