#include "protocols/http/Multipart.hpp"
#include "util/parse.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rh::protocols::http::multipart {

namespace {

void trim(std::string_view& s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

std::string unquote(std::string_view v) {
    trim(v);
    if (v.size() < 2 || v.front() != '"' || v.back() != '"') return std::string(v);
    v = v.substr(1, v.size() - 2);

    std::string out;
    out.reserve(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (v[i] == '\\' && i + 1 < v.size()) ++i;
        out += v[i];
    }
    return out;
}

// Splits "a; b=\"x;y\"; c" on semicolons outside quotes
std::vector<std::string_view> splitParams(std::string_view header) {
    std::vector<std::string_view> out;
    bool quoted = false;
    std::size_t begin = 0;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const char c = header[i];
        if (c == '\\' && quoted) { ++i; continue; }
        if (c == '"') quoted = !quoted;
        else if (c == ';' && !quoted) {
            out.push_back(header.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    out.push_back(header.substr(begin));
    return out;
}

void applyContentDisposition(Part& part, const std::string_view value) {
    std::optional<std::string> extendedFilename;

    for (auto param : splitParams(value)) {
        trim(param);
        const auto eq = param.find('=');
        if (eq == std::string_view::npos) continue;

        auto key = param.substr(0, eq);
        trim(key);
        const auto k = lower(key);
        const auto v = param.substr(eq + 1);

        if (k == "name") part.name = unquote(v);
        else if (k == "filename") part.filename = unquote(v);
        else if (k == "filename*") {
            // RFC 5987: charset'lang'percent-encoded
            const auto raw = unquote(v);
            const auto tick = raw.find('\'');
            const auto tick2 = tick == std::string::npos ? std::string::npos : raw.find('\'', tick + 1);
            if (tick2 != std::string::npos) extendedFilename = util::url_decode(raw.substr(tick2 + 1));
        }
    }

    if (extendedFilename) part.filename = std::move(extendedFilename);
}

}

std::optional<std::string> boundaryFrom(const std::string_view contentType) {
    const auto params = splitParams(contentType);
    if (params.empty()) return std::nullopt;

    auto mediaType = params.front();
    trim(mediaType);
    if (lower(mediaType) != "multipart/form-data") return std::nullopt;

    for (std::size_t i = 1; i < params.size(); ++i) {
        auto param = params[i];
        trim(param);
        const auto eq = param.find('=');
        if (eq == std::string_view::npos) continue;
        auto key = param.substr(0, eq);
        trim(key);
        if (lower(key) != "boundary") continue;
        auto boundary = unquote(param.substr(eq + 1));
        if (boundary.empty() || boundary.size() > 70) return std::nullopt;
        return boundary;
    }
    return std::nullopt;
}

std::vector<Part> parse(const std::string_view body, const std::string_view boundary) {
    if (boundary.empty()) throw std::invalid_argument("Empty multipart boundary");

    const std::string delimiter = "--" + std::string(boundary);
    const std::string separator = "\r\n" + delimiter;

    std::vector<Part> parts;

    auto pos = body.find(delimiter);
    if (pos == std::string_view::npos) throw std::invalid_argument("Multipart boundary not found");
    // A preamble, if any, must end with CRLF before the first delimiter
    if (pos != 0 && (pos < 2 || body.substr(pos - 2, 2) != "\r\n"))
        throw std::invalid_argument("Malformed multipart preamble");

    while (true) {
        pos += delimiter.size();

        if (body.substr(pos, 2) == "--") return parts;  // close delimiter

        // transport padding is allowed before the CRLF
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) ++pos;
        if (body.substr(pos, 2) != "\r\n") throw std::invalid_argument("Malformed multipart delimiter");
        pos += 2;

        Part part;
        while (true) {
            const auto eol = body.find("\r\n", pos);
            if (eol == std::string_view::npos) throw std::invalid_argument("Unterminated multipart headers");
            const auto line = body.substr(pos, eol - pos);
            pos = eol + 2;
            if (line.empty()) break;

            const auto colon = line.find(':');
            if (colon == std::string_view::npos) throw std::invalid_argument("Malformed multipart header");

            auto name = line.substr(0, colon);
            auto value = line.substr(colon + 1);
            trim(name);
            trim(value);

            const auto key = lower(name);
            if (key == "content-disposition") applyContentDisposition(part, value);
            else if (key == "content-type") part.contentType = std::string(value);
        }

        const auto next = body.find(separator, pos);
        if (next == std::string_view::npos) throw std::invalid_argument("Unterminated multipart body");

        part.data = body.substr(pos, next - pos);
        parts.push_back(std::move(part));

        pos = next + 2;
    }
}

std::optional<Part> findField(const std::vector<Part>& parts, const std::string_view name) {
    const auto it = std::ranges::find_if(parts, [&](const Part& p) { return p.name == name; });
    if (it == parts.end()) return std::nullopt;
    return *it;
}

}
