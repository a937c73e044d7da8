#include "protocols/http/Range.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace rh::protocols::http::range {

namespace {

void trim(std::string_view& s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
}

bool startsWithCaseInsensitive(const std::string_view s, const std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(), [](const char a, const char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::optional<uint64_t> parseUint(std::string_view token) {
    trim(token);
    if (token.empty()) return std::nullopt;
    uint64_t value = 0;
    const auto* last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

}

std::optional<ByteRange> parse(std::string_view header) {
    static constexpr std::string_view kBytesEqual = "bytes=";

    trim(header);
    if (!startsWithCaseInsensitive(header, kBytesEqual)) return std::nullopt;
    header.remove_prefix(kBytesEqual.size());

    if (header.find(',') != std::string_view::npos) return std::nullopt;

    const auto dash = header.find('-');
    if (dash == std::string_view::npos) return std::nullopt;

    const auto start = parseUint(header.substr(0, dash));
    if (!start) return std::nullopt;

    auto endPart = header.substr(dash + 1);
    trim(endPart);
    if (endPart.empty()) return ByteRange{*start, std::nullopt};

    const auto end = parseUint(endPart);
    if (!end) return std::nullopt;
    return ByteRange{*start, *end};
}

unsigned int Resolution::status() const noexcept {
    switch (kind) {
        case Kind::Full: return 200;
        case Kind::Partial: return 206;
        case Kind::Unsatisfiable: return 416;
    }
    return 200;
}

uint64_t Resolution::contentLength() const noexcept {
    switch (kind) {
        case Kind::Full: return totalSize;
        case Kind::Partial: return end - start + 1;
        case Kind::Unsatisfiable: return 0;
    }
    return 0;
}

std::string Resolution::contentRange() const {
    if (kind == Kind::Partial) return fmt::format("bytes {}-{}/{}", start, end, totalSize);
    if (kind == Kind::Unsatisfiable) return fmt::format("bytes */{}", totalSize);
    return "";
}

Resolution resolve(const uint64_t totalSize, const std::optional<std::string_view> rangeHeader, const bool rangeable) {
    Resolution full{.kind = Resolution::Kind::Full, .start = 0,
                    .end = totalSize ? totalSize - 1 : 0, .totalSize = totalSize};

    if (!rangeable || !rangeHeader) return full;

    const auto requested = parse(*rangeHeader);
    if (!requested) return full;

    if (totalSize == 0 || requested->start >= totalSize ||
        (requested->end && *requested->end < requested->start))
        return {.kind = Resolution::Kind::Unsatisfiable, .start = 0, .end = 0, .totalSize = totalSize};

    return {
        .kind = Resolution::Kind::Partial,
        .start = requested->start,
        .end = std::min(requested->end.value_or(totalSize - 1), totalSize - 1),
        .totalSize = totalSize
    };
}

}
