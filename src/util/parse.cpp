#include "util/parse.hpp"

#include <charconv>
#include <stdexcept>

namespace rh::util {

std::string url_decode(const std::string_view value, const bool plusAsSpace) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%') {
            unsigned int hex = 0;
            if (i + 2 >= value.length())
                throw std::runtime_error("Invalid percent-encoding in URL");
            const auto* first = value.data() + i + 1;
            const auto [ptr, ec] = std::from_chars(first, first + 2, hex, 16);
            if (ec != std::errc{} || ptr != first + 2) throw std::runtime_error("Invalid percent-encoding in URL");
            result += static_cast<char>(hex);
            i += 2;
        }
        else if (value[i] == '+' && plusAsSpace) result += ' ';
        else result += value[i];
    }
    return result;
}

std::string_view stripQuery(const std::string_view target) {
    return target.substr(0, target.find('?'));
}

}
