#pragma once

#include <string_view>

namespace rh::storage {

struct Sanitizer {
    // False for empty names, "." and "..", any '/' or '\\', and embedded NULs.
    // Dots inside a single component ("clip..final.mp4") are fine
    [[nodiscard]] static bool isSafe(std::string_view name);

    // Throws storage::Error(PathTraversal) when !isSafe(name)
    static void validate(std::string_view name);
};

}
