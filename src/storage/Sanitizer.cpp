#include "storage/Sanitizer.hpp"
#include "storage/Error.hpp"

using namespace rh::storage;

bool Sanitizer::isSafe(const std::string_view name) {
    if (name.empty()) return false;
    if (name == "." || name == "..") return false;
    if (name.find_first_of("/\\") != std::string_view::npos) return false;
    if (name.find('\0') != std::string_view::npos) return false;
    return true;
}

void Sanitizer::validate(const std::string_view name) {
    if (!isSafe(name)) throw Error(Error::Reason::PathTraversal, "Invalid filename");
}
