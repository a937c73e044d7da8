#pragma once

#include <string>
#include <string_view>

namespace rh::util {

// Percent-decodes value; '+' becomes ' ' only when plusAsSpace is set (form encoding)
std::string url_decode(std::string_view value, bool plusAsSpace = false);

// Target with any query string removed
std::string_view stripQuery(std::string_view target);

}
