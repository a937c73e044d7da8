#pragma once

#include "protocols/http/body/FileRangeBody.hpp"

#include <boost/beast/http.hpp>
#include <variant>

namespace rh::protocols::http::model {

namespace http = boost::beast::http;

using Response = std::variant<
    http::response<http::string_body>,
    http::response<body::FileRangeBody>
>;

}
