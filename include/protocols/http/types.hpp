#pragma once

#include "protocols/http/body/FileRangeBody.hpp"

#include <boost/beast/http.hpp>

namespace rh::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;

template<class Body>
using response = boost::beast::http::response<Body>;

using string_body = boost::beast::http::string_body;
using range_body  = body::FileRangeBody;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

using string_response = response<string_body>;
using range_response  = response<range_body>;

}
