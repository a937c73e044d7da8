#include "protocols/http/Cors.hpp"

#include <algorithm>

using namespace rh::protocols::http;
namespace bhttp = boost::beast::http;

Cors::Cors(config::CorsConfig cfg) : cfg_(std::move(cfg)) {}

bool Cors::isAllowed(const std::string_view origin) const {
    if (origin.empty()) return false;
    return std::any_of(cfg_.allowed_origins.begin(), cfg_.allowed_origins.end(),
                       [&](const std::string& o) { return o == "*" || o == origin; });
}

bhttp::response<bhttp::string_body> Cors::preflight(const bhttp::request<bhttp::string_body>& req) const {
    bhttp::response<bhttp::string_body> res{bhttp::status::no_content, req.version()};
    res.set(bhttp::field::server, "Reelhall");
    res.set(bhttp::field::access_control_allow_methods, "GET, POST, DELETE, HEAD, OPTIONS");

    if (const auto it = req.find(bhttp::field::access_control_request_headers); it != req.end())
        res.set(bhttp::field::access_control_allow_headers, it->value());
    else
        res.set(bhttp::field::access_control_allow_headers, "Content-Type, Range");

    res.set(bhttp::field::access_control_max_age, "600");
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    decorate(req, res);
    return res;
}
