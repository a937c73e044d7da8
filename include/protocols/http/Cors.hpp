#pragma once

#include "config/Config.hpp"

#include <boost/beast/http.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace rh::protocols::http {

class Cors {
public:
    explicit Cors(config::CorsConfig cfg);

    [[nodiscard]] bool isAllowed(std::string_view origin) const;

    // Adds Allow-Origin / Allow-Credentials when the request's Origin is allowed
    template<class Body, class Fields>
    void decorate(const boost::beast::http::request<boost::beast::http::string_body>& req,
                  boost::beast::http::response<Body, Fields>& res) const {
        namespace bhttp = boost::beast::http;
        res.set(bhttp::field::vary, "Origin");

        const auto it = req.find(bhttp::field::origin);
        if (it == req.end()) return;

        const std::string_view origin{it->value().data(), it->value().size()};
        if (!isAllowed(origin)) return;

        res.set(bhttp::field::access_control_allow_origin, std::string(origin));
        if (cfg_.allow_credentials) res.set(bhttp::field::access_control_allow_credentials, "true");
    }

    [[nodiscard]] boost::beast::http::response<boost::beast::http::string_body>
    preflight(const boost::beast::http::request<boost::beast::http::string_body>& req) const;

private:
    config::CorsConfig cfg_;
};

}
