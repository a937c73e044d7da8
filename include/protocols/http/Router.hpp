#pragma once

#include "protocols/http/model/Response.hpp"
#include "protocols/http/model/Context.hpp"
#include "protocols/http/Cors.hpp"
#include "protocols/http/types.hpp"

#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>

namespace rh::protocols::http {

class Router {
public:
    Router(model::Context ctx, Cors cors);

    // Never throws: anything a handler lets escape becomes a 500
    model::Response route(request&& req) const;

    // Error produced outside route() (transport limits), still carrying CORS headers
    [[nodiscard]] string_response reject(const request& req, const std::string& msg, status s) const;

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j,
                                            status s = status::ok);

    // {"error": msg}
    static string_response makeErrorResponse(const request& req, const std::string& msg,
                                             status s = status::not_found);

private:
    model::Context ctx_;
    Cors cors_;

    model::Response dispatch(request&& req) const;
};

}
