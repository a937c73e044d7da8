#include "protocols/http/handler/Health.hpp"
#include "protocols/http/Router.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

rh::protocols::http::model::Response
rh::protocols::http::handler::Health::handle(request&& req) {
    return Router::makeJsonResponse(req, {
        {"status", "OK"},
        {"timestamp", util::getCurrentTimestamp()}
    });
}
