#pragma once

#include "protocols/http/model/Response.hpp"
#include "protocols/http/types.hpp"
#include "protocols/http/model/Context.hpp"

#include <string>

namespace rh::protocols::http::handler {

// GET|HEAD /api/stream/{name}; honours Range for video types
struct Stream {
    static model::Response handle(request&& req, const model::Context& ctx, const std::string& storedName);
};

}
