#pragma once

#include "protocols/http/model/Response.hpp"
#include "protocols/http/types.hpp"
#include "protocols/http/model/Context.hpp"

#include <string>

namespace rh::protocols::http::handler {

// GET|HEAD <public_prefix>/{name}: the whole file, no range handling
struct Static {
    static model::Response handle(request&& req, const model::Context& ctx, const std::string& storedName);
};

}
