#pragma once

#include "protocols/http/model/Response.hpp"
#include "protocols/http/types.hpp"
#include "protocols/http/model/Context.hpp"

#include <string>

namespace rh::protocols::http::handler {

struct Files {
    // GET /api/videos, /api/files
    static model::Response list(request&& req, const model::Context& ctx);

    // POST /api/upload, multipart field "file"
    static model::Response upload(request&& req, const model::Context& ctx);

    // DELETE /api/videos/{name}, /api/files/{name}
    static model::Response remove(request&& req, const model::Context& ctx, const std::string& storedName);
};

}
