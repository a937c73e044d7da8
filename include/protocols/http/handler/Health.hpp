#pragma once

#include "protocols/http/model/Response.hpp"
#include "protocols/http/types.hpp"


namespace rh::protocols::http::handler {

struct Health {
    static model::Response handle(request&& req);
};

}
