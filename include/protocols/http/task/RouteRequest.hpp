#pragma once

#include "concurrency/Task.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"

namespace rh::protocols::http::task {

struct RouteRequest final : concurrency::Task {
    std::shared_ptr<Session> session;
    request req;

    RouteRequest(std::shared_ptr<Session> s, request&& r) : session(std::move(s)), req(std::move(r)) {}

    void operator()() override {
        session->deliver(session->router().route(std::move(req)));
    }
};

}
