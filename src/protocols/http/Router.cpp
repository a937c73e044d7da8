#include "protocols/http/Router.hpp"
#include "protocols/http/handler/Health.hpp"
#include "protocols/http/handler/Files.hpp"
#include "protocols/http/handler/Stream.hpp"
#include "protocols/http/handler/Static.hpp"
#include "log/Registry.hpp"
#include "util/parse.hpp"

#include <nlohmann/json.hpp>
#include <optional>

using namespace rh::protocols::http;
using namespace rh::util;

namespace {

constexpr std::string_view VIDEOS_PREFIX = "/api/videos/";
constexpr std::string_view FILES_PREFIX  = "/api/files/";
constexpr std::string_view STREAM_PREFIX = "/api/stream/";

// Decoded trailing segment, or nullopt when the remainder has more than one segment
std::optional<std::string> nameSegment(const std::string_view path, const std::string_view prefix) {
    const auto rest = path.substr(prefix.size());
    if (rest.empty() || rest.find('/') != std::string_view::npos) return std::nullopt;
    return url_decode(rest);
}

}

Router::Router(model::Context ctx, Cors cors) : ctx_(std::move(ctx)), cors_(std::move(cors)) {}

model::Response Router::route(request&& req) const {
    const request origin{req.base()};

    model::Response res = [&]() -> model::Response {
        try {
            return dispatch(std::move(req));
        } catch (const std::exception& e) {
            log::Registry::http()->error("[Router] Unhandled error for {} {}: {}",
                                         std::string(origin.method_string()), std::string(origin.target()), e.what());
            return makeErrorResponse(origin, "Internal server error", status::internal_server_error);
        }
    }();

    std::visit([&](auto& r) {
        cors_.decorate(origin, r);
        r.keep_alive(origin.keep_alive());
    }, res);

    log::Registry::http()->debug("[Router] {} {} -> {}", std::string(origin.method_string()),
                                 std::string(origin.target()),
                                 std::visit([](const auto& r) { return r.result_int(); }, res));
    return res;
}

model::Response Router::dispatch(request&& req) const {
    const auto method = req.method();
    const std::string_view path = stripQuery({req.target().data(), req.target().size()});

    if (method == verb::options) return cors_.preflight(req);

    if (path == "/health" && method == verb::get) return handler::Health::handle(std::move(req));

    if ((path == "/api/videos" || path == "/api/files") && method == verb::get)
        return handler::Files::list(std::move(req), ctx_);

    if (path == "/api/upload" && method == verb::post)
        return handler::Files::upload(std::move(req), ctx_);

    const auto withName = [&](const std::string_view prefix, auto&& fn) -> std::optional<model::Response> {
        if (!path.starts_with(prefix)) return std::nullopt;
        std::optional<std::string> name;
        try {
            name = nameSegment(path, prefix);
        } catch (const std::exception&) {
            return makeErrorResponse(req, "Invalid filename", status::bad_request);
        }
        if (!name) return makeErrorResponse(req, "Not found", status::not_found);
        return fn(*name);
    };

    if (method == verb::delete_) {
        for (const auto prefix : {VIDEOS_PREFIX, FILES_PREFIX})
            if (auto r = withName(prefix, [&](const std::string& n) -> model::Response {
                return handler::Files::remove(std::move(req), ctx_, n);
            })) return std::move(*r);
    }

    if (method == verb::get || method == verb::head) {
        if (auto r = withName(STREAM_PREFIX, [&](const std::string& n) -> model::Response {
            return handler::Stream::handle(std::move(req), ctx_, n);
        })) return std::move(*r);

        const auto mount = ctx_.publicPrefix + "/";
        if (auto r = withName(mount, [&](const std::string& n) -> model::Response {
            return handler::Static::handle(std::move(req), ctx_, n);
        })) return std::move(*r);
    }

    return makeErrorResponse(req, "Not found", status::not_found);
}

string_response Router::reject(const request& req, const std::string& msg, const status s) const {
    auto res = makeErrorResponse(req, msg, s);
    cors_.decorate(req, res);
    res.keep_alive(false);
    return res;
}

string_response Router::makeJsonResponse(const request& req, const nlohmann::json& j, const status s) {
    string_response res{s, req.version()};
    res.set(field::server, "Reelhall");
    res.set(field::content_type, "application/json");
    res.body() = j.dump();
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

string_response Router::makeErrorResponse(const request& req, const std::string& msg, const status s) {
    return makeJsonResponse(req, nlohmann::json{{"error", msg}}, s);
}
