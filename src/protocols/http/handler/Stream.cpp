#include "protocols/http/handler/Stream.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Range.hpp"
#include "storage/Manager.hpp"
#include "storage/FileHandle.hpp"
#include "storage/Error.hpp"
#include "util/mime.hpp"
#include "log/Registry.hpp"

using namespace rh::protocols::http;
using namespace rh::protocols::http::handler;

namespace {

template<class Body>
void setCommonHeaders(response<Body>& res, const std::string& mime, const bool rangeable) {
    res.set(field::server, "Reelhall");
    res.set(field::content_type, mime);
    if (rangeable) res.set(field::accept_ranges, "bytes");
}

}

model::Response Stream::handle(request&& req, const model::Context& ctx, const std::string& storedName) {
    try {
        const auto file = ctx.storage->open(storedName);
        const auto mime = util::mimeTypeFor(storedName).value_or("application/octet-stream");
        const bool rangeable = util::isStreamable(mime);

        std::optional<std::string_view> rangeHeader;
        if (const auto it = req.find(field::range); it != req.end())
            rangeHeader = std::string_view{it->value().data(), it->value().size()};

        const auto r = range::resolve(file->size(), rangeHeader, rangeable);
        const auto s = static_cast<status>(r.status());

        if (r.kind == range::Resolution::Kind::Unsatisfiable) {
            auto res = Router::makeErrorResponse(req, "Range not satisfiable", s);
            res.set(field::content_range, r.contentRange());
            return res;
        }

        if (req.method() == verb::head) {
            string_response res{s, req.version()};
            setCommonHeaders(res, mime, rangeable);
            if (r.kind == range::Resolution::Kind::Partial) res.set(field::content_range, r.contentRange());
            res.content_length(r.contentLength());
            return res;
        }

        range_response res{s, req.version()};
        setCommonHeaders(res, mime, rangeable);
        if (r.kind == range::Resolution::Kind::Partial) res.set(field::content_range, r.contentRange());
        res.body().reset(file, r.start, r.contentLength());
        res.prepare_payload();
        return res;
    } catch (const storage::Error& e) {
        if (e.reason() == storage::Error::Reason::PathTraversal)
            return Router::makeErrorResponse(req, "Invalid filename", status::bad_request);
        return Router::makeErrorResponse(req, "File not found", status::not_found);
    } catch (const std::exception& e) {
        log::Registry::http()->error("[Stream] Failed to stream {}: {}", storedName, e.what());
        return Router::makeErrorResponse(req, "Failed to stream file", status::internal_server_error);
    }
}
