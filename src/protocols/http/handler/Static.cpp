#include "protocols/http/handler/Static.hpp"
#include "protocols/http/Router.hpp"
#include "storage/Manager.hpp"
#include "storage/FileHandle.hpp"
#include "storage/Error.hpp"
#include "util/mime.hpp"
#include "log/Registry.hpp"

using namespace rh::protocols::http;
using namespace rh::protocols::http::handler;

model::Response Static::handle(request&& req, const model::Context& ctx, const std::string& storedName) {
    try {
        const auto file = ctx.storage->open(storedName);
        const auto mime = util::mimeTypeFor(storedName).value_or("application/octet-stream");

        if (req.method() == verb::head) {
            string_response res{status::ok, req.version()};
            res.set(field::server, "Reelhall");
            res.set(field::content_type, mime);
            res.content_length(file->size());
            return res;
        }

        // Whole file from the descriptor open() returned, Range is not consulted
        range_response res{status::ok, req.version()};
        res.set(field::server, "Reelhall");
        res.set(field::content_type, mime);
        res.body().reset(file, 0, file->size());
        res.prepare_payload();
        return res;
    } catch (const storage::Error& e) {
        if (e.reason() == storage::Error::Reason::PathTraversal)
            return Router::makeErrorResponse(req, "Invalid filename", status::bad_request);
        return Router::makeErrorResponse(req, "File not found", status::not_found);
    } catch (const std::exception& e) {
        log::Registry::http()->error("[Static] Failed to serve {}: {}", storedName, e.what());
        return Router::makeErrorResponse(req, "Failed to stream file", status::internal_server_error);
    }
}
