#include "protocols/http/handler/Files.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Multipart.hpp"
#include "storage/Manager.hpp"
#include "storage/Error.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace rh::protocols::http;
using namespace rh::protocols::http::handler;

model::Response Files::list(request&& req, const model::Context& ctx) {
    try {
        auto arr = nlohmann::json::array();
        for (const auto& f : ctx.storage->list()) arr.push_back(storage::model::toJson(f, ctx.publicPrefix));
        return Router::makeJsonResponse(req, arr);
    } catch (const std::exception& e) {
        log::Registry::http()->error("[Files] Failed to list {}: {}", ctx.storage->root().string(), e.what());
        return Router::makeErrorResponse(req, "Failed to read files", status::internal_server_error);
    }
}

model::Response Files::upload(request&& req, const model::Context& ctx) {
    const auto ct = req.find(field::content_type);
    const auto boundary = ct == req.end()
        ? std::nullopt
        : multipart::boundaryFrom({ct->value().data(), ct->value().size()});
    if (!boundary) return Router::makeErrorResponse(req, "No file provided", status::bad_request);

    std::vector<multipart::Part> parts;
    try {
        parts = multipart::parse(req.body(), *boundary);
    } catch (const std::invalid_argument& e) {
        log::Registry::http()->debug("[Files] Rejected multipart body: {}", e.what());
        return Router::makeErrorResponse(req, "Malformed multipart body", status::bad_request);
    }

    const auto part = multipart::findField(parts, "file");
    if (!part || !part->filename || part->filename->empty())
        return Router::makeErrorResponse(req, "No file provided", status::bad_request);

    try {
        const auto stored = ctx.storage->store(*part->filename, part->data.size(), part->data);
        auto j = storage::model::toJson(stored, ctx.publicPrefix);
        j.erase("uploadDate");
        j["message"] = "File uploaded successfully";
        return Router::makeJsonResponse(req, j);
    } catch (const storage::Error& e) {
        if (e.reason() == storage::Error::Reason::NotFound)
            return Router::makeErrorResponse(req, e.what(), status::not_found);
        return Router::makeErrorResponse(req, e.what(), status::bad_request);
    } catch (const std::exception& e) {
        log::Registry::http()->error("[Files] Upload of {} failed: {}", *part->filename, e.what());
        return Router::makeErrorResponse(req, "Upload failed", status::internal_server_error);
    }
}

model::Response Files::remove(request&& req, const model::Context& ctx, const std::string& storedName) {
    try {
        ctx.storage->remove(storedName);
        return Router::makeJsonResponse(req, {{"message", "File deleted successfully"}});
    } catch (const storage::Error& e) {
        if (e.reason() == storage::Error::Reason::PathTraversal)
            return Router::makeErrorResponse(req, "Invalid filename", status::bad_request);
        return Router::makeErrorResponse(req, "File not found", status::not_found);
    } catch (const std::exception& e) {
        log::Registry::http()->error("[Files] Failed to delete {}: {}", storedName, e.what());
        return Router::makeErrorResponse(req, "Failed to delete file", status::internal_server_error);
    }
}
