#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/task/RouteRequest.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/util.hpp"
#include "log/Registry.hpp"

using namespace rh::protocols::http;

namespace bhttp = boost::beast::http;
namespace asio = boost::asio;

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router,
                 std::shared_ptr<concurrency::ThreadPool> pool, const Limits limits)
    : socket_(std::move(socket)), router_(std::move(router)), pool_(std::move(pool)), limits_(limits) {}

void Session::run() {
    // Accepted on a strand; make sure the first read starts there too
    asio::dispatch(socket_.get_executor(), [self = shared_from_this()] { self->do_read(); });
}

void Session::do_read() {
    parser_.emplace();
    parser_->header_limit(limits_.headerBytes);
    parser_->body_limit(limits_.bodyBytes);

    bhttp::async_read_header(socket_, buffer_, *parser_,
                             [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                                 self->on_header(ec, bytes);
                             });
}

void Session::on_header(beast::error_code ec, std::size_t) {
    if (ec == bhttp::error::end_of_stream) return do_close();

    if (ec) {
        log::Registry::http()->debug("[Session] Header read error: {}", ec.message());
        return do_close();
    }

    // Refuse before reading a single body byte
    if (const auto len = parser_->content_length(); len && *len > limits_.bodyBytes) return rejectTooLarge();

    const auto& req = parser_->get();
    if (const auto it = req.find(field::expect); it != req.end() && beast::iequals(it->value(), "100-continue")) {
        auto cont = std::make_shared<bhttp::response<bhttp::empty_body>>(bhttp::status::continue_, req.version());
        bhttp::async_write(socket_, *cont, [self = shared_from_this(), cont](beast::error_code wec, std::size_t) {
            if (wec) {
                log::Registry::http()->debug("[Session] Write error: {}", wec.message());
                return self->do_close();
            }
            self->read_body();
        });
        return;
    }

    read_body();
}

void Session::read_body() {
    bhttp::async_read(socket_, buffer_, *parser_,
                      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                          self->on_read(ec, bytes);
                      });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == bhttp::error::body_limit) return rejectTooLarge();
    if (ec == bhttp::error::end_of_stream) return do_close();

    if (ec) {
        log::Registry::http()->debug("[Session] Read error: {}", ec.message());
        return do_close();
    }

    auto req = parser_->release();
    log::Registry::http()->debug("[Session] Read {} bytes: {} {}", bytes,
                                 std::string(req.method_string()), std::string(req.target()));

    if (!pool_->submit(std::make_shared<task::RouteRequest>(shared_from_this(), std::move(req)))) {
        log::Registry::http()->debug("[Session] Worker pool stopped, dropping connection");
        do_close();
    }
}

void Session::deliver(model::Response res) {
    asio::post(socket_.get_executor(),
               [self = shared_from_this(), res = std::move(res)]() mutable { self->write(std::move(res)); });
}

void Session::write(model::Response res) {
    std::visit([self = shared_from_this()](auto&& response) {
        using T = std::decay_t<decltype(response)>;
        auto msg = std::make_shared<T>(std::move(response));
        const bool close = msg->need_eof();
        bhttp::async_write(self->socket_, *msg,
                           [self, msg, close](beast::error_code ec, std::size_t bytes) {
                               self->on_write(close, ec, bytes);
                           });
    }, std::move(res));
}

void Session::on_write(const bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        // Client went away mid-response
        log::Registry::http()->debug("[Session] Write error: {}", ec.message());
        return do_close();
    }

    if (close) return do_close();

    do_read();
}

void Session::rejectTooLarge() {
    request hdr{parser_->get().base()};
    log::Registry::http()->info("[Session] Rejected oversized request body for {}", std::string(hdr.target()));
    const auto msg = "File too large. Limit is " + config::bytesToFractionalMbStr(limits_.maxUploadBytes);
    write(router_->reject(hdr, msg, status::bad_request));
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        log::Registry::http()->debug("[Session] Shutdown error: {}", ec.message());
}
