#pragma once

#include "protocols/http/model/Response.hpp"
#include "protocols/http/types.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <optional>

namespace rh::concurrency { class ThreadPool; }

namespace rh::protocols::http {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

class Router;

// One keep-alive connection. Reading and writing happen on the socket's strand;
// routing runs on the worker pool and the response is posted back here.
class Session : public std::enable_shared_from_this<Session> {
public:
    struct Limits {
        uint32_t headerBytes;
        uint64_t bodyBytes;       // hard parser limit, upload ceiling plus multipart slack
        uint64_t maxUploadBytes;  // reported to the client
    };

    Session(tcp::socket socket, std::shared_ptr<const Router> router,
            std::shared_ptr<concurrency::ThreadPool> pool, Limits limits);

    void run();

    // Thread-safe; called from a worker once routing finished
    void deliver(model::Response res);

    [[nodiscard]] const Router& router() const noexcept { return *router_; }

private:
    void do_read();
    void on_header(beast::error_code ec, std::size_t bytes);
    void read_body();
    void on_read(beast::error_code ec, std::size_t bytes);
    void write(model::Response res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void rejectTooLarge();
    void do_close();

    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<string_body>> parser_;

    std::shared_ptr<const Router> router_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    Limits limits_;
};

}
