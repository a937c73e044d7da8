#pragma once

#include "protocols/TcpServerBase.hpp"
#include "protocols/http/Session.hpp"

#include <memory>

namespace rh::concurrency { class ThreadPool; }

namespace rh::protocols::http {

namespace net = boost::asio;
using tcp = net::ip::tcp;

class Router;

class Server final : public TcpServerBase {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router,
           std::shared_ptr<concurrency::ThreadPool> pool, Session::Limits limits);

private:
    std::shared_ptr<const Router> router_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    Session::Limits limits_;

    std::string_view serverName() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;
};

}
