#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "concurrency/ThreadPool.hpp"

using namespace rh::protocols::http;

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router,
               std::shared_ptr<concurrency::ThreadPool> pool, const Session::Limits limits)
    : TcpServerBase(ioc, endpoint, protocols::TcpServerOptions{
          .acceptConcurrency = 1,
          .useStrand = true,
          .channel = protocols::LogChannel::Http
      }),
      router_(std::move(router)), pool_(std::move(pool)), limits_(limits) {}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), router_, pool_, limits_)->run();
}
