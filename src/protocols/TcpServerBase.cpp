#include "protocols/TcpServerBase.hpp"
#include "log/Registry.hpp"

#include <utility>

namespace rh::protocols {

TcpServerBase::TcpServerBase(asio::io_context& ioc,
                             const tcp::endpoint& endpoint,
                             const TcpServerOptions opts)
    : ioc_(ioc), acceptor_(ioc), opts_(opts) { init_acceptor(acceptor_, endpoint); }

void TcpServerBase::run() {
    logStart();

    const auto n = (opts_.acceptConcurrency == 0) ? 1u : opts_.acceptConcurrency;
    for (unsigned int i = 0; i < n; ++i) doAccept();
}

void TcpServerBase::close() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) self->logger()->debug("[{}] close: {}", self->serverName(), ec.message());
    });
}

void TcpServerBase::onAcceptError(const beast::error_code& ec) {
    logger()->debug("[{}] accept error: {}", serverName(), ec.message());
}

std::shared_ptr<spdlog::logger> TcpServerBase::logger() const {
    switch (opts_.channel) {
    case LogChannel::Http:    return log::Registry::http();
    case LogChannel::General:
    default: return log::Registry::reelhall();
    }
}

void TcpServerBase::logStart() const {
    logger()->info("[{}] Listening on {}", serverName(), endpointToString(acceptor_.local_endpoint()));
}

void TcpServerBase::doAccept() {
    auto self = shared_from_this();

    auto handler = [self](const beast::error_code& ec, tcp::socket socket) mutable {
        if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) return; // shutting down

        self->doAccept(); // re-arm ASAP

        if (ec) {
            self->onAcceptError(ec);
            return;
        }

        self->onAccept(std::move(socket));
    };

    if (opts_.useStrand) acceptor_.async_accept(asio::make_strand(ioc_), std::move(handler));
    else acceptor_.async_accept(std::move(handler));
}

}
