#include "acceptor.h"
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

namespace core::net {
Acceptor::~Acceptor() {
    close();
}

void Acceptor::listen(std::uint16_t port) {
    const asio::ip::tcp::endpoint endpoint(asio::ip::address_v4::loopback(), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    spdlog::debug("[Acceptor::listen] Listening on 127.0.0.1:{}", local_port());
}

std::uint16_t Acceptor::local_port() const {
    asio::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

asio::awaitable<std::error_code> Acceptor::accept() {
    if (socket_.is_open()) {
        asio::error_code ignored;
        socket_.close(ignored);
    }
    asio::error_code ec;
    co_await acceptor_.async_accept(socket_, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[Acceptor::accept] accept failed: {}", ec.message());
        co_return ec;
    }
    const auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        spdlog::debug("[Acceptor::accept] Connection accepted from {}:{}",
                      endpoint.address().to_string(),
                      endpoint.port());
    }
    co_return std::error_code{};
}

void Acceptor::close() {
    if (acceptor_.is_open()) {
        asio::error_code ignored;
        acceptor_.close(ignored);
    }
}
} // namespace core::net
