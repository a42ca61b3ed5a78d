#include "connector.h"
#include <asio/connect.hpp>
#include <asio/error_code.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace core::net {
asio::awaitable<std::error_code> Connector::connect(std::string_view host, std::uint16_t port) {
    asio::ip::tcp::resolver resolver(socket_.get_executor());
    asio::error_code ec;
    const auto endpoints = co_await resolver.async_resolve(std::string(host),
                                                           std::to_string(port),
                                                           asio::redirect_error(asio::use_awaitable,
                                                                                ec));
    if (ec) {
        spdlog::warn("[Connector::connect] Failed to resolve {}: {}", host, ec.message());
        co_return ec;
    }

    co_await asio::async_connect(socket_, endpoints, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("[Connector::connect] Failed to connect to {}:{} - {}", host, port, ec.message());
        if (socket_.is_open()) {
            asio::error_code ignored;
            socket_.close(ignored);
        }
        co_return ec;
    }

    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        spdlog::debug("[Connector::connect] TCP_NODELAY not applied: {}", ec.message());
    }
    spdlog::debug("[Connector::connect] Connected to {}:{}", host, port);
    co_return std::error_code{};
}

void Connector::disconnect() {
    if (!socket_.is_open()) {
        return;
    }
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    spdlog::debug("[Connector::disconnect] Disconnected");
}
} // namespace core::net
