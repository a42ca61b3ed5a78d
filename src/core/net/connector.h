#pragma once

#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace core::net {
class Connector {
  public:
    explicit Connector(asio::ip::tcp::socket& socket)
        : socket_(socket) {}
    ~Connector() = default;

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    // Resolves host (name or address literal) and tries each endpoint in turn.
    asio::awaitable<std::error_code> connect(std::string_view host, std::uint16_t port);
    void disconnect();

  private:
    asio::ip::tcp::socket& socket_;
};
} // namespace core::net
