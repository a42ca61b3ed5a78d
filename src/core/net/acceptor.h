#pragma once

#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>
#include <cstdint>
#include <system_error>

namespace core::net {
// Single-connection listener on the loopback interface. Port 0 picks an ephemeral port.
class Acceptor {
  public:
    explicit Acceptor(asio::ip::tcp::socket& socket)
        : acceptor_(socket.get_executor())
        , socket_(socket) {}
    ~Acceptor();

    Acceptor(const Acceptor&) = delete;
    Acceptor& operator=(const Acceptor&) = delete;

    void listen(std::uint16_t port);
    std::uint16_t local_port() const;
    asio::awaitable<std::error_code> accept();
    void close();

  private:
    asio::ip::tcp::acceptor acceptor_;
    asio::ip::tcp::socket& socket_;
};
} // namespace core::net
