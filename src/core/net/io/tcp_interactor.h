#pragma once

#include "core/error.h"
#include "core/executor.h"
#include "core/net/acceptor.h"
#include "core/net/connector.h"
#include "util/data_block.h"
#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace core::net::io {

enum class TcpInteractorMode { Client, Server };

// Upper bound for one frame body; a larger length prefix is treated as garbage.
constexpr std::size_t kMaxFrameSize = 16 * 1024 * 1024;
constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

template<typename T>
struct Received {
    std::error_code ec;
    T message{};
};

// Length-prefixed frame stream over one TCP connection. Frames are written by a
// single writer coroutine draining a queue, so concurrent senders never interleave
// bytes of different frames. Everything runs on the executor's io_context thread.
class TcpInteractor : public std::enable_shared_from_this<TcpInteractor> {
  public:
    TcpInteractor(Executor& executor, std::string_view host, std::uint16_t port);

    // Server mode listens on 127.0.0.1:port right away; port 0 picks a free port.
    TcpInteractor(Executor& executor, std::uint16_t port);

    ~TcpInteractor();

    TcpInteractor(const TcpInteractor&) = delete;
    TcpInteractor& operator=(const TcpInteractor&) = delete;

    TcpInteractorMode mode() const { return mode_; }
    std::uint16_t local_port() const;

    // Connects (client) or accepts one peer (server).
    asio::awaitable<std::error_code> open();
    void close();

    bool is_connected() const { return connected_; }

    // Completes once the frame is on the wire. A waiter that is cancelled does not
    // withdraw the frame: a queued frame is always written whole or not at all.
    asio::awaitable<std::error_code> send_frame(ConstDataBlock body);
    asio::awaitable<Received<std::vector<std::byte>>> receive_frame();

    template<util::ProtobufMessage T>
    asio::awaitable<std::error_code> send_message(const T& message) {
        const size_t size = message.ByteSizeLong();
        if (send_buffer_.size() < size) {
            send_buffer_.resize(size);
        }
        if (!message.SerializeToArray(send_buffer_.data(), static_cast<int>(size))) {
            co_return make_error_code(Errc::protocol_violation);
        }
        co_return co_await send_frame(ConstDataBlock(send_buffer_.data(), size));
    }

    template<util::ProtobufMessage T>
    asio::awaitable<Received<T>> receive_message() {
        auto frame = co_await receive_frame();
        Received<T> result;
        result.ec = frame.ec;
        if (!result.ec && !util::deserialize(ConstDataBlock(frame.message), result.message)) {
            result.ec = make_error_code(Errc::protocol_violation);
        }
        co_return result;
    }

  private:
    struct PendingSend {
        std::vector<std::byte> data;
        std::unique_ptr<asio::steady_timer> completion;
        std::optional<std::error_code> result;
    };

    asio::awaitable<void> process_send_queue();
    void fail_pending_sends(std::error_code ec);

    Executor& executor_;
    asio::ip::tcp::socket socket_;
    TcpInteractorMode mode_;

    std::optional<Connector> connector_;
    std::string host_;
    std::uint16_t port_;

    std::optional<Acceptor> acceptor_;

    bool connected_ = false;

    std::vector<std::byte> send_buffer_;
    std::deque<std::shared_ptr<PendingSend>> send_queue_;
    bool send_in_progress_ = false;
};

} // namespace core::net::io
