#pragma once
#include "core/error.h"
#include "core/executor.h"
#include "core/net/io/tcp_interactor.h"
#include "vault_sync.pb.h"
#include <asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

namespace core::net::io {

constexpr std::uint32_t kProtocolVersion = 1;

template<typename ProtobufType>
bool holds(const vaultsync::Envelope& envelope) {
    return envelope.type() == ProtobufType::descriptor()->full_name();
}

template<typename ProtobufType>
std::optional<ProtobufType> unpack(const vaultsync::Envelope& envelope) {
    if (!holds<ProtobufType>(envelope)) {
        return std::nullopt;
    }
    return util::deserialize<ProtobufType>(util::as_block(envelope.payload()));
}

// One peer of the sync protocol: frames carry Envelopes, the receive loop checks
// the protocol version and hands each envelope to handle_message(). Derived
// classes are owned by std::shared_ptr; the loop keeps its session alive.
class Session : public std::enable_shared_from_this<Session> {
  public:
    Session(core::Executor& executor, std::string_view host, std::uint16_t port);
    Session(core::Executor& executor, std::uint16_t port);
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    std::uint16_t local_port() const { return interactor_->local_port(); }
    bool is_open() const { return open_ && !closed_; }
    std::error_code close_reason() const { return close_reason_; }

    // Ends the session once; later calls are ignored. on_closed() sees the first reason.
    void close(std::error_code reason);

    template<typename ProtobufType>
    asio::awaitable<std::error_code> send(const ProtobufType& message) {
        if (closed_) {
            co_return make_error_code(Errc::connection_lost);
        }
        vaultsync::Envelope envelope;
        envelope.set_version(kProtocolVersion);
        envelope.set_type(ProtobufType::descriptor()->full_name());
        if (!message.SerializeToString(envelope.mutable_payload())) {
            co_return make_error_code(Errc::protocol_violation);
        }
        co_return co_await send_envelope(envelope);
    }

    // Sends the envelope as given, without filling in version or type.
    asio::awaitable<std::error_code> send_envelope(const vaultsync::Envelope& envelope);

  protected:
    asio::awaitable<std::error_code> open();

    // Reads one envelope outside the receive loop, used for request/response
    // exchanges before start_receiving().
    asio::awaitable<Received<vaultsync::Envelope>> receive();

    void start_receiving();

    std::chrono::steady_clock::time_point last_inbound() const { return last_inbound_; }

    // A non-zero return is a protocol violation and closes the session.
    virtual asio::awaitable<std::error_code> handle_message(const vaultsync::Envelope& message) = 0;
    virtual void on_closed(std::error_code reason) { (void) reason; }

    core::Executor& executor_;

  private:
    asio::awaitable<void> receive_loop();

    std::shared_ptr<TcpInteractor> interactor_;
    bool open_ = false;
    bool closed_ = false;
    bool receiving_ = false;
    std::error_code close_reason_;
    std::chrono::steady_clock::time_point last_inbound_{};
};
} // namespace core::net::io
