#pragma once

#include "codec/chunk_codec.h"
#include "config/client_config.h"
#include "core/executor.h"
#include "core/net/io/session.h"
#include "vault_sync.pb.h"
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace channel {

enum class ConnectionState { Disconnected, Connecting, Ready, Closed };

std::string_view to_string(ConnectionState state);

struct HandshakeReply {
    std::error_code ec;
    std::string reason;
    std::uint32_t chunk_size = 0;
    bool already_present = false;
};

struct ChunkReply {
    std::error_code ec;
    std::string reason;
};

// The single connection of a batch. Transfers register one outstanding request
// at a time (handshake or chunk) keyed by transfer id; the receive loop resolves
// it from the matching reply. All members are touched from the io_context thread only.
class SessionChannel : public core::net::io::Session {
  public:
    static std::shared_ptr<SessionChannel> create(core::Executor& executor,
                                                  config::ConnectionConfig config);

    SessionChannel(core::Executor& executor, config::ConnectionConfig config);
    ~SessionChannel() override = default;

    // Validates the vault name, opens TCP with bounded retries, authenticates and
    // announces the client. Errc::config_error, auth_error or connection_error.
    asio::awaitable<std::error_code> connect();

    asio::awaitable<HandshakeReply> open_transfer(const vaultsync::Handshake& handshake);

    // Resolves on the ack or nack for (transfer_id, sequence_number). A waiter that
    // is cancelled (e.g. by a timeout race) leaves nothing registered.
    asio::awaitable<ChunkReply> send_chunk(const codec::Chunk& chunk);

    using core::net::io::Session::close;
    void close() { close(make_error_code(core::Errc::connection_lost)); }

    ConnectionState state() const { return state_; }
    std::size_t in_flight() const { return pending_.size(); }
    const config::ConnectionConfig& config() const { return config_; }

  protected:
    asio::awaitable<std::error_code> handle_message(const vaultsync::Envelope& message) override;
    void on_closed(std::error_code reason) override;

  private:
    struct PendingWait {
        enum class Kind { Handshake, Chunk };
        Kind kind = Kind::Chunk;
        std::uint64_t sequence = 0;
        std::unique_ptr<asio::steady_timer> signal;
        std::optional<vaultsync::Envelope> reply;
        std::error_code ec;
        std::string detail;
        bool done = false;
    };

    asio::awaitable<std::error_code> open_with_retry();
    asio::awaitable<std::error_code> introduce();
    asio::awaitable<core::net::io::Received<vaultsync::Envelope>> expect_reply();
    asio::awaitable<void> keepalive_loop();

    std::shared_ptr<PendingWait> register_wait(const std::string& transfer_id,
                                               PendingWait::Kind kind,
                                               std::uint64_t sequence);
    // Suspends until the wait is resolved; false when the caller was cancelled first.
    asio::awaitable<bool> await_resolution(const std::string& transfer_id,
                                           const std::shared_ptr<PendingWait>& wait);
    void unregister(const std::string& transfer_id, const std::shared_ptr<PendingWait>& wait);
    void resolve(const std::shared_ptr<PendingWait>& wait, std::error_code ec, std::string detail);
    std::error_code route(const std::string& transfer_id,
                          PendingWait::Kind kind,
                          std::uint64_t sequence,
                          const vaultsync::Envelope& message);

    config::ConnectionConfig config_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::unordered_map<std::string, std::shared_ptr<PendingWait>> pending_;
    asio::steady_timer keepalive_timer_;
    std::optional<std::chrono::steady_clock::time_point> ping_sent_at_;
};

} // namespace channel
