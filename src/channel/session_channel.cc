#include "channel/session_channel.h"
#include "core/timer/sleep.h"
#include "core/timer/spawn_with_timeout.h"
#include "util/hash.h"
#include <algorithm>
#include <asio/error.hpp>
#include <asio/redirect_error.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace channel {

using core::Errc;
using core::net::io::holds;
using core::net::io::unpack;

namespace {
constexpr auto kMinKeepaliveTick = std::chrono::milliseconds(10);

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}
} // namespace

std::string_view to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Ready:
        return "Ready";
    case ConnectionState::Closed:
        return "Closed";
    }
    return "Unknown";
}

std::shared_ptr<SessionChannel> SessionChannel::create(core::Executor& executor,
                                                       config::ConnectionConfig config) {
    return std::make_shared<SessionChannel>(executor, std::move(config));
}

SessionChannel::SessionChannel(core::Executor& executor, config::ConnectionConfig config)
    : core::net::io::Session(executor, config.endpoint.host, config.endpoint.port)
    , config_(std::move(config))
    , keepalive_timer_(executor.get_io_context()) {}

asio::awaitable<std::error_code> SessionChannel::connect() {
    if (state_ != ConnectionState::Disconnected) {
        spdlog::warn("[SessionChannel::connect] Channel already used (state {})", to_string(state_));
        if (state_ == ConnectionState::Ready) {
            co_return std::error_code{};
        }
        co_return make_error_code(Errc::connection_error);
    }
    if (!config::is_valid_vault_name(config_.vault)) {
        spdlog::error("[SessionChannel::connect] Malformed vault name '{}'", config_.vault);
        state_ = ConnectionState::Closed;
        co_return make_error_code(Errc::config_error);
    }

    state_ = ConnectionState::Connecting;
    if (const auto ec = co_await open_with_retry()) {
        state_ = ConnectionState::Closed;
        co_return ec;
    }

    if (const auto ec = co_await introduce()) {
        close(ec);
        co_return ec;
    }

    state_ = ConnectionState::Ready;
    spdlog::info("[SessionChannel::connect] Connected to {} (vault '{}')",
                 config_.endpoint.to_string(),
                 config_.vault);
    start_receiving();
    executor_.spawn(
        [self = std::static_pointer_cast<SessionChannel>(shared_from_this())]()
            -> asio::awaitable<void> { co_await self->keepalive_loop(); });
    co_return std::error_code{};
}

asio::awaitable<std::error_code> SessionChannel::open_with_retry() {
    const unsigned attempts = std::max(1U, config_.connect_attempts);
    auto backoff = config_.connect_backoff;

    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        auto result = co_await core::timer::spawn_with_timeout(open(), config_.connect_timeout);
        if (result && !*result) {
            co_return std::error_code{};
        }
        const std::error_code ec = result ? *result : make_error_code(asio::error::timed_out);
        spdlog::warn("[SessionChannel::open_with_retry] Attempt {}/{} to reach {} failed: {}",
                     attempt,
                     attempts,
                     config_.endpoint.to_string(),
                     ec.message());
        if (attempt < attempts) {
            if (!co_await core::timer::sleep_for(backoff)) {
                break;
            }
            backoff *= 2;
        }
    }
    co_return make_error_code(Errc::connection_error);
}

asio::awaitable<std::error_code> SessionChannel::introduce() {
    vaultsync::Authorize authorize;
    authorize.set_token(config_.token);
    if (const auto ec = co_await send(authorize)) {
        spdlog::error("[SessionChannel::introduce] Failed to send authorization: {}", ec.message());
        co_return make_error_code(Errc::connection_error);
    }

    auto reply = co_await core::timer::spawn_with_timeout(expect_reply(), config_.connect_timeout);
    if (!reply || reply->ec) {
        spdlog::error("[SessionChannel::introduce] No authorization result: {}",
                      reply ? reply->ec.message() : "timed out");
        co_return make_error_code(reply && reply->ec == Errc::protocol_violation
                                      ? Errc::protocol_violation
                                      : Errc::connection_error);
    }
    const auto authorized = unpack<vaultsync::AuthorizeResult>(reply->message);
    if (!authorized) {
        spdlog::error("[SessionChannel::introduce] Expected AuthorizeResult, got '{}'",
                      reply->message.type());
        co_return make_error_code(Errc::protocol_violation);
    }
    if (!authorized->ok()) {
        spdlog::error("[SessionChannel::introduce] Credentials rejected: {}", authorized->message());
        co_return make_error_code(Errc::auth_error);
    }

    vaultsync::ClientInfo info;
    info.set_name(config_.client_name);
    info.set_version(config_.client_version);
    info.set_type("desktop");
    info.set_vault(config_.vault);
    if (const auto ec = co_await send(info)) {
        spdlog::error("[SessionChannel::introduce] Failed to send client info: {}", ec.message());
        co_return make_error_code(Errc::connection_error);
    }

    reply = co_await core::timer::spawn_with_timeout(expect_reply(), config_.connect_timeout);
    if (!reply || reply->ec) {
        spdlog::error("[SessionChannel::introduce] No client info acknowledgment: {}",
                      reply ? reply->ec.message() : "timed out");
        co_return make_error_code(reply && reply->ec == Errc::protocol_violation
                                      ? Errc::protocol_violation
                                      : Errc::connection_error);
    }
    const auto accepted = unpack<vaultsync::ClientInfoAck>(reply->message);
    if (!accepted) {
        spdlog::error("[SessionChannel::introduce] Expected ClientInfoAck, got '{}'",
                      reply->message.type());
        co_return make_error_code(Errc::protocol_violation);
    }
    if (!accepted->ok()) {
        spdlog::error("[SessionChannel::introduce] Vault '{}' rejected: {}",
                      config_.vault,
                      accepted->message());
        co_return make_error_code(Errc::config_error);
    }
    co_return std::error_code{};
}

asio::awaitable<core::net::io::Received<vaultsync::Envelope>> SessionChannel::expect_reply() {
    while (true) {
        auto received = co_await receive();
        if (received.ec) {
            co_return received;
        }
        if (holds<vaultsync::SyncNotice>(received.message)) {
            continue;
        }
        if (holds<vaultsync::Ping>(received.message)) {
            vaultsync::Pong pong;
            pong.set_timestamp_ms(now_ms());
            if (const auto ec = co_await send(pong)) {
                received.ec = ec;
                co_return received;
            }
            continue;
        }
        co_return received;
    }
}

asio::awaitable<void> SessionChannel::keepalive_loop() {
    const auto idle = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        config_.keepalive_idle);
    const auto tick = std::max<std::chrono::steady_clock::duration>(idle / 4, kMinKeepaliveTick);

    while (state_ == ConnectionState::Ready) {
        keepalive_timer_.expires_after(tick);
        asio::error_code ec;
        co_await keepalive_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || state_ != ConnectionState::Ready) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (ping_sent_at_) {
            if (now - *ping_sent_at_ >= 2 * idle) {
                spdlog::error("[SessionChannel::keepalive_loop] No pong from {} within {} ms",
                              config_.endpoint.to_string(),
                              std::chrono::duration_cast<std::chrono::milliseconds>(2 * idle).count());
                close(make_error_code(Errc::connection_lost));
                break;
            }
            continue;
        }

        if (now - last_inbound() >= idle) {
            vaultsync::Ping ping;
            ping.set_timestamp_ms(now_ms());
            ping_sent_at_ = now;
            spdlog::debug("[SessionChannel::keepalive_loop] Idle, sending ping");
            if (const auto send_ec = co_await send(ping)) {
                spdlog::error("[SessionChannel::keepalive_loop] Ping failed: {}", send_ec.message());
                close(make_error_code(Errc::connection_lost));
                break;
            }
        }
    }
}

asio::awaitable<HandshakeReply> SessionChannel::open_transfer(const vaultsync::Handshake& handshake) {
    HandshakeReply result;
    if (state_ != ConnectionState::Ready) {
        result.ec = make_error_code(Errc::connection_lost);
        co_return result;
    }

    const std::string transfer_id = handshake.transfer_id();
    auto wait = register_wait(transfer_id, PendingWait::Kind::Handshake, 0);
    spdlog::debug("[SessionChannel::open_transfer] {} -> {} ({} bytes)",
                  transfer_id,
                  handshake.destination_path(),
                  handshake.total_size());
    const auto send_ec = co_await send(handshake);
    if (send_ec && !wait->done) {
        unregister(transfer_id, wait);
        result.ec = send_ec == asio::error::operation_aborted ? make_error_code(Errc::cancelled)
                                                              : make_error_code(Errc::connection_lost);
        co_return result;
    }

    if (!co_await await_resolution(transfer_id, wait)) {
        result.ec = make_error_code(Errc::cancelled);
        co_return result;
    }
    if (wait->ec) {
        result.ec = wait->ec;
        result.reason = wait->detail;
        co_return result;
    }

    if (auto ack = unpack<vaultsync::HandshakeAck>(*wait->reply)) {
        result.chunk_size = ack->chunk_size();
        result.already_present = ack->already_present();
    } else if (auto reject = unpack<vaultsync::HandshakeReject>(*wait->reply)) {
        result.ec = make_error_code(Errc::remote_rejection);
        result.reason = reject->reason();
    }
    co_return result;
}

asio::awaitable<ChunkReply> SessionChannel::send_chunk(const codec::Chunk& chunk) {
    ChunkReply result;
    if (state_ != ConnectionState::Ready) {
        result.ec = make_error_code(Errc::connection_lost);
        co_return result;
    }

    auto wait = register_wait(chunk.transfer_id, PendingWait::Kind::Chunk, chunk.sequence_number);
    vaultsync::ChunkData data;
    data.set_transfer_id(chunk.transfer_id);
    data.set_sequence_number(chunk.sequence_number);
    data.set_payload(std::string(util::as_string_view(chunk.payload)));
    data.set_is_final(chunk.is_final);
    if (auto digest = util::hash::sha256_hex(chunk.payload)) {
        data.set_digest(std::move(*digest));
    }

    spdlog::debug("[SessionChannel::send_chunk] {} #{} ({} bytes{})",
                  chunk.transfer_id,
                  chunk.sequence_number,
                  chunk.payload.size(),
                  chunk.is_final ? ", final" : "");
    const auto send_ec = co_await send(data);
    if (send_ec && !wait->done) {
        unregister(chunk.transfer_id, wait);
        result.ec = send_ec == asio::error::operation_aborted ? make_error_code(Errc::cancelled)
                                                              : make_error_code(Errc::connection_lost);
        co_return result;
    }

    if (!co_await await_resolution(chunk.transfer_id, wait)) {
        result.ec = make_error_code(Errc::cancelled);
        co_return result;
    }
    if (wait->ec) {
        result.ec = wait->ec;
        result.reason = wait->detail;
        co_return result;
    }

    if (auto nack = unpack<vaultsync::ChunkNack>(*wait->reply)) {
        result.ec = make_error_code(Errc::remote_rejection);
        result.reason = nack->reason();
    }
    co_return result;
}

std::shared_ptr<SessionChannel::PendingWait> SessionChannel::register_wait(
    const std::string& transfer_id, PendingWait::Kind kind, std::uint64_t sequence) {
    if (const auto it = pending_.find(transfer_id); it != pending_.end()) {
        // Left behind by a caller that was torn down mid-wait.
        spdlog::debug("[SessionChannel::register_wait] Replacing abandoned request of {}", transfer_id);
        auto abandoned = it->second;
        pending_.erase(it);
        resolve(abandoned, make_error_code(Errc::cancelled), "superseded");
    }
    auto wait = std::make_shared<PendingWait>();
    wait->kind = kind;
    wait->sequence = sequence;
    wait->signal = std::make_unique<asio::steady_timer>(executor_.get_io_context());
    wait->signal->expires_at(asio::steady_timer::time_point::max());
    pending_.emplace(transfer_id, wait);
    return wait;
}

asio::awaitable<bool> SessionChannel::await_resolution(const std::string& transfer_id,
                                                       const std::shared_ptr<PendingWait>& wait) {
    if (!wait->done) {
        asio::error_code ec;
        co_await wait->signal->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    if (!wait->done) {
        unregister(transfer_id, wait);
        co_return false;
    }
    co_return true;
}

void SessionChannel::unregister(const std::string& transfer_id,
                                const std::shared_ptr<PendingWait>& wait) {
    const auto it = pending_.find(transfer_id);
    if (it != pending_.end() && it->second == wait) {
        pending_.erase(it);
    }
}

void SessionChannel::resolve(const std::shared_ptr<PendingWait>& wait,
                             std::error_code ec,
                             std::string detail) {
    wait->done = true;
    wait->ec = ec;
    wait->detail = std::move(detail);
    wait->signal->cancel();
}

std::error_code SessionChannel::route(const std::string& transfer_id,
                                      PendingWait::Kind kind,
                                      std::uint64_t sequence,
                                      const vaultsync::Envelope& message) {
    const auto it = pending_.find(transfer_id);
    if (it == pending_.end()) {
        spdlog::warn("[SessionChannel::route] Dropping '{}' for unknown transfer {}",
                     message.type(),
                     transfer_id);
        return {};
    }

    auto wait = it->second;
    if (wait->kind != kind) {
        pending_.erase(it);
        resolve(wait,
                make_error_code(Errc::protocol_violation),
                "unexpected " + message.type());
        return {};
    }

    if (kind == PendingWait::Kind::Chunk && sequence != wait->sequence) {
        if (sequence < wait->sequence) {
            spdlog::warn("[SessionChannel::route] Stale reply #{} for {} (awaiting #{})",
                         sequence,
                         transfer_id,
                         wait->sequence);
            return {};
        }
        pending_.erase(it);
        resolve(wait,
                make_error_code(Errc::protocol_violation),
                "reply for chunk " + std::to_string(sequence) + " while awaiting chunk "
                    + std::to_string(wait->sequence));
        return {};
    }

    pending_.erase(it);
    wait->reply = message;
    resolve(wait, {}, {});
    return {};
}

asio::awaitable<std::error_code> SessionChannel::handle_message(const vaultsync::Envelope& message) {
    using Kind = PendingWait::Kind;
    const auto violation = make_error_code(Errc::protocol_violation);

    if (holds<vaultsync::ChunkAck>(message)) {
        const auto ack = unpack<vaultsync::ChunkAck>(message);
        co_return ack ? route(ack->transfer_id(), Kind::Chunk, ack->sequence_number(), message)
                      : violation;
    }
    if (holds<vaultsync::ChunkNack>(message)) {
        const auto nack = unpack<vaultsync::ChunkNack>(message);
        co_return nack ? route(nack->transfer_id(), Kind::Chunk, nack->sequence_number(), message)
                       : violation;
    }
    if (holds<vaultsync::HandshakeAck>(message)) {
        const auto ack = unpack<vaultsync::HandshakeAck>(message);
        co_return ack ? route(ack->transfer_id(), Kind::Handshake, 0, message) : violation;
    }
    if (holds<vaultsync::HandshakeReject>(message)) {
        const auto reject = unpack<vaultsync::HandshakeReject>(message);
        co_return reject ? route(reject->transfer_id(), Kind::Handshake, 0, message) : violation;
    }
    if (holds<vaultsync::Ping>(message)) {
        vaultsync::Pong pong;
        pong.set_timestamp_ms(now_ms());
        if (const auto ec = co_await send(pong)) {
            spdlog::warn("[SessionChannel::handle_message] Failed to answer ping: {}", ec.message());
        }
        co_return std::error_code{};
    }
    if (holds<vaultsync::Pong>(message)) {
        ping_sent_at_.reset();
        co_return std::error_code{};
    }
    if (holds<vaultsync::SyncNotice>(message)) {
        const auto notice = unpack<vaultsync::SyncNotice>(message);
        if (!notice) {
            co_return violation;
        }
        spdlog::debug("[SessionChannel::handle_message] Ignoring broadcast {} {}",
                      notice->action(),
                      notice->path());
        co_return std::error_code{};
    }
    if (holds<vaultsync::AuthorizeResult>(message) || holds<vaultsync::ClientInfoAck>(message)) {
        spdlog::warn("[SessionChannel::handle_message] Late '{}' ignored", message.type());
        co_return std::error_code{};
    }

    spdlog::error("[SessionChannel::handle_message] Unrecognized message type '{}'", message.type());
    co_return violation;
}

void SessionChannel::on_closed(std::error_code reason) {
    state_ = ConnectionState::Closed;
    keepalive_timer_.cancel();

    const auto failure = reason == Errc::protocol_violation ? reason
                                                            : make_error_code(Errc::connection_lost);
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [transfer_id, wait] : pending) {
        resolve(wait, failure, failure.message());
    }
    if (!pending.empty()) {
        spdlog::warn("[SessionChannel::on_closed] Failed {} in-flight request(s): {}",
                     pending.size(),
                     failure.message());
    }
}

} // namespace channel
