#include "transfer/transfer_coordinator.h"
#include "core/timer/sleep.h"
#include "core/timer/spawn_with_timeout.h"
#include "util/hash.h"
#include "util/uuid.h"
#include <algorithm>
#include <asio/error_code.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace transfer {

using core::Errc;

TransferCoordinator::TransferCoordinator(core::Executor& executor,
                                         std::shared_ptr<channel::SessionChannel> channel,
                                         const AttachmentJob& job,
                                         config::TransferPolicy policy,
                                         std::size_t job_index,
                                         ProgressSink sink)
    : channel_(std::move(channel))
    , job_(job)
    , policy_(std::move(policy))
    , job_index_(job_index)
    , sink_(std::move(sink))
    , transfer_id_(util::make_transfer_id())
    , cancel_signal_(executor.get_io_context()) {
    cancel_signal_.expires_at(asio::steady_timer::time_point::max());
}

void TransferCoordinator::cancel() {
    if (cancelled_ || outcome_) {
        return;
    }
    spdlog::info("[TransferCoordinator::cancel] Cancelling {}", job_.destination_path);
    cancelled_ = true;
    cancel_signal_.cancel();
}

asio::awaitable<void> TransferCoordinator::wait_for_cancel() {
    if (cancelled_) {
        co_return;
    }
    asio::error_code ec;
    co_await cancel_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

vaultsync::Handshake TransferCoordinator::make_handshake() const {
    const ConstDataBlock bytes(job_.source_bytes.data(), job_.source_bytes.size());

    vaultsync::Handshake handshake;
    handshake.set_transfer_id(transfer_id_);
    handshake.set_vault(channel_->config().vault);
    handshake.set_destination_path(job_.destination_path);
    handshake.set_total_size(job_.size_bytes);
    handshake.set_path_hash(util::hash::java_hash_string(job_.destination_path));
    handshake.set_content_hash(util::hash::java_hash_string(bytes));
    handshake.set_ctime_ms(job_.ctime_ms);
    handshake.set_mtime_ms(job_.mtime_ms);
    handshake.set_chunk_size(static_cast<std::uint32_t>(policy_.chunk_size));
    return handshake;
}

asio::awaitable<TransferOutcome> TransferCoordinator::run() {
    if (outcome_) {
        co_return *outcome_;
    }
    if (job_.size_bytes != job_.source_bytes.size()) {
        co_return finish(make_error_code(Errc::config_error),
                         "declared size does not match the file contents");
    }
    if (cancelled_) {
        co_return finish(make_error_code(Errc::cancelled), "cancelled");
    }

    set_state(TransferState::HandshakeSent);
    auto handshake = co_await unless_cancelled(
        core::timer::spawn_with_timeout(channel_->open_transfer(make_handshake()),
                                        policy_.handshake_timeout));
    if (!handshake) {
        co_return finish(make_error_code(Errc::cancelled), "cancelled");
    }
    if (!*handshake) {
        spdlog::warn("[TransferCoordinator::run] Handshake for {} timed out", job_.destination_path);
        co_return finish(make_error_code(Errc::transfer_timeout), "handshake timed out");
    }

    const channel::HandshakeReply& reply = **handshake;
    if (reply.ec) {
        co_return finish(reply.ec, reply.reason.empty() ? reply.ec.message() : reply.reason);
    }
    if (reply.already_present) {
        spdlog::info("[TransferCoordinator::run] {} already present in the vault",
                     job_.destination_path);
        co_return finish({}, {});
    }

    std::size_t chunk_size = policy_.chunk_size;
    if (reply.chunk_size != 0 && reply.chunk_size < chunk_size) {
        spdlog::debug("[TransferCoordinator::run] Remote lowered chunk size to {} for {}",
                      reply.chunk_size,
                      job_.destination_path);
        chunk_size = reply.chunk_size;
    }

    const auto chunks = codec::split(ConstDataBlock(job_.source_bytes.data(), job_.source_bytes.size()),
                                     chunk_size,
                                     transfer_id_);
    chunks_total_ = chunks.size();
    set_state(TransferState::Streaming);

    for (const auto& chunk : chunks) {
        if (chunk.is_final) {
            set_state(TransferState::AwaitingFinalAck);
        }
        const auto result = co_await send_with_retry(chunk);
        if (result.ec) {
            co_return finish(result.ec, result.reason.empty() ? result.ec.message() : result.reason);
        }
        ++chunks_acked_;
        if (!chunk.is_final) {
            set_state(TransferState::Streaming);
        }
    }

    spdlog::info("[TransferCoordinator::run] Uploaded {} ({} bytes, {} chunks)",
                 job_.destination_path,
                 job_.size_bytes,
                 chunks_total_);
    co_return finish({}, {});
}

asio::awaitable<channel::ChunkReply> TransferCoordinator::send_with_retry(const codec::Chunk& chunk) {
    const unsigned attempts = std::max(1U, policy_.chunk_attempts);
    auto backoff = policy_.retry_backoff;
    channel::ChunkReply cancelled{make_error_code(Errc::cancelled), "cancelled"};

    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        auto reply = co_await unless_cancelled(
            core::timer::spawn_with_timeout(channel_->send_chunk(chunk), policy_.chunk_timeout));
        if (!reply) {
            co_return cancelled;
        }
        if (*reply) {
            co_return std::move(**reply);
        }

        spdlog::warn("[TransferCoordinator::send_with_retry] Chunk {} of {} not acknowledged "
                     "(attempt {}/{})",
                     chunk.sequence_number,
                     job_.destination_path,
                     attempt,
                     attempts);
        if (attempt < attempts) {
            const auto slept = co_await unless_cancelled(core::timer::sleep_for(backoff));
            if (!slept || !*slept) {
                co_return cancelled;
            }
            backoff *= 2;
        }
    }

    co_return channel::ChunkReply{make_error_code(Errc::transfer_timeout),
                                  "chunk " + std::to_string(chunk.sequence_number)
                                      + " not acknowledged after " + std::to_string(attempts)
                                      + " attempts"};
}

void TransferCoordinator::set_state(TransferState state, std::string detail) {
    state_ = state;
    if (!sink_) {
        return;
    }
    ProgressEvent event;
    event.job_index = job_index_;
    event.source_label = job_.source_label;
    event.destination_path = job_.destination_path;
    event.state = state;
    event.chunks_acked = chunks_acked_;
    event.chunks_total = chunks_total_;
    event.detail = std::move(detail);
    sink_(event);
}

TransferOutcome TransferCoordinator::finish(std::error_code ec, std::string detail) {
    if (outcome_) {
        return *outcome_;
    }

    TransferOutcome outcome;
    outcome.source_label = job_.source_label;
    outcome.destination_path = job_.destination_path;
    outcome.success = !ec;
    outcome.error = ec;
    if (ec) {
        outcome.error_detail = detail;
        spdlog::error("[TransferCoordinator::finish] {} failed: {}", job_.destination_path, detail);
    }
    outcome_ = outcome;
    set_state(ec ? TransferState::Failed : TransferState::Completed, std::move(detail));
    return outcome;
}

} // namespace transfer
