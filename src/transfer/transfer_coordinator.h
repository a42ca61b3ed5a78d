#pragma once

#include "channel/session_channel.h"
#include "codec/chunk_codec.h"
#include "config/client_config.h"
#include "core/error.h"
#include "core/executor.h"
#include "transfer/attachment_job.h"
#include <asio/awaitable.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace transfer {

// Drives one job through handshake and in-order chunk streaming over the shared
// channel. Exactly one TransferOutcome is produced, the first time a terminal
// state is reached.
class TransferCoordinator {
  public:
    TransferCoordinator(core::Executor& executor,
                        std::shared_ptr<channel::SessionChannel> channel,
                        const AttachmentJob& job,
                        config::TransferPolicy policy,
                        std::size_t job_index = 0,
                        ProgressSink sink = {});

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    asio::awaitable<TransferOutcome> run();

    // Fails the transfer with Errc::cancelled at its next suspension point.
    // The shared channel stays open.
    void cancel();

    TransferState state() const { return state_; }
    const std::string& transfer_id() const { return transfer_id_; }
    const std::optional<TransferOutcome>& outcome() const { return outcome_; }
    std::uint64_t chunks_acked() const { return chunks_acked_; }
    std::uint64_t chunks_total() const { return chunks_total_; }

  private:
    vaultsync::Handshake make_handshake() const;
    asio::awaitable<channel::ChunkReply> send_with_retry(const codec::Chunk& chunk);
    asio::awaitable<void> wait_for_cancel();

    template<typename T>
    asio::awaitable<std::optional<T>> unless_cancelled(asio::awaitable<T> task) {
        using namespace asio::experimental::awaitable_operators;
        if (cancelled_) {
            co_return std::nullopt;
        }
        auto result = co_await (std::move(task) || wait_for_cancel());
        if (result.index() != 0) {
            co_return std::nullopt;
        }
        co_return std::move(std::get<0>(result));
    }

    void set_state(TransferState state, std::string detail = {});
    TransferOutcome finish(std::error_code ec, std::string detail);

    std::shared_ptr<channel::SessionChannel> channel_;
    const AttachmentJob& job_;
    config::TransferPolicy policy_;
    std::size_t job_index_;
    ProgressSink sink_;

    std::string transfer_id_;
    TransferState state_ = TransferState::Pending;
    std::optional<TransferOutcome> outcome_;
    std::uint64_t chunks_acked_ = 0;
    std::uint64_t chunks_total_ = 0;

    bool cancelled_ = false;
    asio::steady_timer cancel_signal_;
};

} // namespace transfer
