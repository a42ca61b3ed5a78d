#pragma once

#include "channel/session_channel.h"
#include "config/client_config.h"
#include "core/executor.h"
#include "transfer/attachment_job.h"
#include "transfer/transfer_coordinator.h"
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace transfer {

struct BatchResult {
    // Set when the connection itself failed (connect, or lost mid-batch).
    std::error_code fatal_error;
    // One entry per job, in submission order.
    std::vector<TransferOutcome> outcomes;

    bool all_succeeded() const;
};

// Runs every job of a batch over one SessionChannel, at most
// max_parallel_transfers at a time.
class BatchOrchestrator {
  public:
    BatchOrchestrator(core::Executor& executor, config::ClientConfig config, ProgressSink sink = {});

    BatchOrchestrator(const BatchOrchestrator&) = delete;
    BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;

    asio::awaitable<BatchResult> run(const std::vector<AttachmentJob>& jobs);

    // Blocks the calling thread, driving the executor until the batch is done.
    BatchResult run_batch(const std::vector<AttachmentJob>& jobs);

    // Cancels one job of the running batch; other jobs are unaffected.
    void cancel(std::size_t job_index);
    // Cancels every job, including a batch still connecting; the batch then
    // finishes with each outcome failed as Errc::cancelled.
    void cancel_all();

    const std::shared_ptr<channel::SessionChannel>& channel() const { return channel_; }

  private:
    asio::awaitable<void> wait_until(const std::function<bool()>& ready);
    asio::awaitable<void> wait_for_cancel();
    void record(std::size_t index, TransferOutcome outcome);

    core::Executor& executor_;
    config::ClientConfig config_;
    ProgressSink sink_;

    std::shared_ptr<channel::SessionChannel> channel_;
    std::vector<std::unique_ptr<TransferCoordinator>> coordinators_;
    std::vector<std::optional<TransferOutcome>> slots_;
    std::size_t active_ = 0;
    std::size_t remaining_ = 0;
    std::optional<asio::steady_timer> wake_;
    bool cancel_requested_ = false;
    asio::steady_timer cancel_signal_;
    std::error_code fatal_error_;
};

} // namespace transfer
