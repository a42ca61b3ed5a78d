#include "transfer/batch_orchestrator.h"
#include <asio/error_code.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <exception>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace transfer {

using core::Errc;
using namespace asio::experimental::awaitable_operators;

namespace {
TransferOutcome failed_outcome(const AttachmentJob& job, std::error_code ec) {
    TransferOutcome outcome;
    outcome.source_label = job.source_label;
    outcome.destination_path = job.destination_path;
    outcome.success = false;
    outcome.error = ec;
    outcome.error_detail = ec.message();
    return outcome;
}
} // namespace

bool BatchResult::all_succeeded() const {
    if (fatal_error) {
        return false;
    }
    for (const auto& outcome : outcomes) {
        if (!outcome.success) {
            return false;
        }
    }
    return true;
}

BatchOrchestrator::BatchOrchestrator(core::Executor& executor,
                                     config::ClientConfig config,
                                     ProgressSink sink)
    : executor_(executor)
    , config_(std::move(config))
    , sink_(std::move(sink))
    , cancel_signal_(executor.get_io_context()) {
    cancel_signal_.expires_at(asio::steady_timer::time_point::max());
}

BatchResult BatchOrchestrator::run_batch(const std::vector<AttachmentJob>& jobs) {
    return executor_.run_until_complete(run(jobs));
}

void BatchOrchestrator::cancel(std::size_t job_index) {
    if (job_index < coordinators_.size() && coordinators_[job_index]) {
        coordinators_[job_index]->cancel();
    }
}

void BatchOrchestrator::cancel_all() {
    if (!cancel_requested_) {
        spdlog::warn("[BatchOrchestrator::cancel_all] Cancelling the batch");
    }
    cancel_requested_ = true;
    cancel_signal_.cancel();
    for (auto& coordinator : coordinators_) {
        coordinator->cancel();
    }
}

asio::awaitable<void> BatchOrchestrator::wait_for_cancel() {
    if (cancel_requested_) {
        co_return;
    }
    asio::error_code ec;
    co_await cancel_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

asio::awaitable<void> BatchOrchestrator::wait_until(const std::function<bool()>& ready) {
    while (!ready()) {
        wake_->expires_at(asio::steady_timer::time_point::max());
        asio::error_code ec;
        co_await wake_->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

void BatchOrchestrator::record(std::size_t index, TransferOutcome outcome) {
    // Only a loss that costs an unfinished job makes the batch fatal; the remote
    // closing after the last ack does not.
    if (!outcome.success && !fatal_error_ && !channel_->is_open()
        && core::is_connection_fatal(channel_->close_reason())) {
        fatal_error_ = channel_->close_reason();
        spdlog::error("[BatchOrchestrator::record] Connection failed mid-batch: {}",
                      fatal_error_.message());
    }
    slots_[index] = std::move(outcome);
    --active_;
    --remaining_;
    wake_->cancel();
}

asio::awaitable<BatchResult> BatchOrchestrator::run(const std::vector<AttachmentJob>& jobs) {
    BatchResult result;
    if (jobs.empty()) {
        co_return result;
    }

    const auto cancelled_batch = [&jobs] {
        BatchResult cancelled;
        for (const auto& job : jobs) {
            auto outcome = failed_outcome(job, make_error_code(Errc::cancelled));
            outcome.error_detail = "cancelled";
            cancelled.outcomes.push_back(std::move(outcome));
        }
        return cancelled;
    };

    if (cancel_requested_) {
        co_return cancelled_batch();
    }
    fatal_error_ = {};
    channel_ = channel::SessionChannel::create(executor_, config_.connection);
    auto connected = co_await (channel_->connect() || wait_for_cancel());
    if (connected.index() != 0) {
        spdlog::info("[BatchOrchestrator::run] Cancelled while connecting to {}",
                     config_.connection.endpoint.to_string());
        channel_->close(make_error_code(Errc::cancelled));
        co_return cancelled_batch();
    }
    if (const auto ec = std::get<0>(connected)) {
        spdlog::error("[BatchOrchestrator::run] Connection to {} failed: {}",
                      config_.connection.endpoint.to_string(),
                      ec.message());
        result.fatal_error = ec;
        for (const auto& job : jobs) {
            result.outcomes.push_back(failed_outcome(job, ec));
        }
        co_return result;
    }

    wake_.emplace(executor_.get_io_context());
    coordinators_.clear();
    slots_.assign(jobs.size(), std::nullopt);
    remaining_ = jobs.size();
    active_ = 0;
    const std::size_t limit = config_.max_parallel_transfers == 0 ? jobs.size()
                                                                  : config_.max_parallel_transfers;

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        coordinators_.push_back(std::make_unique<TransferCoordinator>(
            executor_, channel_, jobs[i], config_.policy, i, sink_));
        if (cancel_requested_) {
            coordinators_.back()->cancel();
        }
    }

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        co_await wait_until([this, limit] { return active_ < limit; });
        ++active_;
        executor_.spawn(coordinators_[i]->run(),
                        [this, i, &jobs](std::exception_ptr error, TransferOutcome outcome) {
                            if (error) {
                                std::string detail = "unexpected failure";
                                try {
                                    std::rethrow_exception(error);
                                } catch (const std::exception& e) {
                                    detail = e.what();
                                }
                                spdlog::error("[BatchOrchestrator::run] Transfer of {} aborted: {}",
                                              jobs[i].destination_path,
                                              detail);
                                outcome = failed_outcome(jobs[i], make_error_code(Errc::cancelled));
                                outcome.error_detail = detail;
                            }
                            record(i, std::move(outcome));
                        });
    }

    co_await wait_until([this] { return remaining_ == 0; });

    result.fatal_error = fatal_error_;
    channel_->close();

    result.outcomes.reserve(jobs.size());
    for (auto& slot : slots_) {
        result.outcomes.push_back(std::move(*slot));
    }
    slots_.clear();
    co_return result;
}

} // namespace transfer
