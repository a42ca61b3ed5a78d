#include "channel/session_channel.h"
#include "core/error.h"
#include "core/timer/sleep.h"
#include "support/fake_vault.h"
#include "transfer/transfer_coordinator.h"
#include "util/hash.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace std::chrono_literals;
using core::Errc;
using test_support::FakeVault;
using test_support::FakeVaultScript;
using transfer::AttachmentJob;
using transfer::TransferCoordinator;
using transfer::TransferState;

class TransferCoordinatorTest : public ::testing::Test {
  protected:
    void TearDown() override {
        if (channel) {
            channel->close();
        }
        if (vault) {
            vault->close(make_error_code(Errc::connection_lost));
        }
        test_support::drain(executor);
    }

    void Start(FakeVaultScript script = {}) {
        vault = FakeVault::create(executor, std::move(script));
        vault->start();
        config = test_support::loopback_config(vault->port());
        channel = channel::SessionChannel::create(executor, config.connection);
        ASSERT_FALSE(executor.run_until_complete(channel->connect()));
    }

    std::unique_ptr<TransferCoordinator> Make(const AttachmentJob& job) {
        return std::make_unique<TransferCoordinator>(
            executor, channel, job, config.policy, 0, [this](const transfer::ProgressEvent& event) {
                events.push_back(event);
            });
    }

    core::Executor executor;
    std::shared_ptr<FakeVault> vault;
    std::shared_ptr<channel::SessionChannel> channel;
    config::ClientConfig config;
    std::vector<transfer::ProgressEvent> events;
};

TEST_F(TransferCoordinatorTest, StreamsAllChunksInOrder) {
    Start();
    const auto job = transfer::make_job("photo.png", "attachments/photo.png", test_support::make_bytes(2500));
    auto coordinator = Make(job);

    const auto outcome = executor.run_until_complete(coordinator->run());

    EXPECT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.error_detail.has_value());
    EXPECT_EQ(outcome.destination_path, "attachments/photo.png");
    EXPECT_EQ(coordinator->state(), TransferState::Completed);
    EXPECT_EQ(coordinator->chunks_total(), 3U);
    EXPECT_EQ(coordinator->chunks_acked(), 3U);

    const auto* file = vault->file_at("attachments/photo.png");
    ASSERT_NE(file, nullptr);
    EXPECT_TRUE(file->valid);
    EXPECT_EQ(file->bytes, job.source_bytes);
    EXPECT_EQ(file->vault, "TestVault");
    EXPECT_EQ(file->transfer_id, coordinator->transfer_id());
    EXPECT_EQ(file->path_hash, util::hash::java_hash_string(std::string_view("attachments/photo.png")));
    EXPECT_EQ(file->content_hash,
              util::hash::java_hash_string(ConstDataBlock(job.source_bytes.data(), job.source_bytes.size())));
}

TEST_F(TransferCoordinatorTest, EmitsProgressForEveryStateChange) {
    Start();
    const auto job = transfer::make_job("a", "a.bin", test_support::make_bytes(2500));
    auto coordinator = Make(job);
    executor.run_until_complete(coordinator->run());

    std::vector<TransferState> states;
    for (const auto& event : events) {
        states.push_back(event.state);
    }
    const std::vector<TransferState> expected = {TransferState::HandshakeSent,
                                                 TransferState::Streaming,
                                                 TransferState::Streaming,
                                                 TransferState::Streaming,
                                                 TransferState::AwaitingFinalAck,
                                                 TransferState::Completed};
    EXPECT_EQ(states, expected);
    EXPECT_EQ(events[2].chunks_acked, 1U);
    EXPECT_EQ(events[3].chunks_acked, 2U);
    EXPECT_EQ(events.back().chunks_acked, 3U);
    EXPECT_EQ(events.back().chunks_total, 3U);
}

TEST_F(TransferCoordinatorTest, EmptyFileSendsOneFinalChunk) {
    Start();
    const auto job = transfer::make_job("empty", "empty.md", {});
    auto coordinator = Make(job);

    const auto outcome = executor.run_until_complete(coordinator->run());
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(vault->chunks_received(), 1U);
    const auto* file = vault->file_at("empty.md");
    ASSERT_NE(file, nullptr);
    EXPECT_TRUE(file->valid);
    EXPECT_TRUE(file->bytes.empty());
}

TEST_F(TransferCoordinatorTest, RetriesUnacknowledgedChunk) {
    FakeVaultScript script;
    script.dropped_acks[1] = 1;
    Start(script);
    const auto job = transfer::make_job("a", "retry.bin", test_support::make_bytes(2500));
    auto coordinator = Make(job);

    const auto outcome = executor.run_until_complete(coordinator->run());
    EXPECT_TRUE(outcome.success) << outcome.error_detail.value_or("");
    EXPECT_EQ(vault->chunks_received(), 4U);
    EXPECT_TRUE(vault->file_at("retry.bin")->valid);
}

TEST_F(TransferCoordinatorTest, ExhaustedRetriesFailWithTimeout) {
    FakeVaultScript script;
    script.dropped_acks[0] = 100;
    Start(script);
    const auto job = transfer::make_job("a", "silent.bin", test_support::make_bytes(100));
    auto coordinator = Make(job);

    const auto outcome = executor.run_until_complete(coordinator->run());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, Errc::transfer_timeout);
    EXPECT_EQ(coordinator->state(), TransferState::Failed);
    EXPECT_EQ(vault->chunks_received(), config.policy.chunk_attempts);
    EXPECT_EQ(channel->state(), channel::ConnectionState::Ready);
    EXPECT_EQ(channel->in_flight(), 0U);
}

TEST_F(TransferCoordinatorTest, HandshakeRejectFailsWithoutStreaming) {
    FakeVaultScript script;
    script.rejected_paths["locked.png"] = "path locked";
    Start(script);
    const auto job = transfer::make_job("locked", "locked.png", test_support::make_bytes(100));
    auto coordinator = Make(job);

    const auto outcome = executor.run_until_complete(coordinator->run());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, Errc::remote_rejection);
    EXPECT_EQ(outcome.error_detail, "path locked");
    EXPECT_EQ(vault->chunks_received(), 0U);
    EXPECT_EQ(events.back().state, TransferState::Failed);
    EXPECT_EQ(events.back().detail, "path locked");
}

TEST_F(TransferCoordinatorTest, ChunkNackIsNotRetried) {
    FakeVaultScript script;
    script.nacked_sequences[0] = "permission denied";
    Start(script);
    const auto job = transfer::make_job("a", "denied.bin", test_support::make_bytes(2000));
    auto coordinator = Make(job);

    const auto outcome = executor.run_until_complete(coordinator->run());
    EXPECT_EQ(outcome.error, Errc::remote_rejection);
    EXPECT_EQ(outcome.error_detail, "permission denied");
    EXPECT_EQ(vault->chunks_received(), 1U);
}

TEST_F(TransferCoordinatorTest, AlreadyPresentContentCompletesWithoutStreaming) {
    FakeVaultScript script;
    script.present_paths.push_back("known.png");
    Start(script);
    const auto job = transfer::make_job("known", "known.png", test_support::make_bytes(5000));
    auto coordinator = Make(job);

    const auto outcome = executor.run_until_complete(coordinator->run());
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(coordinator->state(), TransferState::Completed);
    EXPECT_EQ(vault->chunks_received(), 0U);
}

TEST_F(TransferCoordinatorTest, RemoteMayLowerChunkSize) {
    FakeVaultScript script;
    script.negotiated_chunk_size = 256;
    Start(script);
    const auto job = transfer::make_job("a", "small-chunks.bin", test_support::make_bytes(1000));
    auto coordinator = Make(job);

    const auto outcome = executor.run_until_complete(coordinator->run());
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(coordinator->chunks_total(), 4U);
    EXPECT_EQ(vault->chunks_received(), 4U);
    EXPECT_TRUE(vault->file_at("small-chunks.bin")->valid);
}

TEST_F(TransferCoordinatorTest, CancelFailsJobAndKeepsChannel) {
    FakeVaultScript script;
    script.ack_delay = 300ms;
    Start(script);
    const auto job = transfer::make_job("a", "slow.bin", test_support::make_bytes(100));
    auto coordinator = Make(job);

    executor.spawn([&]() -> asio::awaitable<void> {
        co_await core::timer::sleep_for(50ms);
        coordinator->cancel();
    });
    const auto outcome = executor.run_until_complete(coordinator->run());

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, Errc::cancelled);
    EXPECT_EQ(channel->state(), channel::ConnectionState::Ready);
    EXPECT_EQ(channel->in_flight(), 0U);
}

TEST_F(TransferCoordinatorTest, OutcomeIsProducedOnce) {
    Start();
    const auto job = transfer::make_job("a", "once.bin", test_support::make_bytes(10));
    auto coordinator = Make(job);

    const auto first = executor.run_until_complete(coordinator->run());
    const auto second = executor.run_until_complete(coordinator->run());
    EXPECT_TRUE(first.success);
    EXPECT_TRUE(second.success);
    EXPECT_EQ(vault->handshake_order().size(), 1U);

    const auto terminal = std::count_if(events.begin(), events.end(), [](const auto& event) {
        return transfer::is_terminal(event.state);
    });
    EXPECT_EQ(terminal, 1);
}

TEST_F(TransferCoordinatorTest, ClosedChannelFailsWithConnectionLost) {
    Start();
    const auto job = transfer::make_job("a", "closed.bin", test_support::make_bytes(10));
    auto coordinator = Make(job);
    channel->close();

    const auto outcome = executor.run_until_complete(coordinator->run());
    EXPECT_EQ(outcome.error, Errc::connection_lost);
    EXPECT_EQ(coordinator->state(), TransferState::Failed);
}
