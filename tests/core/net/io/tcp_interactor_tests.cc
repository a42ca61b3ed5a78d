#include "core/executor.h"
#include "core/net/io/tcp_interactor.h"
#include "vault_sync.pb.h"
#include <array>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

using namespace core::net::io;
using namespace asio::experimental::awaitable_operators;

class TcpInteractorTest : public ::testing::Test {
  protected:
    void SetUp() override {
        server = std::make_shared<TcpInteractor>(executor, 0);
        client = std::make_shared<TcpInteractor>(executor, "127.0.0.1", server->local_port());
    }

    void TearDown() override {
        client->close();
        server->close();
        executor.get_io_context().poll();
    }

    void Connect() {
        const auto [server_ec, client_ec] = executor.run_until_complete(
            [this]() -> asio::awaitable<std::tuple<std::error_code, std::error_code>> {
                co_return co_await (server->open() && client->open());
            }());
        ASSERT_FALSE(server_ec) << server_ec.message();
        ASSERT_FALSE(client_ec) << client_ec.message();
    }

    core::Executor executor;
    std::shared_ptr<TcpInteractor> server;
    std::shared_ptr<TcpInteractor> client;
};

TEST_F(TcpInteractorTest, BasicProtobufMessage) {
    Connect();

    auto received = executor.run_until_complete([this]() -> asio::awaitable<Received<vaultsync::Handshake>> {
        vaultsync::Handshake handshake;
        handshake.set_transfer_id("t-1");
        handshake.set_destination_path("assets/test.png");
        handshake.set_total_size(1024);
        const auto ec = co_await client->send_message(handshake);
        EXPECT_FALSE(ec);
        co_return co_await server->receive_message<vaultsync::Handshake>();
    }());

    ASSERT_FALSE(received.ec);
    EXPECT_EQ(received.message.transfer_id(), "t-1");
    EXPECT_EQ(received.message.destination_path(), "assets/test.png");
    EXPECT_EQ(received.message.total_size(), 1024U);
}

TEST_F(TcpInteractorTest, RequestResponse) {
    Connect();

    auto response = executor.run_until_complete([this]() -> asio::awaitable<Received<vaultsync::AuthorizeResult>> {
        vaultsync::Authorize authorize;
        authorize.set_token("secret");
        EXPECT_FALSE(co_await client->send_message(authorize));

        auto request = co_await server->receive_message<vaultsync::Authorize>();
        EXPECT_FALSE(request.ec);
        vaultsync::AuthorizeResult result;
        result.set_ok(request.message.token() == "secret");
        result.set_message("welcome");
        EXPECT_FALSE(co_await server->send_message(result));

        co_return co_await client->receive_message<vaultsync::AuthorizeResult>();
    }());

    ASSERT_FALSE(response.ec);
    EXPECT_TRUE(response.message.ok());
    EXPECT_EQ(response.message.message(), "welcome");
}

TEST_F(TcpInteractorTest, ConcurrentSendersKeepFramesWhole) {
    Connect();

    constexpr int kSenders = 8;
    constexpr std::size_t kPayloadSize = 64 * 1024;

    for (int i = 0; i < kSenders; ++i) {
        executor.spawn([this, i]() -> asio::awaitable<void> {
            vaultsync::ChunkData chunk;
            chunk.set_transfer_id("t-" + std::to_string(i));
            chunk.set_sequence_number(static_cast<std::uint64_t>(i));
            chunk.set_payload(std::string(kPayloadSize, static_cast<char>('a' + i)));
            const auto ec = co_await client->send_message(chunk);
            EXPECT_FALSE(ec);
        });
    }

    auto chunks = executor.run_until_complete([this]() -> asio::awaitable<std::vector<vaultsync::ChunkData>> {
        std::vector<vaultsync::ChunkData> received;
        for (int i = 0; i < kSenders; ++i) {
            auto message = co_await server->receive_message<vaultsync::ChunkData>();
            if (message.ec) {
                break;
            }
            received.push_back(std::move(message.message));
        }
        co_return received;
    }());

    ASSERT_EQ(chunks.size(), static_cast<std::size_t>(kSenders));
    for (const auto& chunk : chunks) {
        const auto index = chunk.sequence_number();
        EXPECT_EQ(chunk.transfer_id(), "t-" + std::to_string(index));
        EXPECT_EQ(chunk.payload(), std::string(kPayloadSize, static_cast<char>('a' + index)));
    }
}

TEST_F(TcpInteractorTest, OversizedFrameIsProtocolViolation) {
    asio::ip::tcp::socket raw(executor.get_io_context());

    auto received = executor.run_until_complete([&]() -> asio::awaitable<Received<std::vector<std::byte>>> {
        auto accepting = server->open();
        co_await raw.async_connect({asio::ip::make_address("127.0.0.1"), server->local_port()},
                                   asio::use_awaitable);
        EXPECT_FALSE(co_await std::move(accepting));

        const std::uint32_t length = kMaxFrameSize + 1;
        const std::array<unsigned char, 4> header{static_cast<unsigned char>(length >> 24),
                                                  static_cast<unsigned char>(length >> 16),
                                                  static_cast<unsigned char>(length >> 8),
                                                  static_cast<unsigned char>(length)};
        co_await asio::async_write(raw, asio::buffer(header), asio::use_awaitable);
        co_return co_await server->receive_frame();
    }());

    EXPECT_EQ(received.ec, core::Errc::protocol_violation);
}

TEST_F(TcpInteractorTest, PeerCloseEndsReceive) {
    Connect();

    auto received = executor.run_until_complete([this]() -> asio::awaitable<Received<vaultsync::Ping>> {
        client->close();
        co_return co_await server->receive_message<vaultsync::Ping>();
    }());

    EXPECT_TRUE(received.ec);
}

TEST_F(TcpInteractorTest, SendBeforeOpenFails) {
    auto ec = executor.run_until_complete([this]() -> asio::awaitable<std::error_code> {
        vaultsync::Ping ping;
        co_return co_await client->send_message(ping);
    }());

    EXPECT_TRUE(ec);
}
