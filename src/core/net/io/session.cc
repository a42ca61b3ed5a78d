#include "core/net/io/session.h"
#include <asio/error.hpp>
#include <spdlog/spdlog.h>

namespace core::net::io {
Session::Session(core::Executor& executor, std::string_view host, std::uint16_t port)
    : executor_(executor)
    , interactor_(std::make_shared<TcpInteractor>(executor, host, port)) {}

Session::Session(core::Executor& executor, std::uint16_t port)
    : executor_(executor)
    , interactor_(std::make_shared<TcpInteractor>(executor, port)) {}

asio::awaitable<std::error_code> Session::open() {
    const auto ec = co_await interactor_->open();
    open_ = !ec;
    if (open_) {
        last_inbound_ = std::chrono::steady_clock::now();
    }
    co_return ec;
}

void Session::close(std::error_code reason) {
    if (closed_) {
        return;
    }
    closed_ = true;
    close_reason_ = reason;
    interactor_->close();
    on_closed(reason);
}

asio::awaitable<std::error_code> Session::send_envelope(const vaultsync::Envelope& envelope) {
    if (closed_) {
        co_return make_error_code(Errc::connection_lost);
    }
    co_return co_await interactor_->send_message(envelope);
}

asio::awaitable<Received<vaultsync::Envelope>> Session::receive() {
    auto received = co_await interactor_->receive_message<vaultsync::Envelope>();
    if (received.ec) {
        co_return received;
    }
    last_inbound_ = std::chrono::steady_clock::now();
    if (received.message.version() != kProtocolVersion) {
        spdlog::error("[Session::receive] Unsupported protocol version {} (type {})",
                      received.message.version(),
                      received.message.type());
        received.ec = make_error_code(Errc::protocol_violation);
    }
    co_return received;
}

void Session::start_receiving() {
    if (receiving_) {
        return;
    }
    receiving_ = true;
    executor_.spawn([self = shared_from_this()]() -> asio::awaitable<void> {
        co_await self->receive_loop();
    });
}

asio::awaitable<void> Session::receive_loop() {
    while (!closed_) {
        auto received = co_await receive();
        if (closed_) {
            break;
        }
        if (received.ec) {
            if (received.ec == Errc::protocol_violation) {
                close(received.ec);
            } else {
                spdlog::info("[Session::receive_loop] Connection ended: {}", received.ec.message());
                close(make_error_code(Errc::connection_lost));
            }
            break;
        }

        const auto ec = co_await handle_message(received.message);
        if (ec) {
            spdlog::error("[Session::receive_loop] Rejecting frame of type '{}': {}",
                          received.message.type(),
                          ec.message());
            close(ec);
            break;
        }
    }
    receiving_ = false;
}
} // namespace core::net::io
