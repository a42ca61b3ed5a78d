#include "tcp_interactor.h"
#include <asio/read.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#include <array>
#include <spdlog/spdlog.h>

namespace core::net::io {

namespace {
void write_length(std::byte* out, std::uint32_t length) {
    out[0] = static_cast<std::byte>((length >> 24) & 0xFF);
    out[1] = static_cast<std::byte>((length >> 16) & 0xFF);
    out[2] = static_cast<std::byte>((length >> 8) & 0xFF);
    out[3] = static_cast<std::byte>(length & 0xFF);
}

std::uint32_t read_length(const std::array<std::byte, kFrameHeaderSize>& header) {
    return (std::to_integer<std::uint32_t>(header[0]) << 24)
           | (std::to_integer<std::uint32_t>(header[1]) << 16)
           | (std::to_integer<std::uint32_t>(header[2]) << 8)
           | std::to_integer<std::uint32_t>(header[3]);
}
} // namespace

TcpInteractor::TcpInteractor(Executor& executor, std::string_view host, std::uint16_t port)
    : executor_(executor)
    , socket_(executor.get_io_context())
    , mode_(TcpInteractorMode::Client)
    , connector_(std::in_place, socket_)
    , host_(host)
    , port_(port) {}

TcpInteractor::TcpInteractor(Executor& executor, std::uint16_t port)
    : executor_(executor)
    , socket_(executor.get_io_context())
    , mode_(TcpInteractorMode::Server)
    , port_(port)
    , acceptor_(std::in_place, socket_) {
    acceptor_->listen(port_);
}

TcpInteractor::~TcpInteractor() {
    close();
}

std::uint16_t TcpInteractor::local_port() const {
    if (acceptor_) {
        return acceptor_->local_port();
    }
    asio::error_code ec;
    const auto endpoint = socket_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

asio::awaitable<std::error_code> TcpInteractor::open() {
    std::error_code ec;
    if (mode_ == TcpInteractorMode::Client) {
        ec = co_await connector_->connect(host_, port_);
    } else {
        ec = co_await acceptor_->accept();
    }
    connected_ = !ec;
    co_return ec;
}

void TcpInteractor::close() {
    connected_ = false;
    if (acceptor_) {
        acceptor_->close();
    }
    if (socket_.is_open()) {
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
    fail_pending_sends(asio::error::operation_aborted);
}

void TcpInteractor::fail_pending_sends(std::error_code ec) {
    while (!send_queue_.empty()) {
        auto pending = send_queue_.front();
        send_queue_.pop_front();
        pending->result = ec;
        pending->completion->cancel();
    }
}

asio::awaitable<std::error_code> TcpInteractor::send_frame(ConstDataBlock body) {
    if (!connected_) {
        co_return asio::error::not_connected;
    }
    if (body.size() > kMaxFrameSize) {
        spdlog::error("[TcpInteractor::send_frame] Frame of {} bytes exceeds limit", body.size());
        co_return make_error_code(Errc::protocol_violation);
    }

    auto pending = std::make_shared<PendingSend>();
    pending->data.resize(kFrameHeaderSize + body.size());
    write_length(pending->data.data(), static_cast<std::uint32_t>(body.size()));
    std::copy(body.begin(), body.end(), pending->data.begin() + kFrameHeaderSize);
    pending->completion = std::make_unique<asio::steady_timer>(executor_.get_io_context());
    pending->completion->expires_at(asio::steady_timer::time_point::max());

    send_queue_.push_back(pending);
    if (!send_in_progress_) {
        send_in_progress_ = true;
        executor_.spawn([self = shared_from_this()]() -> asio::awaitable<void> {
            co_await self->process_send_queue();
        });
    }

    asio::error_code ec;
    co_await pending->completion->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    if (pending->result) {
        co_return *pending->result;
    }
    co_return ec;
}

asio::awaitable<void> TcpInteractor::process_send_queue() {
    while (!send_queue_.empty()) {
        auto pending = send_queue_.front();
        send_queue_.pop_front();

        asio::error_code ec;
        co_await asio::async_write(socket_,
                                   asio::buffer(pending->data),
                                   asio::redirect_error(asio::use_awaitable, ec));
        pending->result = ec;
        pending->completion->cancel();
        if (ec) {
            spdlog::debug("[TcpInteractor::process_send_queue] write failed: {}", ec.message());
            fail_pending_sends(ec);
            break;
        }
    }
    send_in_progress_ = false;
}

asio::awaitable<Received<std::vector<std::byte>>> TcpInteractor::receive_frame() {
    Received<std::vector<std::byte>> frame;
    if (!connected_) {
        frame.ec = asio::error::not_connected;
        co_return frame;
    }

    std::array<std::byte, kFrameHeaderSize> header{};
    asio::error_code ec;
    co_await asio::async_read(socket_,
                              asio::buffer(header),
                              asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        frame.ec = ec;
        co_return frame;
    }

    const std::uint32_t length = read_length(header);
    if (length > kMaxFrameSize) {
        spdlog::error("[TcpInteractor::receive_frame] Frame length {} exceeds limit", length);
        frame.ec = make_error_code(Errc::protocol_violation);
        co_return frame;
    }

    frame.message.resize(length);
    if (length > 0) {
        co_await asio::async_read(socket_,
                                  asio::buffer(frame.message),
                                  asio::redirect_error(asio::use_awaitable, ec));
    }
    frame.ec = ec;
    co_return frame;
}

} // namespace core::net::io
