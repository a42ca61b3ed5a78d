#pragma once

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <utility>

namespace core {
// Owns the io_context every connection, transfer and timer of a batch runs on.
// All coroutines spawned here execute on the thread that calls start() (or
// run_until_complete()), which is what serializes access to channel state.
class Executor {
  public:
    Executor() = default;

    ~Executor() {
        if (running_.load()) {
            stop();
        }
    }

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    void start();
    void stop();

    bool is_running() const { return running_.load(); }

    asio::io_context& get_io_context() { return io_context_; }

    template<typename Awaitable>
    auto spawn(Awaitable&& awaitable) {
        return asio::co_spawn(io_context_, std::forward<Awaitable>(awaitable), asio::detached);
    }

    template<typename Awaitable, typename CompletionToken>
    auto spawn(Awaitable&& awaitable, CompletionToken&& token) {
        return asio::co_spawn(io_context_,
                              std::forward<Awaitable>(awaitable),
                              std::forward<CompletionToken>(token));
    }

    // Drives the io_context on the calling thread until the task finishes and
    // returns its result; exceptions thrown by the task are rethrown here.
    template<typename T>
    T run_until_complete(asio::awaitable<T> task) {
        auto future = spawn(std::move(task), asio::use_future);
        io_context_.restart();
        auto guard = asio::make_work_guard(io_context_);
        while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            io_context_.run_one();
        }
        guard.reset();
        io_context_.poll();
        return future.get();
    }

  private:
    asio::io_context io_context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_{};
    std::atomic<bool> running_{false};
};
} // namespace core
