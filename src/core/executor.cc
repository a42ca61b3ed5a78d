#include "executor.h"
#include <spdlog/spdlog.h>

namespace core {
void Executor::start() {
    if (running_.exchange(true)) {
        spdlog::warn("[Executor::start] Executor is already running");
        return;
    }
    if (!work_guard_) {
        work_guard_.emplace(asio::make_work_guard(io_context_));
    }
    spdlog::debug("[Executor::start] io_context running");
    io_context_.run();
}

void Executor::stop() {
    if (!running_.exchange(false)) {
        spdlog::debug("[Executor::stop] Executor is not running");
        return;
    }

    if (work_guard_) {
        work_guard_.reset();
    }
    io_context_.stop();
    spdlog::debug("[Executor::stop] io_context stopped");
}
} // namespace core
