#include "node/status_poller.h"

#include <spdlog/spdlog.h>

#include "node/supervisor.h"

namespace nodeward {

StatusPoller::StatusPoller(asio::io_context& io, Supervisor& supervisor,
                           std::chrono::milliseconds interval)
    : timer_(asio::make_strand(io)), supervisor_(supervisor), interval_(interval) {}

void StatusPoller::start() {
    running_ = true;
    asio::post(timer_.get_executor(), [this] { schedule(); });
}

void StatusPoller::stop() {
    running_ = false;
    asio::post(timer_.get_executor(), [this] { timer_.cancel(); });
}

void StatusPoller::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || !running_) return;
        if (ec) {
            spdlog::warn("[StatusPoller] Timer error: {}", ec.message());
        } else if (supervisor_.reconcile()) {
            spdlog::warn("[StatusPoller] Node stopped without a stop request");
        }
        schedule();
    });
}

}  // namespace nodeward
