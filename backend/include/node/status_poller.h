#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>

namespace nodeward {

class Supervisor;

/**
 * Periodically reconciles the supervisor's state with the process's actual
 * liveness. The timer lives on its own strand; start() and stop() may be
 * called from any thread.
 */
class StatusPoller {
public:
    StatusPoller(asio::io_context& io, Supervisor& supervisor, std::chrono::milliseconds interval);

    void start();
    void stop();

private:
    void schedule();

    asio::steady_timer        timer_;
    Supervisor&               supervisor_;
    std::chrono::milliseconds interval_;
    std::atomic<bool>         running_{false};
};

}  // namespace nodeward
