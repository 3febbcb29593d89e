#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/node_config.h"
#include "core/result.h"
#include "core/run_state.h"
#include "events/event_bus.h"
#include "logs/log_buffer.h"
#include "process/process_runner.h"
#include "update/downloader.h"
#include "update/install_record.h"

namespace nodeward {

/**
 * Owns the node's run state and arbitrates start / stop / update requests.
 *
 * Only one request is processed at a time; requests that are not allowed in
 * the current state fail immediately instead of queuing. Updates run on a
 * worker thread and report through the event bus.
 *
 * Event handlers run on the thread that caused the event. status_changed is
 * delivered while the request lock is held, so its handlers must not call
 * start(), stop() or check_for_update(). download_complete and
 * download_failed are delivered after the state is back to Stopped and
 * without that lock; their handlers may start the node directly.
 */
class Supervisor {
public:
    explicit Supervisor(Downloader downloader,
                        std::chrono::milliseconds terminate_grace = ProcessRunner::kDefaultGrace);

    /// Waits for an in-flight update and stops a running node.
    ~Supervisor();

    Supervisor(const Supervisor&)            = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Validates `config` and launches the node. Blocks until the spawn completes.
    Status start(const NodeConfig& config);

    /// Stops the node. Always ends in Stopped, even when termination reports an error.
    Status stop();

    /// Admits an update of the binary in `db_path` and returns; progress and
    /// the outcome arrive through events().
    Status check_for_update(const std::filesystem::path& db_path);

    [[nodiscard]] RunState query_status() const;

    [[nodiscard]] std::vector<LogLine> query_logs() const { return logs_.lines(); }
    [[nodiscard]] std::string logs_text() const { return logs_.text(); }
    void clear_logs() { logs_.clear(); }

    /**
     * Liveness check. If the node died without stop(), moves to Stopped and
     * returns true. Skipped while another request is being processed.
     */
    bool reconcile();

    /// Blocks until the current update worker (if any) has finished.
    void wait_for_update();

    [[nodiscard]] static bool executable_exists(const std::filesystem::path& db_path);

    [[nodiscard]] static std::optional<InstallRecord> installed_release(
        const std::filesystem::path& db_path) {
        return InstallRecord::read(db_path);
    }

    [[nodiscard]] EventBus& events() { return events_; }

private:
    void set_state(RunState next);
    void run_update(std::filesystem::path db_path);
    Result<InstallRecord> install_latest(const std::filesystem::path& db_path);
    void log(const std::string& message);

    EventBus   events_;
    LogBuffer  logs_;
    Downloader downloader_;

    std::mutex         intent_mutex_;
    mutable std::mutex state_mutex_;
    RunState           state_ = RunState::Stopped;

    std::mutex  update_thread_mutex_;
    std::thread update_thread_;

    ProcessRunner runner_;
};

}  // namespace nodeward
