/**
 * Supervisor — the node's lifecycle state machine.
 *
 * Serializes start / stop / update behind one mutex, delegates the actual work
 * to ProcessRunner and Downloader, and forwards their outcomes to observers.
 * Every path out of Starting, Stopping and Updating ends in a stable state.
 */

#include "node/supervisor.h"

#include <ctime>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace nodeward {

namespace {

std::string utc_now_iso8601() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

}  // namespace

Supervisor::Supervisor(Downloader downloader, std::chrono::milliseconds terminate_grace)
    : downloader_(std::move(downloader)),
      runner_([this](std::string line) { logs_.append(std::move(line)); }, terminate_grace) {}

Supervisor::~Supervisor() {
    wait_for_update();
    if (query_status() == RunState::Running) {
        auto s = stop();
        if (!s) spdlog::error("[Supervisor] Stop on shutdown failed: {}", s.error().message);
    }
}

Status Supervisor::start(const NodeConfig& config) {
    if (auto valid = config.validate(); !valid) {
        spdlog::warn("[Supervisor] Rejected start: {}", valid.error().message);
        return valid;
    }

    std::lock_guard<std::mutex> lock(intent_mutex_);
    auto current = query_status();
    if (current == RunState::Updating) {
        return Error{ErrorCode::AlreadyRunning, "An update is in progress"};
    }
    if (current != RunState::Stopped) {
        return Error{ErrorCode::AlreadyRunning, "Node is already running"};
    }

    set_state(RunState::Starting);
    log(fmt::format("Starting OpenHash node with config: {}", config.to_json().dump()));

    auto spawned = runner_.spawn(config);
    if (!spawned) {
        log("Failed to start process: " + spawned.error().message);
        set_state(RunState::Stopped);
        if (spawned.error().code == ErrorCode::ExecutableMissing) return spawned;
        return Error{ErrorCode::SpawnFailed, spawned.error().message};
    }

    set_state(RunState::Running);
    log("OpenHash node started successfully");
    return Status::ok();
}

Status Supervisor::stop() {
    std::lock_guard<std::mutex> lock(intent_mutex_);
    if (query_status() != RunState::Running) {
        return Error{ErrorCode::NotRunning, "No running process found"};
    }

    set_state(RunState::Stopping);
    auto terminated = runner_.terminate();
    if (!terminated) {
        log(terminated.error().message);
    } else {
        log("OpenHash node stopped");
    }
    set_state(RunState::Stopped);
    return terminated;
}

Status Supervisor::check_for_update(const std::filesystem::path& db_path) {
    if (trim(db_path.string()).empty()) {
        return Error{ErrorCode::InvalidConfig, "Database path is not set."};
    }

    std::lock_guard<std::mutex> lock(intent_mutex_);
    if (query_status() != RunState::Stopped) {
        return Error{ErrorCode::Busy, "Busy"};
    }

    set_state(RunState::Updating);

    std::lock_guard<std::mutex> thread_lock(update_thread_mutex_);
    // The previous worker has already left Updating; it may still be
    // delivering its final event.
    if (update_thread_.joinable()) {
        if (update_thread_.get_id() == std::this_thread::get_id()) {
            update_thread_.detach();
        } else {
            update_thread_.join();
        }
    }
    update_thread_ = std::thread(&Supervisor::run_update, this, db_path);
    return Status::ok();
}

RunState Supervisor::query_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool Supervisor::reconcile() {
    std::unique_lock<std::mutex> lock(intent_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return false;
    if (query_status() != RunState::Running) return false;
    if (runner_.is_alive()) return false;

    log("OpenHash node exited unexpectedly");
    set_state(RunState::Stopped);
    return true;
}

void Supervisor::wait_for_update() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(update_thread_mutex_);
        worker = std::move(update_thread_);
    }
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

bool Supervisor::executable_exists(const std::filesystem::path& db_path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(ProcessRunner::executable_path(db_path), ec);
}

void Supervisor::set_state(RunState next) {
    RunState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_;
        if (!is_valid_transition(previous, next)) {
            spdlog::error("[Supervisor] Refusing transition {} -> {}", to_string(previous),
                          to_string(next));
            return;
        }
        state_ = next;
    }
    spdlog::info("[Supervisor] {} -> {}", to_string(previous), to_string(next));
    events_.status_changed.publish(StatusChanged{next});
}

void Supervisor::run_update(std::filesystem::path db_path) {
    Result<InstallRecord> outcome = Error{ErrorCode::IOError, "Update did not run"};
    try {
        outcome = install_latest(db_path);
    } catch (const std::exception& e) {
        outcome = Error{ErrorCode::IOError, std::string("Update failed: ") + e.what()};
    }

    if (outcome) {
        log("Download completed successfully");
    } else {
        log("Update failed: " + outcome.error().message);
    }

    {
        std::lock_guard<std::mutex> lock(intent_mutex_);
        set_state(RunState::Stopped);
    }

    if (outcome) {
        events_.download_complete.publish(
            DownloadComplete{outcome.value().version, outcome.value().sha256});
    } else {
        events_.download_failed.publish(
            DownloadFailed{outcome.error().code, outcome.error().message});
    }
}

Result<InstallRecord> Supervisor::install_latest(const std::filesystem::path& db_path) {
    log("Checking for updates...");
    auto release = downloader_.fetch_latest_release();
    if (!release) return release.error();

    const auto& info = release.value();
    log("Found release: " + info.version);
    log("Downloading " + info.asset_name + "...");

    auto digest = downloader_.download(
        info.url, ProcessRunner::executable_path(db_path), info.size,
        [this](const DownloadProgress& progress) {
            spdlog::debug("[Supervisor] Downloaded {} / {} bytes", progress.bytes_received,
                          progress.bytes_total);
            events_.download_progress.publish(progress);
        });
    if (!digest) return digest.error();

    InstallRecord record{info.version, digest.value(), utc_now_iso8601()};
    if (auto written = record.write(db_path); !written) {
        // The binary itself is in place; a missing record only loses the version label.
        spdlog::warn("[Supervisor] {}", written.error().message);
    }
    log("Installed " + info.version + " (sha256 " + record.sha256 + ")");
    return record;
}

void Supervisor::log(const std::string& message) {
    spdlog::info("[Supervisor] {}", message);
    logs_.append(message);
}

}  // namespace nodeward
