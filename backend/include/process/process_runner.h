#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/node_config.h"
#include "core/result.h"

namespace nodeward {

/**
 * Owns the single worker process.
 *
 * At most one live child exists at a time. Its stdout and stderr are read
 * line by line on background threads and handed to the line sink with a
 * `STDOUT: ` / `STDERR: ` prefix.
 *
 * Lifecycle:
 *   1. spawn()     fork + exec `<db_path>/openhash daemon ...` in its own process group
 *   2. is_alive()  waitpid(WNOHANG); reaps the child if it has exited
 *   3. terminate() SIGTERM to the group, wait `grace`, then SIGKILL
 */
class ProcessRunner {
public:
    using LineSink = std::function<void(std::string)>;

    static constexpr std::chrono::milliseconds kDefaultGrace{5000};

    explicit ProcessRunner(LineSink sink, std::chrono::milliseconds grace = kDefaultGrace);

    /// Kills a still-running child.
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&)            = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    /// `openhash.exe` on Windows, `openhash` elsewhere.
    static std::string executable_name();

    /// The worker binary lives inside the data directory it serves.
    static std::filesystem::path executable_path(const std::filesystem::path& db_path);

    /// Argument vector (without argv[0]) for a run of `config`.
    static std::vector<std::string> build_arguments(const NodeConfig& config);

    /// Launches the worker. Fails with ExecutableMissing, SpawnRejected or AlreadyRunning.
    Status spawn(const NodeConfig& config);

    /// Graceful stop with forced kill after the grace period. No-op without a child.
    Status terminate();

    /// Non-blocking. False once the child has exited.
    bool is_alive();

    [[nodiscard]] pid_t pid() const { return pid_.load(); }

private:
    struct Handle {
        pid_t                    pid = -1;
        std::atomic<bool>        stop_readers{false};
        std::vector<std::thread> readers;
    };

    void start_reader(Handle& handle, int fd, const char* prefix);
    bool has_exited_locked();
    void release_locked();

    LineSink                  sink_;
    std::chrono::milliseconds grace_;

    std::mutex              mutex_;
    std::unique_ptr<Handle> handle_;
    std::atomic<pid_t>      pid_{-1};
};

}  // namespace nodeward
