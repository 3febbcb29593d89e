/**
 * ProcessRunner — fork/exec of the worker binary and capture of its output.
 */

#include "process/process_runner.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace nodeward {

namespace {

constexpr auto kPollStep = std::chrono::milliseconds(50);
constexpr int  kReaderPollMs = 100;

bool set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

bool make_pipe(int fds[2]) {
    if (pipe(fds) != 0) return false;
    if (!set_cloexec(fds[0]) || !set_cloexec(fds[1])) {
        close(fds[0]);
        close(fds[1]);
        fds[0] = fds[1] = -1;
        return false;
    }
    return true;
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) close(fds[i]);
        fds[i] = -1;
    }
}

/// Reads `fd` until EOF, or until asked to stop and nothing is left to read.
void read_lines(int fd, const char* prefix, const ProcessRunner::LineSink& sink,
                const std::atomic<bool>& stop) {
    std::string pending;
    char buf[4096];

    for (;;) {
        pollfd pfd{fd, POLLIN, 0};
        int rc = poll(&pfd, 1, kReaderPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            if (stop.load()) break;
            continue;
        }

        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;

        pending.append(buf, static_cast<std::size_t>(n));
        std::size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            sink(std::string(prefix) + pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
    }

    if (!pending.empty()) sink(std::string(prefix) + pending);
    close(fd);
}

}  // namespace

ProcessRunner::ProcessRunner(LineSink sink, std::chrono::milliseconds grace)
    : sink_(std::move(sink)), grace_(grace) {}

ProcessRunner::~ProcessRunner() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_ && !has_exited_locked()) {
        spdlog::warn("[ProcessRunner] Killing node (pid {}) on shutdown", handle_->pid);
        kill(-handle_->pid, SIGKILL);
        int status = 0;
        waitpid(handle_->pid, &status, 0);
    }
    release_locked();
}

std::string ProcessRunner::executable_name() {
#ifdef _WIN32
    return "openhash.exe";
#else
    return "openhash";
#endif
}

std::filesystem::path ProcessRunner::executable_path(const std::filesystem::path& db_path) {
    return db_path / executable_name();
}

std::vector<std::string> ProcessRunner::build_arguments(const NodeConfig& config) {
    return {
        "daemon",
        "--api-port", std::to_string(config.api_port),
        "--db",       config.db_path,
        "--p2p-port", std::to_string(config.p2p_port),
    };
}

Status ProcessRunner::spawn(const NodeConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (handle_ && !has_exited_locked()) {
        return Error{ErrorCode::AlreadyRunning, "Node is already running"};
    }
    release_locked();

    auto binary = executable_path(config.db_path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(binary, ec)) {
        return Error{ErrorCode::ExecutableMissing,
                     "OpenHash executable not found. Please download it first."};
    }

    int out[2] = {-1, -1};
    int err[2] = {-1, -1};
    int exec_status[2] = {-1, -1};
    if (!make_pipe(out) || !make_pipe(err) || !make_pipe(exec_status)) {
        int saved = errno;
        close_pipe(out);
        close_pipe(err);
        close_pipe(exec_status);
        return Error{ErrorCode::SpawnRejected,
                     std::string("Failed to create pipes: ") + std::strerror(saved)};
    }

    // Everything the child needs is prepared before fork.
    std::string binary_str = binary.string();
    auto args = build_arguments(config);
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(binary_str.c_str()));
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pipe(out);
        close_pipe(err);
        close_pipe(exec_status);
        return Error{ErrorCode::SpawnRejected,
                     std::string("Failed to start process: ") + std::strerror(saved)};
    }

    if (pid == 0) {
        setpgid(0, 0);
        dup2(out[1], STDOUT_FILENO);
        dup2(err[1], STDERR_FILENO);
        execv(argv[0], argv.data());
        int code = errno;
        ssize_t ignored = write(exec_status[1], &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    // Both sides call setpgid so the group exists before any signal is sent.
    setpgid(pid, pid);

    close(out[1]);
    close(err[1]);
    close(exec_status[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_status[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(out[0]);
        close(err[0]);
        return Error{ErrorCode::SpawnRejected,
                     std::string("Failed to start process: ") + std::strerror(child_errno)};
    }

    handle_ = std::make_unique<Handle>();
    handle_->pid = pid;
    pid_.store(pid);
    start_reader(*handle_, out[0], "STDOUT: ");
    start_reader(*handle_, err[0], "STDERR: ");

    spdlog::info("[ProcessRunner] Spawned {} (pid {})", binary_str, pid);
    return Status::ok();
}

Status ProcessRunner::terminate() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!handle_) return Status::ok();
    if (has_exited_locked()) {
        release_locked();
        return Status::ok();
    }

    pid_t pid = handle_->pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH) {
        spdlog::warn("[ProcessRunner] SIGTERM to pid {} failed: {}", pid, std::strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (has_exited_locked()) {
            spdlog::info("[ProcessRunner] Node (pid {}) exited gracefully", pid);
            release_locked();
            return Status::ok();
        }
        std::this_thread::sleep_for(kPollStep);
    }

    spdlog::warn("[ProcessRunner] Node (pid {}) ignored SIGTERM for {} ms, sending SIGKILL", pid,
                 grace_.count());
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        int saved = errno;
        release_locked();
        return Error{ErrorCode::TerminateFailed,
                     std::string("Failed to stop process: ") + std::strerror(saved)};
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    release_locked();
    return Status::ok();
}

bool ProcessRunner::is_alive() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        // spawn or terminate in progress; report what was last known.
        return pid_.load() > 0;
    }
    if (!handle_) return false;
    if (has_exited_locked()) {
        spdlog::info("[ProcessRunner] Node (pid {}) has exited", handle_->pid);
        release_locked();
        return false;
    }
    return true;
}

void ProcessRunner::start_reader(Handle& handle, int fd, const char* prefix) {
    const std::atomic<bool>& stop = handle.stop_readers;
    handle.readers.emplace_back([this, fd, prefix, &stop] { read_lines(fd, prefix, sink_, stop); });
}

bool ProcessRunner::has_exited_locked() {
    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(handle_->pid, &status, WNOHANG);
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) return false;
    if (rc == handle_->pid) {
        if (WIFEXITED(status)) {
            spdlog::info("[ProcessRunner] Node exited with code {}", WEXITSTATUS(status));
        } else if (WIFSIGNALED(status)) {
            spdlog::info("[ProcessRunner] Node terminated by signal {}", WTERMSIG(status));
        }
    }
    // rc < 0 (ECHILD): already reaped elsewhere.
    return true;
}

void ProcessRunner::release_locked() {
    if (!handle_) return;
    handle_->stop_readers.store(true);
    for (auto& t : handle_->readers) {
        if (t.joinable()) t.join();
    }
    handle_.reset();
    pid_.store(-1);
}

}  // namespace nodeward
