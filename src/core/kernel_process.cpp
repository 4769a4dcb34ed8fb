#include <sandkernel/core/kernel_process.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>

namespace sandkernel {

namespace {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

// Child side of fork(): only async-signal-safe calls until exec
void close_inherited_fds() {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, 3U, ~0U, 0U) == 0) return;
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) max_fd = 1024;
    for (long fd = 3; fd < max_fd; ++fd) {
        close(static_cast<int>(fd));
    }
}

std::string restarted(const std::string& message) {
    return message + "; the session was restarted";
}

} // anonymous namespace

// ============================================================================
// KernelProcess Implementation
// ============================================================================

KernelProcess::KernelProcess(const SandboxSettings& settings, const std::string& session_id,
                             const std::string& session_dir)
    : settings_(settings)
    , session_id_(session_id)
    , session_dir_(session_dir)
    , pid_(-1)
    , fd_(-1)
    , generation_(0)
{}

KernelProcess::~KernelProcess() {
    if (pid_ > 0 && channel_) {
        Json bye;
        bye["op"] = "shutdown";
        channel_->send(bye);
    }
    kill_child();
}

bool KernelProcess::start(std::string& error) {
    kill_child();

    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        error = std::string("socketpair failed: ") + strerror(errno);
        return false;
    }

    // Everything the child needs is prepared before fork()
    std::string binary = settings_.kernel_binary;
    std::string flag = "--kernel";
    std::vector<char*> argv;
    argv.push_back(&binary[0]);
    argv.push_back(&flag[0]);
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + strerror(errno);
        close(fds[0]);
        close(fds[1]);
        return false;
    }

    if (pid == 0) {
        setpgid(0, 0);
        if (dup2(fds[1], STDIN_FILENO) < 0 || dup2(fds[1], STDOUT_FILENO) < 0) {
            _exit(127);
        }
        close_inherited_fds();
        execv(binary.c_str(), argv.data());
        _exit(127);
    }

    close(fds[1]);
    pid_ = pid;
    fd_ = fds[0];
    channel_.reset(new KernelChannel(fd_, fd_));
    ++generation_;

    Json init;
    init["op"] = "init";
    init["settings"] = settings_.to_json();
    init["session_id"] = session_id_;
    init["session_dir"] = session_dir_;
    init["log_level"] = log_level_name(Logger::instance().level());
    if (!channel_->send(init)) {
        error = "kernel process did not accept its configuration";
        kill_child();
        return false;
    }

    Json ready;
    ReadStatus status = channel_->receive(ready, monotonic_ms() + startup_timeout_ms());
    if (status != ReadStatus::Line || ready.value("op", std::string()) != "ready") {
        error = status == ReadStatus::Timeout ? "kernel process did not start in time"
                                              : "kernel process failed to start";
        if (status == ReadStatus::Line && ready.contains("error")) {
            error += ": " + ready.value("error", std::string());
        }
        kill_child();
        return false;
    }

    LOG_INFO("[Kernel] %s: process %d ready (generation %d)", session_id_.c_str(), static_cast<int>(pid_),
             generation_);
    return true;
}

ExecutionResult KernelProcess::run(const RunRequest& request, bool& charts_used) {
    charts_used = false;
    std::string error;

    if (!alive() && !start(error)) {
        LOG_ERROR("[Kernel] %s: %s", session_id_.c_str(), error.c_str());
        return ExecutionResult::failure(request.session_id, ErrorKind::InternalError, error);
    }
    if (!channel_->send(encode_run_request(request))) {
        // Died between runs; one fresh child gets the request
        LOG_WARN("[Kernel] %s: process %d is gone, restarting", session_id_.c_str(), static_cast<int>(pid_));
        if (!start(error) || !channel_->send(encode_run_request(request))) {
            return ExecutionResult::failure(request.session_id, ErrorKind::InternalError,
                                            error.empty() ? "kernel process is unavailable" : error);
        }
    }

    int64_t started = monotonic_ms();
    int64_t hard_deadline = started +
        static_cast<int64_t>(request.timeout_seconds + settings_.kill_grace_seconds) * 1000;

    Json message;
    ReadStatus status;
    for (;;) {
        status = channel_->receive(message, hard_deadline);
        if (status != ReadStatus::Line) break;
        if (message.value("op", std::string()) == "result") break;
        LOG_DEBUG("[Kernel] %s: ignoring message '%s'", session_id_.c_str(),
                  message.value("op", std::string()).c_str());
    }

    if (status == ReadStatus::Line) {
        ExecutionResult result;
        if (decode_run_result(message, result, charts_used)) {
            result.session_id = request.session_id;
            return result;
        }
        kill_child();
        return ExecutionResult::failure(request.session_id, ErrorKind::InternalError,
                                        restarted("kernel process sent a malformed result"));
    }

    ExecutionResult result;
    if (status == ReadStatus::Timeout) {
        LOG_WARN("[Kernel] %s: run ignored its %ds deadline, killing process %d", session_id_.c_str(),
                 request.timeout_seconds, static_cast<int>(pid_));
        kill_child();
        result = ExecutionResult::failure(request.session_id, ErrorKind::Timeout,
                                          restarted("Execution exceeded the " +
                                                    std::to_string(request.timeout_seconds) + "s time limit"));
    } else {
        // The socket closes as the process dies; give the exit a moment to land
        int wstatus = reap(1000);
        if (wstatus >= 0 && WIFSIGNALED(wstatus) && WTERMSIG(wstatus) == SIGKILL) {
            // Nobody here sent it: the kernel's OOM killer did
            LOG_WARN("[Kernel] %s: process was killed while running", session_id_.c_str());
            result = ExecutionResult::failure(request.session_id, ErrorKind::ResourceExceeded,
                                              restarted("Execution exceeded the " +
                                                        std::to_string(request.memory_bytes / (1024 * 1024)) +
                                                        " MB memory limit"));
        } else {
            LOG_ERROR("[Kernel] %s: process exited unexpectedly (status %d)", session_id_.c_str(), wstatus);
            result = ExecutionResult::failure(request.session_id, ErrorKind::InternalError,
                                              restarted("kernel process exited unexpectedly"));
        }
        kill_child();
    }
    result.execution_time_ms = monotonic_ms() - started;
    return result;
}

int KernelProcess::reap(int wait_ms) {
    if (pid_ <= 0) return -1;
    int64_t until = monotonic_ms() + wait_ms;
    int wstatus = 0;
    for (;;) {
        pid_t r = waitpid(pid_, &wstatus, wait_ms < 0 ? 0 : WNOHANG);
        if (r == pid_) {
            pid_ = -1;
            return wstatus;
        }
        if (r < 0 && errno != EINTR) return -1;
        if (r == 0) {
            if (monotonic_ms() >= until) return -1;
            usleep(10000);
        }
    }
}

void KernelProcess::kill_child() {
    if (pid_ > 0) {
        kill(-pid_, SIGKILL);
        kill(pid_, SIGKILL);
        reap(-1);
        pid_ = -1;
    }
    channel_.reset();
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

} // namespace sandkernel
