#include <sandkernel/core/kernel_host.hpp>
#include <sandkernel/core/capability_loader.hpp>
#include <sandkernel/core/execution_runner.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/path_guard.hpp>
#include <sandkernel/core/python_runtime.hpp>
#include <sandkernel/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>

namespace sandkernel {

namespace {

// A kernel whose daemon died would otherwise live on as an orphan
void watch_parent(pid_t parent) {
    for (;;) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        if (getppid() != parent) {
            _exit(0);
        }
    }
}

// Startup failure, reported in place of "ready"
void report_failure(KernelChannel& channel, const std::string& error) {
    LOG_ERROR("[Kernel] %s", error.c_str());
    Json j;
    j["op"] = "error";
    j["error"] = error;
    if (!channel.send(j)) {
        LOG_DEBUG("[Kernel] Daemon is gone; failure not delivered");
    }
}

} // anonymous namespace

// ============================================================================
// KernelHost Implementation
// ============================================================================

KernelHost::KernelHost()
    : protocol_fd_(-1)
{}

KernelHost::~KernelHost() {
    if (protocol_fd_ >= 0) close(protocol_fd_);
}

bool KernelHost::setup_streams() {
    protocol_fd_ = fcntl(STDIN_FILENO, F_DUPFD_CLOEXEC, 3);
    if (protocol_fd_ < 0) {
        LOG_ERROR("[Kernel] Cannot duplicate the daemon socket: %s", strerror(errno));
        return false;
    }
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 || dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        LOG_ERROR("[Kernel] Cannot redirect standard streams: %s", strerror(errno));
        if (devnull >= 0) close(devnull);
        return false;
    }
    close(devnull);
    return true;
}

bool KernelHost::read_init(KernelChannel& channel, std::string& error) {
    Json init;
    if (channel.receive(init, monotonic_ms() + 30000) != ReadStatus::Line ||
        init.value("op", std::string()) != "init") {
        error = "no init message from the daemon";
        return false;
    }

    try {
        Config cfg;
        if (!cfg.load_string(init.at("settings").dump())) {
            error = "settings are not a JSON object";
            return false;
        }
        settings_ = SandboxSettings::from_config(cfg);
        session_id_ = init.at("session_id").get<std::string>();
        session_dir_ = init.at("session_dir").get<std::string>();
        Logger::instance().set_level(Logger::parse_level(init.value("log_level", std::string("info"))));
    } catch (const std::exception& e) {
        error = std::string("malformed init message: ") + e.what();
        return false;
    }
    if (!settings_.validate(error)) {
        return false;
    }
    if (!PathGuard::is_valid_session_id(session_id_)) {
        error = "invalid session id '" + session_id_ + "'";
        return false;
    }
    return true;
}

void KernelHost::harden() {
    // Numeric libraries would otherwise start a thread pool per core
    setenv("OPENBLAS_NUM_THREADS", "1", 1);
    setenv("OMP_NUM_THREADS", "1", 1);
    setenv("MKL_NUM_THREADS", "1", 1);

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        LOG_WARN("[Kernel] PR_SET_NO_NEW_PRIVS failed: %s", strerror(errno));
    }
    struct rlimit core;
    core.rlim_cur = 0;
    core.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &core) != 0) {
        LOG_WARN("[Kernel] Disabling core dumps failed: %s", strerror(errno));
    }
    if (chdir(session_dir_.c_str()) != 0) {
        LOG_WARN("[Kernel] %s: cannot enter %s: %s", session_id_.c_str(), session_dir_.c_str(), strerror(errno));
    }

    std::thread watcher(watch_parent, getppid());
    watcher.detach();
}

int KernelHost::run() {
    signal(SIGPIPE, SIG_IGN);
    if (!setup_streams()) {
        return 1;
    }

    KernelChannel channel(protocol_fd_, protocol_fd_);
    std::string error;
    if (!read_init(channel, error)) {
        report_failure(channel, error);
        return 1;
    }
    harden();

    PythonRuntime& runtime = PythonRuntime::instance();
    if (!runtime.initialize()) {
        report_failure(channel, "Python runtime failed to start");
        return 1;
    }

    int code = serve(channel);
    runtime.finalize();
    return code;
}

// Interpreter objects all die here, before the interpreter does
int KernelHost::serve(KernelChannel& channel) {
    PythonRuntime& runtime = PythonRuntime::instance();
    PathGuard guard(settings_);
    CapabilityLoader capabilities;

    CapabilityFactory factory = runtime.capability_factory(capabilities);
    capabilities.register_defaults(factory);
    capabilities.register_extra(settings_.extra_capabilities, factory);
    capabilities.seal();
    int failed = capabilities.preload_eager();
    if (failed > 0) {
        LOG_WARN("[Kernel] %s: %d eager capabilities failed to load", session_id_.c_str(), failed);
    }

    py::dict ns;
    try {
        ns = runtime.new_namespace(session_id_, session_dir_);
    } catch (const py::error_already_set& e) {
        report_failure(channel, std::string("namespace setup failed: ") + e.what());
        return 1;
    }

    ExecutionRunner runner(settings_, guard, capabilities);
    Json ready;
    ready["op"] = "ready";
    ready["pid"] = static_cast<int>(getpid());
    if (!channel.send(ready)) {
        return 1;
    }
    LOG_DEBUG("[Kernel] %s: serving from process %d", session_id_.c_str(), static_cast<int>(getpid()));

    for (;;) {
        Json message;
        ReadStatus status;
        {
            py::gil_scoped_release release;
            status = channel.receive(message, 0);
        }
        if (status == ReadStatus::Closed) {
            LOG_DEBUG("[Kernel] %s: daemon closed the channel", session_id_.c_str());
            break;
        }
        if (status != ReadStatus::Line) {
            LOG_ERROR("[Kernel] %s: channel failed", session_id_.c_str());
            return 1;
        }

        std::string op = message.value("op", std::string());
        if (op == "shutdown") break;
        if (op != "run") {
            LOG_WARN("[Kernel] %s: unknown message '%s'", session_id_.c_str(), op.c_str());
            continue;
        }

        RunRequest request;
        ExecutionResult result;
        bool charts_used = false;
        std::string error;
        if (!decode_run_request(message, request, error)) {
            result = ExecutionResult::failure(session_id_, ErrorKind::InvalidRequest, error);
        } else {
            result = runner.run(request, ns, charts_used);
        }
        if (!channel.send(encode_run_result(result, charts_used))) {
            LOG_ERROR("[Kernel] %s: cannot deliver the result", session_id_.c_str());
            return 1;
        }
    }
    return 0;
}

} // namespace sandkernel
