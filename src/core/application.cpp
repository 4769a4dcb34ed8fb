/*
 * sandkernel C++ - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <sandkernel/core/application.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <poll.h>
#include <curl/curl.h>
#include <Python.h>

namespace sandkernel {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cerr << AppInfo::NAME << " - Python execution sandbox daemon\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n"
              << "  --config <file>      Configuration file (default: config.json)\n"
              << "  --kernel             Serve one session over stdin (started by the daemon)\n\n"
              << "Requests are read as JSON lines on stdin, responses written to stdout.\n";
}

void print_version() {
    std::cerr << AppInfo::NAME << " v" << AppInfo::VERSION << " (Python " << PY_VERSION << ")\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , initialized_(false)
    , config_file_("config.json")
    , thread_pool_(nullptr)
    , protocol_fd_(-1)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        LOG_WARN("Ignoring unknown argument: %s", argv[i]);
    }
    return true;
}

bool Application::load_config() {
    if (access(config_file_.c_str(), F_OK) != 0) {
        LOG_WARN("No config at %s, using defaults", config_file_.c_str());
        return true;
    }
    if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(), config_.last_error().c_str());
        return false;
    }
    LOG_INFO("Loaded config from %s", config_file_.c_str());
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(Logger::parse_level(config_.get_string("log_level", "info")));
}

bool Application::setup_protocol_stream() {
    fflush(stdout);
    protocol_fd_ = dup(STDOUT_FILENO);
    if (protocol_fd_ < 0) {
        LOG_ERROR("Cannot duplicate stdout: %s", strerror(errno));
        return false;
    }
    if (dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        LOG_ERROR("Cannot redirect stdout: %s", strerror(errno));
        return false;
    }
    return true;
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before threads start)
    curl_global_init(CURL_GLOBAL_ALL);

    if (!parse_args(argc, argv)) {
        running_ = false;
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!load_config()) {
        return false;
    }
    setup_logging();

    settings_ = SandboxSettings::from_config(config_);
    std::string error;
    if (!settings_.validate(error)) {
        LOG_ERROR("Invalid configuration: %s", error.c_str());
        return false;
    }

    if (!setup_protocol_stream()) {
        return false;
    }

    engine_.reset(new SandboxEngine(settings_));
    if (!engine_->start()) {
        LOG_ERROR("Sandbox engine failed to start");
        return false;
    }
    protocol_.reset(new Protocol(*engine_));

    thread_pool_ = new ThreadPool(static_cast<size_t>(settings_.max_concurrent_kernels));
    initialized_ = true;
    return true;
}

int Application::run() {
    LOG_INFO("Entering main loop (poll interval: 100ms)");

    std::string pending;
    char buf[65536];
    int cleanup_counter = 0;

    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, 100);
        if (ready < 0 && errno != EINTR) {
            LOG_ERROR("poll on stdin failed: %s", strerror(errno));
            return 1;
        }

        if (ready > 0) {
            ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n > 0) {
                pending.append(buf, static_cast<size_t>(n));
                size_t nl;
                while ((nl = pending.find('\n')) != std::string::npos) {
                    std::string line = trim(pending.substr(0, nl));
                    pending.erase(0, nl + 1);
                    if (!line.empty()) handle_line(line);
                }
            } else if (n == 0) {
                std::string line = trim(pending);
                if (!line.empty()) handle_line(line);
                LOG_INFO("stdin closed");
                break;
            } else if (errno != EINTR && errno != EAGAIN) {
                LOG_ERROR("read on stdin failed: %s", strerror(errno));
                return 1;
            }
        }

        // Periodic cleanup (~10 seconds)
        if (++cleanup_counter >= 100) {
            cleanup_counter = 0;
            engine_->maintenance();
        }
    }

    if (!running_.load()) {
        LOG_INFO("Received shutdown signal");
    }
    return 0;
}

void Application::handle_line(const std::string& line) {
    ProtocolRequest request;
    Json error;
    if (!Protocol::parse_request(line, request, error)) {
        write_response(error);
        return;
    }

    if (!Protocol::runs_in_background(request.op)) {
        write_response(protocol_->handle(request));
        return;
    }

    if (request.op == RequestOp::Execute) {
        // Take the queue position here so same-session requests keep
        // their input order whatever worker picks them up
        std::shared_ptr<SessionLease> lease = std::make_shared<SessionLease>();
        ExecutionResult failure;
        if (!engine_->reserve(request.execution, *lease, failure)) {
            write_response(Protocol::execution_response(request.id, failure));
            return;
        }
        bool queued = thread_pool_->enqueue([this, request, lease]() {
            write_response(protocol_->handle_execute(request, *lease));
        });
        if (!queued) {
            write_response(Protocol::error_response(request.id, ErrorKind::InternalError, "shutting down"));
        }
        return;
    }

    bool queued = thread_pool_->enqueue([this, request]() {
        write_response(protocol_->handle(request));
    });
    if (!queued) {
        write_response(Protocol::error_response(request.id, ErrorKind::InternalError, "shutting down"));
    }
}

void Application::write_response(const Json& response) {
    std::string line = Protocol::encode(response);
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    const char* data = line.data();
    size_t left = line.size();
    while (left > 0) {
        ssize_t n = write(protocol_fd_, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Writing a response failed: %s", strerror(errno));
            return;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    // Stop thread pool (wait for pending)
    if (thread_pool_) {
        LOG_DEBUG("[App] Stopping thread pool (pending: %zu)", thread_pool_->pending());
        thread_pool_->shutdown();
        delete thread_pool_;
        thread_pool_ = nullptr;
        LOG_DEBUG("[App] Thread pool stopped");
    }

    protocol_.reset();
    if (engine_) {
        engine_->stop();
        engine_.reset();
    }
    if (protocol_fd_ >= 0) {
        close(protocol_fd_);
        protocol_fd_ = -1;
    }

    // Cleanup libcurl
    curl_global_cleanup();

    LOG_INFO("Goodbye!");
}

} // namespace sandkernel
