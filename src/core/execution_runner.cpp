#include <sandkernel/core/execution_runner.hpp>
#include <sandkernel/core/artifact_sweep.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/memory_ceiling.hpp>
#include <sandkernel/core/utils.hpp>

#include <thread>
#include <mutex>
#include <condition_variable>

namespace sandkernel {

namespace {

// Interrupts the run thread once its deadline passes. Lives for one run.
class Watchdog {
public:
    explicit Watchdog(RunContext& ctx)
        : ctx_(ctx)
        , stop_(false)
        , raised_(false)
    {}

    ~Watchdog() { stop(); }

    void start() {
        thread_ = std::thread(&Watchdog::loop, this);
    }

    // Call without the GIL: the loop may be waiting for it
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    bool raised() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return raised_;
    }

private:
    Watchdog(const Watchdog&);
    Watchdog& operator=(const Watchdog&);

    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_) {
            cv_.wait_for(lock, std::chrono::milliseconds(ExecutionRunner::watchdog_interval_ms()));
            if (stop_) break;
            if (monotonic_ms() < ctx_.deadline_ms) continue;

            lock.unlock();
            bool finished = false;
            {
                py::gil_scoped_acquire gil;
                if (ctx_.done) {
                    finished = true;
                } else if (ctx_.host_call_depth.load() == 0) {
                    PyThreadState_SetAsyncExc(ctx_.thread_id, PythonRuntime::instance().timeout_exception().ptr());
                }
            }
            lock.lock();

            if (finished) break;
            if (!raised_) {
                raised_ = true;
                LOG_DEBUG("[Runner] %s: deadline passed, raising SandboxTimeout", ctx_.session_id.c_str());
            }
        }
    }

    RunContext& ctx_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_;
    bool raised_;
};

ErrorKind classify(const py::error_already_set& e, const RunContext& ctx, bool memory_armed) {
    if (e.matches(PythonRuntime::instance().timeout_exception())) return ErrorKind::Timeout;
    if (e.matches(PyExc_MemoryError) && memory_armed) return ErrorKind::ResourceExceeded;
    if (e.matches(PyExc_PermissionError) && ctx.path_rejected) return ErrorKind::PathRejected;
    return ErrorKind::ScriptRuntimeError;
}

std::string limit_message(ErrorKind kind, const RunRequest& request) {
    if (kind == ErrorKind::Timeout) {
        return "Execution exceeded the " + std::to_string(request.timeout_seconds) + "s time limit";
    }
    return "Execution exceeded the " + std::to_string(request.memory_bytes / (1024 * 1024)) + " MB memory limit";
}

// The caught exception of a failed run, into result.error. GIL held.
void record_failure(const py::error_already_set& e, const RunContext& ctx, const RunRequest& request,
                    bool memory_armed, ExecutionResult& result) {
    ErrorKind kind = classify(e, ctx, memory_armed);
    std::string message;
    if (kind == ErrorKind::Timeout || kind == ErrorKind::ResourceExceeded) {
        message = limit_message(kind, request);
    } else if (kind == ErrorKind::PathRejected) {
        message = ctx.path_message;
    } else {
        message = py::str(e.type().attr("__name__"));
        std::string detail = py::str(e.value());
        if (!detail.empty()) message += ": " + detail;
    }

    result.error = ExecutionError(kind, message);
    result.error.traceback = PythonRuntime::instance().format_exception(e);
}

// Put back container modules rebound by "from X import X". GIL held.
void restore_shadows(RunContext& ctx) {
    for (const auto& record : ctx.shadows) {
        py::str target(record.target);
        if (ctx.ns.contains(target) && ctx.ns[target].is(record.member)) {
            ctx.ns[target] = record.container;
        }
    }
    ctx.shadows.clear();
}

} // anonymous namespace

// ============================================================================
// ExecutionRunner Implementation
// ============================================================================

ExecutionRunner::ExecutionRunner(const SandboxSettings& settings, const PathGuard& guard,
                                 CapabilityLoader& capabilities)
    : settings_(settings)
    , guard_(guard)
    , capabilities_(capabilities)
{}

ExecutionResult ExecutionRunner::run(const RunRequest& request, py::dict ns, bool& charts_used) {
    charts_used = false;
    PythonRuntime& runtime = PythonRuntime::instance();

    ExecutionResult result;
    result.session_id = request.session_id;

    RunContext ctx;
    ctx.session_id = request.session_id;
    ctx.session_dir = request.session_dir;
    ctx.guard = &guard_;
    ctx.capabilities = &capabilities_;
    ctx.ns = ns;
    ctx.max_output = static_cast<size_t>(settings_.max_output_size);
    ctx.thread_id = PyThread_get_thread_ident();
    set_current_run(&ctx);

    MemoryCeiling ceiling;
    int64_t started = monotonic_ms();
    Watchdog watchdog(ctx);

    py::object code;
    try {
        code = runtime.compile_script(request.code);
    } catch (const py::error_already_set& e) {
        record_failure(e, ctx, request, false, result);
    }

    if (code) {
        ctx.deadline_ms = monotonic_ms() + static_cast<int64_t>(request.timeout_seconds) * 1000;
        watchdog.start();
        if (request.memory_bytes > 0 && ceiling.arm(request.memory_bytes)) {
            ctx.memory = &ceiling;
        }

        bool failed = false;
        try {
            py::object value = py::reinterpret_steal<py::object>(PyEval_EvalCode(code.ptr(), ns.ptr(), ns.ptr()));
            if (!value) throw py::error_already_set();
        } catch (const py::error_already_set& e) {
            failed = true;
            bool armed = ceiling.armed();
            ceiling.disarm();
            record_failure(e, ctx, request, armed, result);
        }
        ceiling.disarm();
        ctx.memory = nullptr;
        ctx.done = true;
        result.memory_peak_bytes = ceiling.peak_growth();
        if (failed) {
            LOG_DEBUG("[Runner] %s: script raised %s", request.session_id.c_str(),
                      error_kind_name(result.error.kind));
        }
    }
    ctx.done = true;

    // Anything the watchdog queued after the script unwound
    PyThreadState_SetAsyncExc(ctx.thread_id, nullptr);
    if (PyErr_Occurred()) PyErr_Clear();

    try {
        runtime.collect(ns, result.result_json, result.variables);
    } catch (const py::error_already_set& e) {
        LOG_WARN("[Runner] %s: collecting variables failed: %s", request.session_id.c_str(), e.what());
    }
    restore_shadows(ctx);

    {
        py::gil_scoped_release release;
        watchdog.stop();
    }
    result.execution_time_ms = monotonic_ms() - started;

    // A script that swallowed the interruption still ran out of time
    if (watchdog.raised() &&
        (result.error.kind == ErrorKind::None || result.error.kind == ErrorKind::ScriptRuntimeError)) {
        std::string traceback = result.error.traceback;
        result.error = ExecutionError(ErrorKind::Timeout, limit_message(ErrorKind::Timeout, request));
        result.error.traceback = traceback;
    }

    if (ctx.charts_claimed) {
        PyChartSurface surface(ctx);
        try {
            ArtifactSweep::drain_charts(surface, ctx.charts);
        } catch (const py::error_already_set& e) {
            LOG_WARN("[Runner] %s: draining charts failed: %s", request.session_id.c_str(), e.what());
        }
    }
    charts_used = ctx.charts_claimed;
    set_current_run(nullptr);

    result.stdout_text = ctx.out;
    result.stderr_text = ctx.err;
    result.output_truncated = ctx.truncated;
    result.charts = ctx.charts;
    result.success = result.error.kind == ErrorKind::None;

    if (result.success) {
        LOG_INFO("[Runner] %s: ok in %lld ms (%zu charts)", request.session_id.c_str(),
                 static_cast<long long>(result.execution_time_ms), result.charts.size());
    } else {
        LOG_INFO("[Runner] %s: %s after %lld ms: %s", request.session_id.c_str(),
                 error_kind_name(result.error.kind), static_cast<long long>(result.execution_time_ms),
                 result.error.message.c_str());
    }
    return result;
}

} // namespace sandkernel
