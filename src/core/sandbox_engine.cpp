#include <sandkernel/core/sandbox_engine.hpp>
#include <sandkernel/core/kernel_process.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

namespace sandkernel {

SandboxEngine::SandboxEngine(const SandboxSettings& settings)
    : settings_(settings)
    , guard_(settings_)
    , workspace_(settings_, guard_)
    , capabilities_()
    , preprocessor_(capabilities_)
    , fetcher_(settings_, guard_)
    , sweep_(settings_.max_file_size_bytes())
    , running_(false)
{}

SandboxEngine::~SandboxEngine() {
    stop();
}

bool SandboxEngine::start() {
    if (running_) return true;

    std::string error;
    if (!settings_.validate(error)) {
        LOG_ERROR("[Engine] Invalid configuration: %s", error.c_str());
        return false;
    }
    if (!workspace_.init()) {
        return false;
    }

    // Modules are only ever imported inside kernel processes; here the
    // catalog drives the preprocessor
    if (!capabilities_.sealed()) {
        CapabilityFactory factory = [](const CapabilitySpec&) {
            return LoadOutcome::fail("capabilities load inside kernel processes");
        };
        capabilities_.register_defaults(factory);
        capabilities_.register_extra(settings_.extra_capabilities, factory);
        capabilities_.seal();
    }

    if (settings_.storage_enabled) {
        store_.reset(new SqliteArtifactStore());
        if (!store_->open(settings_.db_path)) {
            LOG_WARN("[Engine] Artifact storage disabled");
            store_.reset();
        }
    }

    const SandboxSettings& settings = settings_;
    NamespaceFactory factory = [&settings](const std::string& session_id, const std::string& session_dir) {
        std::shared_ptr<KernelProcess> kernel = std::make_shared<KernelProcess>(settings, session_id, session_dir);
        std::string error;
        if (!kernel->start(error)) {
            LOG_ERROR("[Engine] %s: %s", session_id.c_str(), error.c_str());
            return std::shared_ptr<Namespace>();
        }
        return std::static_pointer_cast<Namespace>(kernel);
    };
    kernels_.reset(new KernelManager(settings_, workspace_, factory));
    running_ = true;

    LOG_INFO("[Engine] Ready: %d kernels max, %ds default timeout, %lld MB memory ceiling",
             settings_.max_concurrent_kernels, settings_.default_execution_time,
             static_cast<long long>(settings_.max_memory_mb));
    return true;
}

void SandboxEngine::stop() {
    if (!running_) return;
    running_ = false;

    // Kills every kernel process
    kernels_.reset();
    if (store_) {
        store_->close();
        store_.reset();
    }
    LOG_INFO("[Engine] Stopped");
}

// ============================================================================
// Execution
// ============================================================================

ExecutionResult SandboxEngine::execute(const ExecutionRequest& request) {
    SessionLease lease;
    ExecutionResult failure;
    if (!reserve(request, lease, failure)) {
        return failure;
    }
    return execute(request, lease);
}

bool SandboxEngine::reserve(const ExecutionRequest& request, SessionLease& lease, ExecutionResult& failure) {
    if (!running_) {
        failure = ExecutionResult::failure(request.session_id, ErrorKind::InternalError, "engine is not running");
        return false;
    }
    if (settings_.effective_timeout(request.has_timeout, request.timeout_seconds) < 0) {
        failure = ExecutionResult::failure(request.session_id, ErrorKind::InvalidRequest,
                                           "timeout must be a positive number of seconds");
        return false;
    }
    if (settings_.effective_memory_mb(request.has_memory_limit, request.memory_limit_mb) < 0) {
        failure = ExecutionResult::failure(request.session_id, ErrorKind::InvalidRequest,
                                           "memory_limit_mb must be positive");
        return false;
    }

    ExecutionError error;
    if (!kernels_->reserve(request.session_id, lease, error)) {
        LOG_WARN("[Engine] %s: %s", request.session_id.c_str(), error.message.c_str());
        failure = ExecutionResult::failure(request.session_id, error.kind, error.message);
        return false;
    }
    return true;
}

ExecutionResult SandboxEngine::execute(const ExecutionRequest& request, SessionLease& lease) {
    if (!running_ || !lease.valid()) {
        return ExecutionResult::failure(request.session_id, ErrorKind::InternalError, "no session lease");
    }

    // Rewriting needs no session state, so it happens while we queue
    PreprocessResult rewritten = preprocessor_.preprocess(request.code);
    for (const auto& entry : rewritten.audit) {
        LOG_DEBUG("[Engine] %s: line %d %s: %s", request.session_id.c_str(), entry.line,
                  audit_action_name(entry.action), entry.statement.c_str());
    }
    for (const auto& notice : rewritten.notices()) {
        LOG_INFO("[Engine] %s: %s", request.session_id.c_str(), notice.c_str());
    }

    lease.wait();
    std::shared_ptr<Namespace> ns = lease.ns();
    KernelProcess* kernel = dynamic_cast<KernelProcess*>(ns.get());
    if (!kernel) {
        return ExecutionResult::failure(request.session_id, ErrorKind::InternalError,
                                        "session kernel could not be started");
    }

    RunRequest run;
    run.session_id = lease.session_id();
    run.session_dir = lease.session_dir();
    run.code = rewritten.code;
    run.timeout_seconds = settings_.effective_timeout(request.has_timeout, request.timeout_seconds);
    run.memory_bytes = settings_.enforce_memory_limit
                           ? settings_.effective_memory_mb(request.has_memory_limit, request.memory_limit_mb) *
                                 1024 * 1024
                           : 0;

    DirSnapshot before = DirSnapshot::take(run.session_dir);
    bool charts_used = false;
    ExecutionResult result = kernel->run(run, charts_used);
    result.artifacts = sweep_.collect_files(run.session_dir, before);
    result.notices = rewritten.notices();

    lease.record_execution(charts_used);
    lease.release();

    store_artifacts(request.session_id, result.artifacts);
    remember_variables(request.session_id, result);
    return result;
}

void SandboxEngine::store_artifacts(const std::string& session_id, std::vector<ArtifactFile>& files) {
    if (!store_) return;
    for (auto& file : files) {
        if (file.oversized) continue;
        std::string handle = store_->store(file.content, file.filename, session_id, settings_.ttl_hours);
        if (handle.empty()) {
            LOG_WARN("[Engine] %s: storing %s failed", session_id.c_str(), file.filename.c_str());
            continue;
        }
        file.handle = handle;
        file.download_url = download_url(handle);
    }
}

std::string SandboxEngine::download_url(const std::string& handle) const {
    if (settings_.public_url.empty()) return "";
    std::string base = settings_.public_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/dl/" + handle;
}

void SandboxEngine::remember_variables(const std::string& session_id, const ExecutionResult& result) {
    SessionInfo info;
    if (!kernels_->info(session_id, info)) return;

    std::lock_guard<std::mutex> lock(variables_mutex_);
    VariableSnapshot& snap = variables_[session_id];
    snap.created_at = info.created_at;
    snap.variables = result.variables;
}

// ============================================================================
// Sessions
// ============================================================================

bool SandboxEngine::create_session(const std::string& session_id, SessionInfo& info, ExecutionError& error) {
    if (!running_) {
        error = ExecutionError(ErrorKind::InternalError, "engine is not running");
        return false;
    }
    return kernels_->create(session_id, info, error);
}

bool SandboxEngine::list_files(const std::string& session_id, std::vector<FileEntry>& out, ExecutionError& error) {
    if (!PathGuard::is_valid_session_id(session_id)) {
        error = ExecutionError(ErrorKind::InvalidRequest, "invalid session id '" + session_id + "'");
        return false;
    }
    if (!workspace_.list_files(session_id, out)) {
        error = ExecutionError(ErrorKind::InvalidRequest, "unknown session '" + session_id + "'");
        return false;
    }
    return true;
}

bool SandboxEngine::reset_session(const std::string& session_id, bool purge_files, ExecutionError& error) {
    if (!running_) {
        error = ExecutionError(ErrorKind::InternalError, "engine is not running");
        return false;
    }
    if (!kernels_->reset(session_id, purge_files, error)) return false;

    std::lock_guard<std::mutex> lock(variables_mutex_);
    variables_.erase(session_id);
    return true;
}

bool SandboxEngine::session_info(const std::string& session_id, SessionDetails& out, ExecutionError& error) {
    if (!running_ || !kernels_->info(session_id, out.info)) {
        error = ExecutionError(ErrorKind::InvalidRequest, "unknown session '" + session_id + "'");
        return false;
    }

    out.variables.clear();
    std::lock_guard<std::mutex> lock(variables_mutex_);
    auto it = variables_.find(session_id);
    if (it != variables_.end()) {
        // A snapshot from an evicted incarnation of this id is stale
        if (it->second.created_at == out.info.created_at && out.info.executions > 0) {
            out.variables = it->second.variables;
        } else {
            variables_.erase(it);
        }
    }
    return true;
}

size_t SandboxEngine::snapshot_count() {
    std::lock_guard<std::mutex> lock(variables_mutex_);
    return variables_.size();
}

std::vector<SessionInfo> SandboxEngine::list_sessions() const {
    if (!running_) return std::vector<SessionInfo>();
    return kernels_->list();
}

FetchResult SandboxEngine::fetch_url(const std::string& url, const std::string& filename,
                                     const std::string& session_id) {
    if (!running_) return FetchResult::fail("engine is not running");

    // The download lands in the session directory, so the session must exist
    SessionInfo info;
    ExecutionError error;
    if (!kernels_->create(session_id, info, error)) {
        return FetchResult::fail(error.message);
    }
    return fetcher_.fetch(url, filename, session_id);
}

void SandboxEngine::maintenance() {
    if (!running_) return;
    int evicted = kernels_->sweep_idle();
    if (evicted > 0) {
        LOG_INFO("[Engine] Swept %d idle sessions", evicted);
    }

    // Snapshots of sessions dropped by eviction
    size_t pruned = 0;
    {
        std::lock_guard<std::mutex> lock(variables_mutex_);
        for (auto it = variables_.begin(); it != variables_.end();) {
            if (kernels_->exists(it->first)) {
                ++it;
            } else {
                it = variables_.erase(it);
                ++pruned;
            }
        }
    }
    if (pruned > 0) {
        LOG_DEBUG("[Engine] Dropped %zu variable snapshots of evicted sessions", pruned);
    }
    if (store_) {
        store_->cleanup_expired();
    }
}

} // namespace sandkernel
