#include <sandkernel/core/kernel_manager.hpp>
#include <sandkernel/core/path_guard.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

namespace sandkernel {

// ============================================================================
// SessionLease Implementation
// ============================================================================

SessionLease::SessionLease()
    : manager_(nullptr)
    , ticket_(0)
    , held_(false)
{}

SessionLease::SessionLease(KernelManager* manager, std::shared_ptr<Session> session, TicketMutex::Ticket ticket)
    : manager_(manager)
    , session_(session)
    , ticket_(ticket)
    , held_(false)
{}

SessionLease::~SessionLease() {
    release();
}

SessionLease::SessionLease(SessionLease&& other)
    : manager_(other.manager_)
    , session_(std::move(other.session_))
    , ticket_(other.ticket_)
    , held_(other.held_)
{
    other.manager_ = nullptr;
    other.held_ = false;
}

SessionLease& SessionLease::operator=(SessionLease&& other) {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        session_ = std::move(other.session_);
        ticket_ = other.ticket_;
        held_ = other.held_;
        other.manager_ = nullptr;
        other.held_ = false;
    }
    return *this;
}

void SessionLease::wait() {
    if (!manager_ || held_) return;
    session_->ticket.wait(ticket_);
    held_ = true;
}

void SessionLease::release() {
    if (!manager_) return;
    if (held_) {
        session_->ticket.release(ticket_);
    } else {
        session_->ticket.cancel(ticket_);
    }
    manager_->finish_lease(*session_);
    manager_ = nullptr;
    held_ = false;
    session_.reset();
}

const std::string& SessionLease::session_id() const {
    static const std::string empty;
    return session_ ? session_->id : empty;
}

const std::string& SessionLease::session_dir() const {
    static const std::string empty;
    return session_ ? session_->dir : empty;
}

std::shared_ptr<Namespace> SessionLease::ns() {
    if (!manager_ || !held_) return std::shared_ptr<Namespace>();
    return manager_->namespace_for(*session_);
}

bool SessionLease::uses_charts() const {
    return manager_ ? manager_->uses_charts(*session_) : false;
}

void SessionLease::record_execution(bool used_charts) {
    if (manager_) {
        manager_->record_execution(*session_, used_charts);
    }
}

// ============================================================================
// KernelManager Implementation
// ============================================================================

KernelManager::KernelManager(const SandboxSettings& settings, const Workspace& workspace,
                             NamespaceFactory factory, Clock clock)
    : settings_(settings)
    , workspace_(workspace)
    , factory_(factory)
    , clock_(clock ? clock : Clock(monotonic_ms))
{}

KernelManager::~KernelManager() {
    Dropped dropped;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : sessions_) {
        if (kv.second->ns) {
            dropped.push_back(kv.second->ns);
            kv.second->ns.reset();
        }
    }
    sessions_.clear();
}

bool KernelManager::create(const std::string& requested_id, SessionInfo& info, ExecutionError& error) {
    std::string session_id = requested_id.empty() ? generate_uuid() : requested_id;
    if (!PathGuard::is_valid_session_id(session_id)) {
        error = ExecutionError(ErrorKind::InvalidRequest, "invalid session id '" + session_id + "'");
        return false;
    }

    Dropped dropped;
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<Session> session = find_or_create_locked(session_id, error, dropped);
    if (!session) return false;
    info = describe_locked(*session);
    return true;
}

bool KernelManager::reserve(const std::string& session_id, SessionLease& lease, ExecutionError& error) {
    if (!PathGuard::is_valid_session_id(session_id)) {
        error = ExecutionError(ErrorKind::InvalidRequest, "invalid session id '" + session_id + "'");
        return false;
    }

    Dropped dropped;
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<Session> session = find_or_create_locked(session_id, error, dropped);
    if (!session) return false;

    ++session->busy;
    session->last_activity = clock_();
    lease = SessionLease(this, session, session->ticket.take());
    return true;
}

bool KernelManager::acquire(const std::string& session_id, SessionLease& lease, ExecutionError& error) {
    if (!reserve(session_id, lease, error)) return false;
    lease.wait();
    return true;
}

bool KernelManager::reset(const std::string& session_id, bool purge_files, ExecutionError& error) {
    Dropped dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            if (it->second->busy > 0) {
                error = ExecutionError(ErrorKind::InvalidRequest, "session '" + session_id + "' is busy");
                return false;
            }
            evict_locked(it, dropped, "reset");
        } else if (!purge_files || !workspace_.session_dir_exists(session_id)) {
            error = ExecutionError(ErrorKind::InvalidRequest, "unknown session '" + session_id + "'");
            return false;
        }
    }

    if (purge_files && !workspace_.remove_session_dir(session_id)) {
        error = ExecutionError(ErrorKind::InternalError, "failed to remove files of session '" + session_id + "'");
        return false;
    }
    LOG_INFO("[Kernels] Session %s reset%s", session_id.c_str(), purge_files ? " (files removed)" : "");
    return true;
}

bool KernelManager::info(const std::string& session_id, SessionInfo& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    out = describe_locked(*it->second);
    return true;
}

std::vector<SessionInfo> KernelManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionInfo> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
        out.push_back(describe_locked(*kv.second));
    }
    return out;
}

bool KernelManager::exists(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

int KernelManager::sweep_idle() {
    Dropped dropped;
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_idle_locked(dropped);
}

size_t KernelManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::shared_ptr<Session> KernelManager::find_or_create_locked(const std::string& session_id,
                                                              ExecutionError& error, Dropped& dropped) {
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }

    sweep_idle_locked(dropped);
    if (!make_room_locked(error, dropped)) {
        return std::shared_ptr<Session>();
    }
    if (!workspace_.create_session_dir(session_id)) {
        error = ExecutionError(ErrorKind::InternalError, "cannot create directory for session '" + session_id + "'");
        return std::shared_ptr<Session>();
    }

    std::shared_ptr<Session> session = std::make_shared<Session>();
    session->id = session_id;
    session->dir = workspace_.session_dir(session_id);
    session->created_at = current_timestamp();
    session->last_activity = clock_();
    sessions_[session_id] = session;

    LOG_INFO("[Kernels] Session %s created (%zu/%d active)", session_id.c_str(),
             sessions_.size(), settings_.max_concurrent_kernels);
    return session;
}

bool KernelManager::make_room_locked(ExecutionError& error, Dropped& dropped) {
    if (static_cast<int>(sessions_.size()) < settings_.max_concurrent_kernels) {
        return true;
    }

    SessionTable::iterator victim = sessions_.end();
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
        if (it->second->busy > 0) continue;
        if (victim == sessions_.end() || it->second->last_activity < victim->second->last_activity) {
            victim = it;
        }
    }

    if (victim == sessions_.end()) {
        LOG_WARN("[Kernels] All %zu sessions are busy, refusing a new one", sessions_.size());
        error = ExecutionError(ErrorKind::CapacityExceeded,
                               "all " + std::to_string(sessions_.size()) + " sessions are busy, try again later");
        return false;
    }

    evict_locked(victim, dropped, "capacity");
    return true;
}

void KernelManager::evict_locked(SessionTable::iterator it, Dropped& dropped, const char* why) {
    std::shared_ptr<Session> session = it->second;
    if (session->ns) {
        dropped.push_back(session->ns);
        session->ns.reset();
    }
    sessions_.erase(it);

    if (!settings_.retain_session_dirs) {
        workspace_.remove_session_dir(session->id);
    }
    LOG_INFO("[Kernels] Session %s evicted (%s, %lld executions)", session->id.c_str(), why,
             static_cast<long long>(session->executions));
}

int KernelManager::sweep_idle_locked(Dropped& dropped) {
    const int64_t now = clock_();
    const int64_t limit_ms = static_cast<int64_t>(settings_.idle_timeout) * 1000;
    int evicted = 0;

    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto next = it;
        ++next;
        if (it->second->busy == 0 && now - it->second->last_activity > limit_ms) {
            evict_locked(it, dropped, "idle");
            ++evicted;
        }
        it = next;
    }
    if (evicted > 0) {
        LOG_DEBUG("[Kernels] Idle sweep removed %d session(s)", evicted);
    }
    return evicted;
}

SessionInfo KernelManager::describe_locked(const Session& session) const {
    SessionInfo info;
    info.id = session.id;
    info.dir = session.dir;
    info.created_at = session.created_at;
    info.idle_seconds = (clock_() - session.last_activity) / 1000;
    info.executions = session.executions;
    info.busy = session.busy > 0;
    info.uses_charts = session.uses_charts;
    return info;
}

void KernelManager::finish_lease(Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session.busy > 0) --session.busy;
    session.last_activity = clock_();
}

std::shared_ptr<Namespace> KernelManager::namespace_for(Session& session) {
    // Only the lease holder gets here, and eviction skips busy sessions,
    // so session.ns is not touched concurrently
    if (!session.ns && factory_) {
        session.ns = factory_(session.id, session.dir);
        if (!session.ns) {
            LOG_ERROR("[Kernels] Failed to create namespace for session %s", session.id.c_str());
        }
    }
    return session.ns;
}

bool KernelManager::uses_charts(const Session& session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session.uses_charts;
}

void KernelManager::record_execution(Session& session, bool used_charts) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++session.executions;
    if (used_charts) session.uses_charts = true;
    session.last_activity = clock_();
}

} // namespace sandkernel
