/*
 * sandkernel C++ - Kernel Manager
 *
 * Bounded table of sessions. Each session owns one script namespace and
 * one directory. Calls on the same session are serialized in submission
 * order through a ticket lock; different sessions proceed independently.
 *
 * At capacity a new session evicts the least recently used session that
 * has no lease outstanding. When every session is busy the request fails
 * with CapacityExceeded and nothing is evicted. Idle sessions are swept
 * on each new session and periodically from the daemon loop.
 */
#ifndef sandkernel_CORE_KERNEL_MANAGER_HPP
#define sandkernel_CORE_KERNEL_MANAGER_HPP

#include "settings.hpp"
#include "ticket_mutex.hpp"
#include "types.hpp"
#include "workspace.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <functional>
#include <cstdint>

namespace sandkernel {

// Script namespace owned by a session. In the daemon it is the kernel
// process holding the interpreter; tests use plain subclasses.
class Namespace {
public:
    virtual ~Namespace() {}
};

typedef std::function<std::shared_ptr<Namespace>(const std::string& session_id,
                                                 const std::string& session_dir)> NamespaceFactory;

// Milliseconds from an arbitrary epoch; injectable for tests
typedef std::function<int64_t()> Clock;

struct Session {
    std::string id;
    std::string dir;
    int64_t created_at;         // unix seconds
    int64_t last_activity;      // Clock milliseconds
    int64_t executions;
    bool uses_charts;
    int busy;                   // leases held or queued
    TicketMutex ticket;
    std::shared_ptr<Namespace> ns;

    Session() : created_at(0), last_activity(0), executions(0), uses_charts(false), busy(0) {}
};

struct SessionInfo {
    std::string id;
    std::string dir;
    int64_t created_at;
    int64_t idle_seconds;
    int64_t executions;
    bool busy;
    bool uses_charts;

    SessionInfo() : created_at(0), idle_seconds(0), executions(0), busy(false), uses_charts(false) {}
};

class KernelManager;

// Place in a session's queue. A reserved lease holds a ticket; wait()
// turns it into exclusive use of the session. Destruction releases or
// cancels the ticket on every path.
class SessionLease {
public:
    SessionLease();
    ~SessionLease();

    SessionLease(SessionLease&& other);
    SessionLease& operator=(SessionLease&& other);

    bool valid() const { return manager_ != nullptr; }
    bool held() const { return held_; }

    void wait();
    void release();

    const std::string& session_id() const;
    const std::string& session_dir() const;

    // Held leases only. Created on first use; nullptr when the factory fails.
    std::shared_ptr<Namespace> ns();

    bool uses_charts() const;
    void record_execution(bool used_charts);

private:
    friend class KernelManager;

    SessionLease(KernelManager* manager, std::shared_ptr<Session> session, TicketMutex::Ticket ticket);
    SessionLease(const SessionLease&);
    SessionLease& operator=(const SessionLease&);

    KernelManager* manager_;
    std::shared_ptr<Session> session_;
    TicketMutex::Ticket ticket_;
    bool held_;
};

class KernelManager {
public:
    KernelManager(const SandboxSettings& settings, const Workspace& workspace,
                  NamespaceFactory factory, Clock clock = Clock());
    ~KernelManager();

    // Existing sessions are returned as they are. An empty id generates one.
    bool create(const std::string& requested_id, SessionInfo& info, ExecutionError& error);

    // Queue for a session, creating it when absent. Does not block.
    bool reserve(const std::string& session_id, SessionLease& lease, ExecutionError& error);

    // reserve() followed by wait()
    bool acquire(const std::string& session_id, SessionLease& lease, ExecutionError& error);

    // Drop a session. Fails while it has leases outstanding.
    bool reset(const std::string& session_id, bool purge_files, ExecutionError& error);

    bool info(const std::string& session_id, SessionInfo& out) const;
    std::vector<SessionInfo> list() const;
    bool exists(const std::string& session_id) const;

    // Evict sessions idle past limits.idle_timeout; returns how many
    int sweep_idle();

    size_t active_count() const;

private:
    friend class SessionLease;

    typedef std::vector<std::shared_ptr<Namespace>> Dropped;
    typedef std::map<std::string, std::shared_ptr<Session>> SessionTable;

    KernelManager(const KernelManager&);
    KernelManager& operator=(const KernelManager&);

    std::shared_ptr<Session> find_or_create_locked(const std::string& session_id, ExecutionError& error, Dropped& dropped);
    bool make_room_locked(ExecutionError& error, Dropped& dropped);
    void evict_locked(SessionTable::iterator it, Dropped& dropped, const char* why);
    int sweep_idle_locked(Dropped& dropped);
    SessionInfo describe_locked(const Session& session) const;

    void finish_lease(Session& session);
    std::shared_ptr<Namespace> namespace_for(Session& session);
    bool uses_charts(const Session& session) const;
    void record_execution(Session& session, bool used_charts);

    const SandboxSettings& settings_;
    const Workspace& workspace_;
    NamespaceFactory factory_;
    Clock clock_;

    mutable std::mutex mutex_;
    SessionTable sessions_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_KERNEL_MANAGER_HPP
