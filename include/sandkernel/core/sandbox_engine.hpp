/*
 * sandkernel C++ - Sandbox Engine
 *
 * Entry point for every inbound operation. Owns the components and runs
 * a request through them:
 *
 *   request -> Preprocessor -> session lease -> KernelProcess
 *           -> ArtifactSweep -> ArtifactStore
 *
 * Scripts never run in this process: each session's interpreter lives in
 * its own kernel process, so a run that has to be killed takes only its
 * own session down.
 *
 * Every failure comes back as a result value; nothing thrown inside the
 * engine reaches the caller.
 */
#ifndef sandkernel_CORE_SANDBOX_ENGINE_HPP
#define sandkernel_CORE_SANDBOX_ENGINE_HPP

#include "artifact_sweep.hpp"
#include "capability_loader.hpp"
#include "kernel_manager.hpp"
#include "path_guard.hpp"
#include "preprocessor.hpp"
#include "settings.hpp"
#include "types.hpp"
#include "url_fetcher.hpp"
#include "workspace.hpp"
#include <sandkernel/storage/artifact_store.hpp>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace sandkernel {

struct SessionDetails {
    SessionInfo info;
    std::vector<std::pair<std::string, std::string>> variables;     // as of the last run
};

class SandboxEngine {
public:
    explicit SandboxEngine(const SandboxSettings& settings);
    ~SandboxEngine();

    // Directories, capability catalog and storage
    bool start();
    void stop();
    bool is_running() const { return running_; }

    ExecutionResult execute(const ExecutionRequest& request);

    // Validates the request and takes its place in the session queue
    // without blocking. On failure, failure holds the result to return.
    bool reserve(const ExecutionRequest& request, SessionLease& lease, ExecutionResult& failure);

    // Runs a request whose lease came from reserve()
    ExecutionResult execute(const ExecutionRequest& request, SessionLease& lease);

    bool create_session(const std::string& session_id, SessionInfo& info, ExecutionError& error);
    bool list_files(const std::string& session_id, std::vector<FileEntry>& out, ExecutionError& error);
    bool reset_session(const std::string& session_id, bool purge_files, ExecutionError& error);
    bool session_info(const std::string& session_id, SessionDetails& out, ExecutionError& error);
    std::vector<SessionInfo> list_sessions() const;

    FetchResult fetch_url(const std::string& url, const std::string& filename, const std::string& session_id);

    // Idle sweep, stale variable snapshots and expired artifact cleanup
    void maintenance();

    // Sessions with a variable snapshot held
    size_t snapshot_count();

    const SandboxSettings& settings() const { return settings_; }
    CapabilityLoader& capabilities() { return capabilities_; }
    ArtifactStore* artifact_store() { return store_.get(); }

private:
    SandboxEngine(const SandboxEngine&);
    SandboxEngine& operator=(const SandboxEngine&);

    void store_artifacts(const std::string& session_id, std::vector<ArtifactFile>& files);
    void remember_variables(const std::string& session_id, const ExecutionResult& result);
    std::string download_url(const std::string& handle) const;

    struct VariableSnapshot {
        int64_t created_at;
        std::vector<std::pair<std::string, std::string>> variables;
    };

    SandboxSettings settings_;
    PathGuard guard_;
    Workspace workspace_;
    CapabilityLoader capabilities_;
    Preprocessor preprocessor_;
    UrlFetcher fetcher_;
    ArtifactSweep sweep_;
    std::unique_ptr<KernelManager> kernels_;
    std::unique_ptr<SqliteArtifactStore> store_;
    bool running_;

    std::mutex variables_mutex_;
    std::map<std::string, VariableSnapshot> variables_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_SANDBOX_ENGINE_HPP
