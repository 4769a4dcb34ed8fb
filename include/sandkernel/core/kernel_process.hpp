/*
 * sandkernel C++ - Kernel Process
 *
 * Daemon-side handle of one session's interpreter. The interpreter lives
 * in a child process started from the daemon binary with --kernel and
 * talks over a socket pair (see kernel_channel.hpp).
 *
 * A run that outlives its deadline plus limits.kill_grace_seconds gets
 * the child killed with SIGKILL; the session keeps its directory but
 * loses its variables, and the next run starts a fresh child. The same
 * happens when the child dies on its own, e.g. killed by the OOM killer.
 */
#ifndef sandkernel_CORE_KERNEL_PROCESS_HPP
#define sandkernel_CORE_KERNEL_PROCESS_HPP

#include "kernel_channel.hpp"
#include "kernel_manager.hpp"
#include "settings.hpp"
#include "types.hpp"
#include <string>
#include <memory>
#include <sys/types.h>

namespace sandkernel {

class KernelProcess : public Namespace {
public:
    KernelProcess(const SandboxSettings& settings, const std::string& session_id, const std::string& session_dir);
    ~KernelProcess();

    // Spawns the child and waits for it to report ready
    bool start(std::string& error);
    bool alive() const { return pid_ > 0; }
    pid_t pid() const { return pid_; }

    // Blocks until the child answers, the hard deadline passes or the
    // child dies. The caller holds the session lease.
    ExecutionResult run(const RunRequest& request, bool& charts_used);

    // Number of children started for this session
    int generation() const { return generation_; }

    static int startup_timeout_ms() { return 30000; }

private:
    KernelProcess(const KernelProcess&);
    KernelProcess& operator=(const KernelProcess&);

    void kill_child();
    // Exit status, -1 when still running after wait_ms (< 0 waits forever)
    int reap(int wait_ms);

    const SandboxSettings& settings_;
    std::string session_id_;
    std::string session_dir_;
    pid_t pid_;
    int fd_;
    std::unique_ptr<KernelChannel> channel_;
    int generation_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_KERNEL_PROCESS_HPP
