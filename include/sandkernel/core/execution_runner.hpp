/*
 * sandkernel C++ - Execution Runner
 *
 * Runs one preprocessed script in the kernel's namespace under a
 * wall-clock deadline and an address-space ceiling.
 *
 * A watchdog thread ticks every 100 ms. Past the deadline it raises
 * SandboxTimeout in the running thread, again on every tick until the
 * script unwinds. A script that keeps swallowing it is not this class's
 * problem: the daemon kills the whole kernel process once the deadline
 * plus a grace period has passed. Output written before the interruption
 * is kept.
 */
#ifndef sandkernel_CORE_EXECUTION_RUNNER_HPP
#define sandkernel_CORE_EXECUTION_RUNNER_HPP

#include "capability_loader.hpp"
#include "kernel_channel.hpp"
#include "path_guard.hpp"
#include "python_runtime.hpp"
#include "settings.hpp"
#include "types.hpp"

namespace sandkernel {

class ExecutionRunner {
public:
    ExecutionRunner(const SandboxSettings& settings, const PathGuard& guard, CapabilityLoader& capabilities);

    // GIL held. charts_used is set when the run touched the chart capability.
    ExecutionResult run(const RunRequest& request, py::dict ns, bool& charts_used);

    static int watchdog_interval_ms() { return 100; }

private:
    ExecutionRunner(const ExecutionRunner&);
    ExecutionRunner& operator=(const ExecutionRunner&);

    const SandboxSettings& settings_;
    const PathGuard& guard_;
    CapabilityLoader& capabilities_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_EXECUTION_RUNNER_HPP
