/*
 * sandkernel C++ - Python execution sandbox daemon
 *
 * Runs caller-supplied Python scripts in persistent per-session
 * namespaces, confined to per-session directories.
 *
 * Usage:
 *   ./sandkerneld [--config config.json]
 *
 * Each session's interpreter runs in a child started as
 * "sandkerneld --kernel" by the daemon itself.
 */
#include <sandkernel/core/application.hpp>
#include <sandkernel/core/kernel_host.hpp>

#include <cstring>

int main(int argc, char* argv[]) {
    if (argc > 1 && strcmp(argv[1], "--kernel") == 0) {
        sandkernel::KernelHost host;
        return host.run();
    }

    auto& app = sandkernel::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        int code = app.is_running() ? 1 : 0;
        app.shutdown();
        return code;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
