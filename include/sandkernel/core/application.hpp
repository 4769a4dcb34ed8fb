/*
 * sandkernel C++ - Application
 *
 * Process lifecycle for the daemon: command line, configuration, signal
 * handling, the engine, the worker pool and the request loop.
 *
 * Requests arrive as JSON lines on stdin. Responses go to the original
 * stdout, which is moved to a private descriptor at startup; fd 1 is
 * pointed at stderr so nothing a library prints can corrupt the stream.
 */
#ifndef sandkernel_CORE_APPLICATION_HPP
#define sandkernel_CORE_APPLICATION_HPP

#include "config.hpp"
#include "protocol.hpp"
#include "sandbox_engine.hpp"
#include "settings.hpp"
#include "thread_pool.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <atomic>

namespace sandkernel {

struct AppInfo {
    static constexpr const char* NAME = "sandkerneld";
    static constexpr const char* VERSION = "1.0.0";
};

class Application {
public:
    static Application& instance();

    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_protocol_stream();

    void handle_line(const std::string& line);
    void write_response(const Json& response);

    std::atomic<bool> running_;
    bool initialized_;
    std::string config_file_;
    Config config_;
    SandboxSettings settings_;
    std::unique_ptr<SandboxEngine> engine_;
    std::unique_ptr<Protocol> protocol_;
    ThreadPool* thread_pool_;

    int protocol_fd_;
    std::mutex write_mutex_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_APPLICATION_HPP
