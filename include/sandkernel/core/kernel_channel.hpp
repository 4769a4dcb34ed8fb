/*
 * sandkernel C++ - Kernel Channel
 *
 * Line-delimited JSON between the daemon and a kernel process, one
 * message per line over a socket pair. The daemon sends "init", "run"
 * and "shutdown"; the kernel answers "ready" once and one "result" per
 * run.
 */
#ifndef sandkernel_CORE_KERNEL_CHANNEL_HPP
#define sandkernel_CORE_KERNEL_CHANNEL_HPP

#include "json.hpp"
#include "types.hpp"
#include <string>
#include <cstdint>

namespace sandkernel {

// One script run as the kernel receives it
struct RunRequest {
    std::string session_id;
    std::string session_dir;
    std::string code;           // already preprocessed
    int timeout_seconds;
    int64_t memory_bytes;       // 0 disables the ceiling

    RunRequest() : timeout_seconds(0), memory_bytes(0) {}
};

enum class ReadStatus {
    Line,
    Timeout,
    Closed,
    Error
};

class KernelChannel {
public:
    KernelChannel(int in_fd, int out_fd);

    // deadline_ms is on the monotonic_ms() clock; 0 waits forever
    ReadStatus read_line(std::string& line, int64_t deadline_ms);
    bool write_line(const std::string& line);

    // Error also covers a line that is not a JSON object
    ReadStatus receive(Json& message, int64_t deadline_ms);
    bool send(const Json& message);

    static size_t max_line_bytes() { return 512u * 1024 * 1024; }

private:
    KernelChannel(const KernelChannel&);
    KernelChannel& operator=(const KernelChannel&);

    int in_fd_;
    int out_fd_;
    std::string pending_;
};

Json encode_run_request(const RunRequest& request);
bool decode_run_request(const Json& message, RunRequest& out, std::string& error);

// Files are not carried; the daemon sweeps the session directory itself
Json encode_run_result(const ExecutionResult& result, bool charts_used);
bool decode_run_result(const Json& message, ExecutionResult& out, bool& charts_used);

} // namespace sandkernel

#endif // sandkernel_CORE_KERNEL_CHANNEL_HPP
