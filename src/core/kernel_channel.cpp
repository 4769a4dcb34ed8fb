#include <sandkernel/core/kernel_channel.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <sys/socket.h>

namespace sandkernel {

// ============================================================================
// KernelChannel Implementation
// ============================================================================

KernelChannel::KernelChannel(int in_fd, int out_fd)
    : in_fd_(in_fd)
    , out_fd_(out_fd)
{}

ReadStatus KernelChannel::read_line(std::string& line, int64_t deadline_ms) {
    char buf[65536];
    for (;;) {
        size_t nl = pending_.find('\n');
        if (nl != std::string::npos) {
            line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            return ReadStatus::Line;
        }
        if (pending_.size() > max_line_bytes()) {
            LOG_ERROR("[Channel] Message above %zu bytes", max_line_bytes());
            return ReadStatus::Error;
        }

        int wait_ms = -1;
        if (deadline_ms > 0) {
            int64_t left = deadline_ms - monotonic_ms();
            if (left <= 0) return ReadStatus::Timeout;
            wait_ms = left > 1000 ? 1000 : static_cast<int>(left);
        }

        struct pollfd pfd;
        pfd.fd = in_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Channel] poll failed: %s", strerror(errno));
            return ReadStatus::Error;
        }
        if (ready == 0) continue;

        ssize_t n = read(in_fd_, buf, sizeof(buf));
        if (n > 0) {
            pending_.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            return ReadStatus::Closed;
        } else if (errno != EINTR && errno != EAGAIN) {
            if (errno == ECONNRESET) return ReadStatus::Closed;
            LOG_ERROR("[Channel] read failed: %s", strerror(errno));
            return ReadStatus::Error;
        }
    }
}

bool KernelChannel::write_line(const std::string& line) {
    std::string data = line;
    data += '\n';

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        // A peer that died must not take this process down with SIGPIPE
        ssize_t n = ::send(out_fd_, p, left, MSG_NOSIGNAL);
        if (n < 0 && errno == ENOTSOCK) {
            n = ::write(out_fd_, p, left);
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_DEBUG("[Channel] write failed: %s", strerror(errno));
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

ReadStatus KernelChannel::receive(Json& message, int64_t deadline_ms) {
    std::string line;
    ReadStatus status = read_line(line, deadline_ms);
    if (status != ReadStatus::Line) return status;

    try {
        message = Json::parse(line);
    } catch (const std::exception& e) {
        LOG_ERROR("[Channel] Malformed message: %s", e.what());
        return ReadStatus::Error;
    }
    if (!message.is_object()) {
        LOG_ERROR("[Channel] Message is not an object");
        return ReadStatus::Error;
    }
    return ReadStatus::Line;
}

bool KernelChannel::send(const Json& message) {
    return write_line(message.dump(-1, ' ', false, Json::error_handler_t::replace));
}

// ============================================================================
// Message codec
// ============================================================================

Json encode_run_request(const RunRequest& request) {
    Json j;
    j["op"] = "run";
    j["session_id"] = request.session_id;
    j["session_dir"] = request.session_dir;
    j["code"] = request.code;
    j["timeout"] = request.timeout_seconds;
    j["memory_bytes"] = request.memory_bytes;
    return j;
}

bool decode_run_request(const Json& message, RunRequest& out, std::string& error) {
    try {
        out = RunRequest();
        out.session_id = message.at("session_id").get<std::string>();
        out.session_dir = message.at("session_dir").get<std::string>();
        out.code = message.at("code").get<std::string>();
        out.timeout_seconds = message.at("timeout").get<int>();
        out.memory_bytes = message.value("memory_bytes", static_cast<int64_t>(0));
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    if (out.timeout_seconds <= 0) {
        error = "timeout must be positive";
        return false;
    }
    return true;
}

Json encode_run_result(const ExecutionResult& result, bool charts_used) {
    Json j;
    j["op"] = "result";
    j["success"] = result.success;
    j["stdout"] = result.stdout_text;
    j["stderr"] = result.stderr_text;
    j["truncated"] = result.output_truncated;
    j["error_kind"] = error_kind_name(result.error.kind);
    j["error"] = result.error.message;
    j["traceback"] = result.error.traceback;
    if (!result.result_json.empty()) j["result_json"] = result.result_json;

    Json vars = Json::array();
    for (const auto& v : result.variables) {
        vars.push_back(Json::array({v.first, v.second}));
    }
    j["variables"] = vars;

    Json charts = Json::array();
    for (const auto& c : result.charts) {
        Json chart;
        chart["png_base64"] = base64_encode(c.png);
        chart["index"] = c.index;
        chart["figure"] = c.figure;
        chart["source"] = c.source;
        charts.push_back(chart);
    }
    j["charts"] = charts;
    j["charts_used"] = charts_used;
    j["execution_time_ms"] = result.execution_time_ms;
    j["memory_peak_bytes"] = result.memory_peak_bytes;
    return j;
}

bool decode_run_result(const Json& message, ExecutionResult& out, bool& charts_used) {
    try {
        ExecutionResult r;
        r.success = message.at("success").get<bool>();
        r.stdout_text = message.value("stdout", std::string());
        r.stderr_text = message.value("stderr", std::string());
        r.output_truncated = message.value("truncated", false);

        ErrorKind kind = ErrorKind::None;
        if (!parse_error_kind(message.value("error_kind", std::string("none")), kind)) {
            LOG_ERROR("[Channel] Unknown error kind in a kernel result");
            return false;
        }
        r.error = ExecutionError(kind, message.value("error", std::string()));
        r.error.traceback = message.value("traceback", std::string());
        r.result_json = message.value("result_json", std::string());

        if (message.contains("variables")) {
            for (const auto& v : message.at("variables")) {
                r.variables.push_back(std::make_pair(v.at(0).get<std::string>(), v.at(1).get<std::string>()));
            }
        }
        if (message.contains("charts")) {
            for (const auto& c : message.at("charts")) {
                ChartImage chart;
                if (!base64_decode(c.at("png_base64").get<std::string>(), chart.png)) {
                    LOG_ERROR("[Channel] Chart payload is not base64");
                    return false;
                }
                chart.index = c.value("index", 0);
                chart.figure = c.value("figure", -1);
                chart.source = c.value("source", std::string());
                r.charts.push_back(chart);
            }
        }
        charts_used = message.value("charts_used", false);
        r.execution_time_ms = message.value("execution_time_ms", static_cast<int64_t>(0));
        r.memory_peak_bytes = message.value("memory_peak_bytes", static_cast<int64_t>(0));
        out = r;
    } catch (const std::exception& e) {
        LOG_ERROR("[Channel] Malformed kernel result: %s", e.what());
        return false;
    }
    return true;
}

} // namespace sandkernel
