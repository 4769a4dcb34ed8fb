#include <gtest/gtest.h>

#include <sandkernel/core/kernel_channel.hpp>
#include <sandkernel/core/utils.hpp>

#include <unistd.h>
#include <sys/socket.h>

using namespace sandkernel;

namespace {

class SocketPair {
public:
    SocketPair() {
        fds[0] = fds[1] = -1;
        if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
            fds[0] = fds[1] = -1;
        }
    }

    ~SocketPair() {
        close_end(0);
        close_end(1);
    }

    void close_end(int i) {
        if (fds[i] >= 0) close(fds[i]);
        fds[i] = -1;
    }

    int fds[2];
};

} // anonymous namespace

TEST(KernelChannel, SplitsLines)
{
    SocketPair sp;
    ASSERT_GE (sp.fds[0], 0);
    KernelChannel reader(sp.fds[0], sp.fds[0]);

    const char chunk[] = "{\"a\":1}\n{\"b\"";
    ASSERT_EQ (static_cast<ssize_t>(sizeof(chunk) - 1), write(sp.fds[1], chunk, sizeof(chunk) - 1));

    std::string line;
    ASSERT_EQ (ReadStatus::Line, reader.read_line(line, monotonic_ms() + 2000));
    ASSERT_EQ ("{\"a\":1}", line);

    // The rest of the second line has not arrived yet
    ASSERT_EQ (ReadStatus::Timeout, reader.read_line(line, monotonic_ms() + 100));

    ASSERT_EQ (3, write(sp.fds[1], ":2}", 3));
    ASSERT_EQ (1, write(sp.fds[1], "\n", 1));
    Json message;
    ASSERT_EQ (ReadStatus::Line, reader.receive(message, monotonic_ms() + 2000));
    ASSERT_EQ (2, message["b"].get<int>());
}

TEST(KernelChannel, ReportsClosedPeer)
{
    SocketPair sp;
    KernelChannel reader(sp.fds[0], sp.fds[0]);
    sp.close_end(1);

    std::string line;
    ASSERT_EQ (ReadStatus::Closed, reader.read_line(line, 0));

    // Writing to a dead peer fails instead of raising SIGPIPE
    ASSERT_FALSE (reader.write_line("{}"));
}

TEST(KernelChannel, RejectsMalformedMessages)
{
    SocketPair sp;
    KernelChannel reader(sp.fds[0], sp.fds[0]);
    KernelChannel writer(sp.fds[1], sp.fds[1]);

    ASSERT_TRUE (writer.write_line("not json"));
    ASSERT_TRUE (writer.write_line("[1, 2]"));

    Json message;
    ASSERT_EQ (ReadStatus::Error, reader.receive(message, monotonic_ms() + 2000));
    ASSERT_EQ (ReadStatus::Error, reader.receive(message, monotonic_ms() + 2000));
}

TEST(KernelChannel, CarriesRunRequests)
{
    RunRequest request;
    request.session_id = "s1";
    request.session_dir = "/srv/sessions/s1";
    request.code = "print('\\u00e9')\nx = 1";
    request.timeout_seconds = 30;
    request.memory_bytes = 256LL * 1024 * 1024;

    RunRequest decoded;
    std::string error;
    ASSERT_TRUE (decode_run_request(encode_run_request(request), decoded, error)) << error;
    ASSERT_EQ (request.code, decoded.code);
    ASSERT_EQ (request.session_dir, decoded.session_dir);
    ASSERT_EQ (30, decoded.timeout_seconds);
    ASSERT_EQ (request.memory_bytes, decoded.memory_bytes);

    Json bad = encode_run_request(request);
    bad["timeout"] = 0;
    ASSERT_FALSE (decode_run_request(bad, decoded, error));

    bad.erase("code");
    ASSERT_FALSE (decode_run_request(bad, decoded, error));
}

TEST(KernelChannel, CarriesResultsOverTheSocket)
{
    ExecutionResult result;
    result.success = false;
    result.stdout_text = "partial\n";
    result.output_truncated = true;
    result.error = ExecutionError(ErrorKind::PathRejected, "outside the session");
    result.error.traceback = "Traceback ...";
    result.variables.push_back(std::make_pair("df", "DataFrame"));
    ChartImage chart;
    chart.png = std::string("\x89PNG\0\x01", 6);
    chart.index = 0;
    chart.figure = 3;
    chart.source = "sweep";
    result.charts.push_back(chart);
    result.execution_time_ms = 42;
    result.memory_peak_bytes = 1 << 20;

    SocketPair sp;
    KernelChannel kernel(sp.fds[1], sp.fds[1]);
    KernelChannel daemon(sp.fds[0], sp.fds[0]);
    ASSERT_TRUE (kernel.send(encode_run_result(result, true)));

    Json message;
    ASSERT_EQ (ReadStatus::Line, daemon.receive(message, monotonic_ms() + 2000));
    ASSERT_EQ ("result", message["op"].get<std::string>());

    ExecutionResult decoded;
    bool charts_used = false;
    ASSERT_TRUE (decode_run_result(message, decoded, charts_used));
    ASSERT_TRUE (charts_used);
    ASSERT_FALSE (decoded.success);
    ASSERT_EQ (ErrorKind::PathRejected, decoded.error.kind);
    ASSERT_EQ ("Traceback ...", decoded.error.traceback);
    ASSERT_TRUE (decoded.output_truncated);
    ASSERT_EQ (1u, decoded.variables.size());
    ASSERT_EQ ("DataFrame", decoded.variables[0].second);
    ASSERT_EQ (1u, decoded.charts.size());
    ASSERT_EQ (chart.png, decoded.charts[0].png);
    ASSERT_EQ (3, decoded.charts[0].figure);
    ASSERT_EQ (42, decoded.execution_time_ms);

    message["error_kind"] = "exploded";
    ASSERT_FALSE (decode_run_result(message, decoded, charts_used));
}
