#include <gtest/gtest.h>

#include <sandkernel/core/sandbox_engine.hpp>
#include <sandkernel/core/utils.hpp>

#include "test_util.hpp"

#include <thread>

using namespace sandkernel;

namespace {

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = test::make_settings(tmp.path());
        settings.max_concurrent_kernels = 4;
        settings.default_execution_time = 10;
        settings.max_memory_mb = 1024;
        settings.public_url = "https://files.example/";
        settings.kernel_binary = SANDKERNEL_DAEMON_PATH;
        settings.kill_grace_seconds = 1;
        engine.reset(new SandboxEngine(settings));
        ASSERT_TRUE (engine->start());
    }

    void TearDown() override {
        engine.reset();
    }

    ExecutionResult run(const std::string& session_id, const std::string& code) {
        ExecutionRequest req;
        req.session_id = session_id;
        req.code = code;
        return engine->execute(req);
    }

    ExecutionResult run_with_timeout(const std::string& session_id, const std::string& code, int seconds) {
        ExecutionRequest req;
        req.session_id = session_id;
        req.code = code;
        req.has_timeout = true;
        req.timeout_seconds = seconds;
        return engine->execute(req);
    }

    bool has_variable(const ExecutionResult& r, const std::string& name, const std::string& type) {
        for (const auto& v : r.variables) {
            if (v.first == name && v.second == type) return true;
        }
        return false;
    }

    test::TempDir tmp;
    SandboxSettings settings;
    std::unique_ptr<SandboxEngine> engine;
};

} // anonymous namespace

TEST_F(EngineTest, StatePersistsAcrossCalls)
{
    ExecutionResult r = run("s1", "x = 10");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("", r.stdout_text);

    r = run("s1", "x = x + 5\nRESULT = {'total': x}\nprint(x)");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("15\n", r.stdout_text);
    ASSERT_EQ ("{\"total\": 15}", r.result_json);
    ASSERT_TRUE (has_variable(r, "x", "int"));
    ASSERT_FALSE (has_variable(r, "RESULT", "dict"));
}

TEST_F(EngineTest, SessionsAreIsolated)
{
    ASSERT_TRUE (run("s1", "secret = 42").success);

    ExecutionResult r = run("s2", "print(secret)");
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::ScriptRuntimeError, r.error.kind);
    ASSERT_NE (std::string::npos, r.error.message.find("NameError"));
}

TEST_F(EngineTest, SandboxDirIsPreset)
{
    ExecutionResult r = run("s1", "print(SANDBOX_DIR)");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ (settings.sessions_root + "/s1\n", r.stdout_text);
}

TEST_F(EngineTest, TempPathWritesLandInSessionDir)
{
    ExecutionResult r = run("s1", "with open('/tmp/out.csv', 'w') as f:\n    f.write('a,b\\n1,2\\n')");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ (1u, r.artifacts.size());
    ASSERT_EQ ("out.csv", r.artifacts[0].filename);
    ASSERT_EQ ("a,b\n1,2\n", r.artifacts[0].content);
    ASSERT_TRUE (r.artifacts[0].created);
    ASSERT_FALSE (r.artifacts[0].handle.empty());
    ASSERT_EQ ("https://files.example/dl/" + r.artifacts[0].handle, r.artifacts[0].download_url);

    std::string on_disk;
    ASSERT_TRUE (read_file(settings.sessions_root + "/s1/out.csv", on_disk));
    ASSERT_EQ ("a,b\n1,2\n", on_disk);

    // Plain relative name finds the same file in the next call
    r = run("s1", "print(open('out.csv').read().strip())");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("a,b\n1,2\n", r.stdout_text);
    ASSERT_TRUE (r.artifacts.empty());

    ASSERT_NE (nullptr, engine->artifact_store());
    std::vector<StoredArtifact> list = engine->artifact_store()->list_for_session("s1");
    ASSERT_EQ (1u, list.size());
    ASSERT_EQ ("out.csv", list[0].filename);
}

TEST_F(EngineTest, PathEscapesAreRejected)
{
    ExecutionResult r = run("s1", "open('/etc/passwd').read()");
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::PathRejected, r.error.kind);

    ASSERT_TRUE (run("s2", "open('mine.txt', 'w').write('x')").success);
    r = run("s1", "open('../s2/mine.txt').read()");
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::PathRejected, r.error.kind);

    // Caught by the script, the run still succeeds
    r = run("s1", "try:\n    open('/etc/passwd')\nexcept PermissionError as e:\n    print('denied')");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("denied\n", r.stdout_text);
}

TEST_F(EngineTest, BlockedImportBecomesNotice)
{
    ExecutionResult r = run("s1", "import socket\nprint(1 + 1)");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("2\n", r.stdout_text);
    ASSERT_EQ (1u, r.notices.size());
    ASSERT_NE (std::string::npos, r.notices[0].find("BLOCKED: import socket"));
}

TEST_F(EngineTest, RestrictedBuiltins)
{
    ExecutionResult r = run("s1", "eval('1 + 1')");
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::ScriptRuntimeError, r.error.kind);

    r = run("s1", "import os\nos.system('true')");
    ASSERT_FALSE (r.success);
    ASSERT_NE (std::string::npos, r.error.message.find("AttributeError"));

    r = run("s1", "import os\nopen('a.txt', 'w').write('1')\nprint(sorted(os.listdir('.')))");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("['a.txt']\n", r.stdout_text);
}

TEST_F(EngineTest, ContainerModuleSurvivesMemberImport)
{
    ExecutionResult r = run("s1", "import datetime\nfrom datetime import datetime\nd = datetime(2024, 1, 2)");
    ASSERT_TRUE (r.success) << r.error.message;

    r = run("s1", "print(datetime.date(2024, 1, 2).isoformat())");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("2024-01-02\n", r.stdout_text);
}

TEST_F(EngineTest, RuntimeErrorCarriesTraceback)
{
    ExecutionResult r = run("s1", "def f():\n    return 1 / 0\nf()");
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::ScriptRuntimeError, r.error.kind);
    ASSERT_EQ (0u, r.error.message.find("ZeroDivisionError"));
    ASSERT_NE (std::string::npos, r.error.traceback.find("line 2"));

    r = run("s1", "def (");
    ASSERT_FALSE (r.success);
    ASSERT_NE (std::string::npos, r.error.message.find("SyntaxError"));
}

TEST_F(EngineTest, OutputBeforeFailureIsKept)
{
    ExecutionResult r = run("s1", "print('before')\nraise ValueError('bad input')");
    ASSERT_FALSE (r.success);
    ASSERT_EQ ("before\n", r.stdout_text);
    ASSERT_EQ ("ValueError: bad input", r.error.message);
}

TEST_F(EngineTest, TimeoutInterruptsAndSessionSurvives)
{
    ASSERT_TRUE (run("s1", "kept = 1").success);

    ExecutionResult r = run_with_timeout("s1", "while True:\n    pass", 1);
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::Timeout, r.error.kind);
    ASSERT_EQ ("Execution exceeded the 1s time limit", r.error.message);
    ASSERT_GE (r.execution_time_ms, 900);
    ASSERT_LT (r.execution_time_ms, 10000);

    r = run("s1", "print(kept)");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("1\n", r.stdout_text);
}

TEST_F(EngineTest, SleepHonoursTimeout)
{
    ExecutionResult r = run_with_timeout("s1", "import time\ntime.sleep(30)", 1);
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::Timeout, r.error.kind);
    ASSERT_LT (r.execution_time_ms, 10000);
}

TEST_F(EngineTest, MemoryLimitIsEnforced)
{
    ExecutionRequest req;
    req.session_id = "s1";
    req.code = "data = bytearray(256 * 1024 * 1024)";
    req.has_memory_limit = true;
    req.memory_limit_mb = 64;
    ExecutionResult r = engine->execute(req);
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::ResourceExceeded, r.error.kind);

    r = run("s1", "print(len(bytearray(1024)))");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("1024\n", r.stdout_text);
}

TEST_F(EngineTest, InvalidRequests)
{
    ExecutionResult r = run_with_timeout("s1", "x = 1", 0);
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::InvalidRequest, r.error.kind);

    r = run("../escape", "x = 1");
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::InvalidRequest, r.error.kind);
}

TEST_F(EngineTest, OutputIsCapped)
{
    engine.reset();
    settings.max_output_size = 1024;
    engine.reset(new SandboxEngine(settings));
    ASSERT_TRUE (engine->start());

    ExecutionResult r = run("s1", "print('x' * 5000)");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_TRUE (r.output_truncated);
    ASSERT_LT (r.stdout_text.size(), 1200u);
}

TEST_F(EngineTest, SessionOperations)
{
    SessionInfo info;
    ExecutionError error;
    ASSERT_TRUE (engine->create_session("", info, error));
    ASSERT_EQ (36u, info.id.size());

    ASSERT_TRUE (run("s1", "n = 3\nopen('notes.txt', 'w').write('hi')").success);

    SessionDetails details;
    ASSERT_TRUE (engine->session_info("s1", details, error));
    ASSERT_EQ (1, details.info.executions);
    ASSERT_EQ (1u, details.variables.size());
    ASSERT_EQ ("n", details.variables[0].first);

    std::vector<FileEntry> files;
    ASSERT_TRUE (engine->list_files("s1", files, error));
    ASSERT_EQ (1u, files.size());
    ASSERT_EQ ("notes.txt", files[0].filename);
    ASSERT_EQ (2, files[0].size);

    ASSERT_EQ (2u, engine->list_sessions().size());

    ASSERT_TRUE (engine->reset_session("s1", false, error));
    ExecutionResult r = run("s1", "print(n)");
    ASSERT_FALSE (r.success);
    ASSERT_NE (std::string::npos, r.error.message.find("NameError"));

    // Files outlive a plain reset
    r = run("s1", "print(open('notes.txt').read())");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("hi\n", r.stdout_text);

    ASSERT_FALSE (engine->session_info("nobody", details, error));
    ASSERT_EQ (ErrorKind::InvalidRequest, error.kind);
}

TEST_F(EngineTest, DifferentSessionsRunConcurrently)
{
    ExecutionResult a, b;
    std::thread t1([&] { a = run("s1", "import time\ntime.sleep(0.3)\nprint('a')"); });
    std::thread t2([&] { b = run("s2", "import time\ntime.sleep(0.3)\nprint('b')"); });
    t1.join();
    t2.join();
    ASSERT_TRUE (a.success) << a.error.message;
    ASSERT_TRUE (b.success) << b.error.message;
    ASSERT_EQ ("a\n", a.stdout_text);
    ASSERT_EQ ("b\n", b.stdout_text);
}

TEST_F(EngineTest, ChartsAreCaptured)
{
    ExecutionResult r = run("s1", "import matplotlib.pyplot as plt\nplt.plot([1, 2, 3])\nplt.show()");
    if (!r.success && r.error.message.find("could not be loaded") != std::string::npos) {
        GTEST_SKIP() << "matplotlib is not installed";
    }
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ (1u, r.charts.size());
    ASSERT_EQ (0u, r.charts[0].png.find("\x89PNG"));
    ASSERT_EQ ("show", r.charts[0].source);

    SessionDetails details;
    ExecutionError error;
    ASSERT_TRUE (engine->session_info("s1", details, error));
    ASSERT_TRUE (details.info.uses_charts);
}

TEST_F(EngineTest, IntrospectionRoutesAreClosed)
{
    static const char* const scripts[] = {
        "import typing\nm = typing.sys.modules['os']\nprint('escaped', m)",
        "g = open.__globals__['_os']\nprint('escaped', g)",
        "i = type(__sandbox__).load.__globals__['importlib']\nprint('escaped', i)",
        "g = getattr(open, '__glo' + 'bals__')\nprint('escaped', g)",
        "b = __builtins__['__import__']('subprocess')\nprint('escaped', b)",
        "import dataclasses\nprint('escaped', dataclasses.sys)",
        "import collections\nprint('escaped', collections.abc.__loader__)",
        "print('escaped', __sandbox__.load('subprocess'))",
        "import operator\nf = operator.attrgetter('__globals__')\nprint('escaped', f(print))",
    };
    for (const char* script : scripts) {
        ExecutionResult r = run("s1", script);
        ASSERT_FALSE (r.success) << script;
        ASSERT_EQ (std::string::npos, r.stdout_text.find("escaped")) << script;
        ASSERT_NE (ErrorKind::InternalError, r.error.kind) << script;
    }

    // The session is still usable afterwards
    ExecutionResult r = run("s1", "import os\nprint(os.path.join('a', 'b'))");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("a/b\n", r.stdout_text);
}

TEST_F(EngineTest, SwallowedTimeoutKillsTheKernel)
{
    ASSERT_TRUE (run("s1", "kept = 1").success);

    int64_t started = monotonic_ms();
    ExecutionResult r = run_with_timeout("s1",
        "n = 0\n"
        "while True:\n"
        "    try:\n"
        "        while True:\n"
        "            n += 1\n"
        "    except BaseException:\n"
        "        pass\n", 1);
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::Timeout, r.error.kind);
    ASSERT_NE (std::string::npos, r.error.message.find("restarted"));
    ASSERT_LT (monotonic_ms() - started, 15000);

    // A fresh kernel took over the session: same directory, no variables
    r = run("s1", "print(kept)");
    ASSERT_FALSE (r.success);
    ASSERT_NE (std::string::npos, r.error.message.find("NameError"));

    r = run("s1", "print(SANDBOX_DIR)");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ (settings.sessions_root + "/s1\n", r.stdout_text);
}

TEST_F(EngineTest, NumpyBuffersCountAgainstTheLimit)
{
    ExecutionRequest req;
    req.session_id = "s1";
    req.code = "import numpy as np\na = np.ones((512, 1024, 1024), dtype=np.uint8)\nprint(a.sum())";
    req.has_memory_limit = true;
    req.memory_limit_mb = 128;
    ExecutionResult r = engine->execute(req);
    if (!r.success && r.error.message.find("could not be loaded") != std::string::npos) {
        GTEST_SKIP() << "numpy is not installed";
    }
    ASSERT_FALSE (r.success);
    ASSERT_EQ (ErrorKind::ResourceExceeded, r.error.kind);
    ASSERT_EQ ("", r.stdout_text);

    r = run("s1", "print(int(np.ones(1024).sum()))");
    ASSERT_TRUE (r.success) << r.error.message;
    ASSERT_EQ ("1024\n", r.stdout_text);
}

TEST_F(EngineTest, EvictedSessionsDropTheirSnapshots)
{
    engine.reset();
    settings.max_concurrent_kernels = 1;
    engine.reset(new SandboxEngine(settings));
    ASSERT_TRUE (engine->start());

    ASSERT_TRUE (run("s1", "a = 1").success);
    ASSERT_EQ (1u, engine->snapshot_count());

    // s2 takes the only slot, evicting s1
    ASSERT_TRUE (run("s2", "b = 2").success);
    ASSERT_EQ (1u, engine->list_sessions().size());
    ASSERT_EQ (2u, engine->snapshot_count());
    engine->maintenance();
    ASSERT_EQ (1u, engine->snapshot_count());

    SessionDetails details;
    ExecutionError error;
    ASSERT_TRUE (engine->session_info("s2", details, error));
    ASSERT_EQ (1u, details.variables.size());
    ASSERT_EQ ("b", details.variables[0].first);
}
