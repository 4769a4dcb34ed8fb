#include <gtest/gtest.h>

#include <sandkernel/core/protocol.hpp>

using namespace sandkernel;

namespace {

std::string error_message(const Json& response) {
    return response["error"]["message"].get<std::string>();
}

} // anonymous namespace

TEST(Protocol, ParseExecute)
{
    ProtocolRequest req;
    Json error;
    ASSERT_TRUE (Protocol::parse_request(
        R"J({"id": 7, "op": "execute", "session_id": "s1", "code": "print(1)", "timeout": 5, "memory_limit_mb": 256})J",
        req, error));
    ASSERT_EQ (RequestOp::Execute, req.op);
    ASSERT_EQ (7, req.id.get<int>());
    ASSERT_EQ ("s1", req.execution.session_id);
    ASSERT_EQ ("print(1)", req.execution.code);
    ASSERT_TRUE (req.execution.has_timeout);
    ASSERT_EQ (5, req.execution.timeout_seconds);
    ASSERT_TRUE (req.execution.has_memory_limit);
    ASSERT_EQ (256, req.execution.memory_limit_mb);
    ASSERT_TRUE (Protocol::runs_in_background(req.op));
}

TEST(Protocol, ParseOptionalFieldsAbsent)
{
    ProtocolRequest req;
    Json error;
    ASSERT_TRUE (Protocol::parse_request(R"({"id": "a", "op": "execute", "session_id": "s1", "code": "x = 1"})",
                                         req, error));
    ASSERT_FALSE (req.execution.has_timeout);
    ASSERT_FALSE (req.execution.has_memory_limit);

    ASSERT_TRUE (Protocol::parse_request(R"({"op": "reset_session", "session_id": "s1", "purge": true})", req, error));
    ASSERT_EQ (RequestOp::ResetSession, req.op);
    ASSERT_TRUE (req.purge);
    ASSERT_TRUE (req.id.is_null());

    ASSERT_TRUE (Protocol::parse_request(R"({"op": "ping"})", req, error));
    ASSERT_FALSE (Protocol::runs_in_background(req.op));
    ASSERT_TRUE (Protocol::parse_request(R"({"op": "list_sessions"})", req, error));
    ASSERT_TRUE (Protocol::parse_request(R"({"op": "create_session"})", req, error));
}

TEST(Protocol, ParseErrors)
{
    ProtocolRequest req;
    Json error;

    ASSERT_FALSE (Protocol::parse_request("{not json", req, error));
    ASSERT_FALSE (error["ok"].get<bool>());
    ASSERT_EQ ("invalid_request", error["error"]["kind"].get<std::string>());
    ASSERT_EQ (0u, error_message(error).find("malformed JSON"));

    ASSERT_FALSE (Protocol::parse_request("[1]", req, error));
    ASSERT_EQ ("request must be an object", error_message(error));

    ASSERT_FALSE (Protocol::parse_request(R"({"id": 1})", req, error));
    ASSERT_EQ ("missing 'op'", error_message(error));
    ASSERT_EQ (1, error["id"].get<int>());

    ASSERT_FALSE (Protocol::parse_request(R"({"op": "format_disk"})", req, error));
    ASSERT_EQ ("unknown op 'format_disk'", error_message(error));

    ASSERT_FALSE (Protocol::parse_request(R"({"op": "execute", "code": "x"})", req, error));
    ASSERT_EQ ("missing 'session_id'", error_message(error));

    ASSERT_FALSE (Protocol::parse_request(R"({"op": "execute", "session_id": 5})", req, error));
    ASSERT_EQ ("'session_id' must be a string", error_message(error));

    ASSERT_FALSE (Protocol::parse_request(R"({"op": "execute", "session_id": "s", "timeout": "10"})", req, error));
    ASSERT_EQ ("'timeout' must be a number", error_message(error));

    ASSERT_FALSE (Protocol::parse_request(R"({"op": "execute", "session_id": "s", "timeout": 1e12})", req, error));
    ASSERT_EQ ("'timeout' is out of range", error_message(error));

    ASSERT_FALSE (Protocol::parse_request(R"({"op": "reset_session", "session_id": "s", "purge": 1})", req, error));
    ASSERT_EQ ("'purge' must be a boolean", error_message(error));

    ASSERT_FALSE (Protocol::parse_request(R"({"op": "fetch_url", "session_id": "s"})", req, error));
    ASSERT_EQ ("missing 'url'", error_message(error));
}

TEST(Protocol, ResultToJson)
{
    ExecutionResult r;
    r.success = true;
    r.session_id = "s1";
    r.stdout_text = "15\n";
    r.result_json = "{\"total\": 15}";
    r.variables.push_back(std::make_pair("x", "int"));
    r.execution_time_ms = 12;
    r.notices.push_back("line 1: BLOCKED: import socket (not in allowed list)");

    ArtifactFile f;
    f.filename = "out.csv";
    f.size = 3;
    f.content = "a,b";
    f.handle = "h1";
    f.download_url = "https://files.example/dl/h1";
    r.artifacts.push_back(f);

    ArtifactFile big;
    big.filename = "big.csv";
    big.size = 1 << 30;
    big.oversized = true;
    r.artifacts.push_back(big);

    ChartImage c;
    c.png = "png";
    c.figure = 1;
    c.source = "show";
    r.charts.push_back(c);

    Json j = Protocol::result_to_json(r);
    ASSERT_TRUE (j["success"].get<bool>());
    ASSERT_EQ ("15\n", j["stdout"].get<std::string>());
    ASSERT_EQ (15, j["result"]["total"].get<int>());
    ASSERT_EQ ("int", j["variables"]["x"].get<std::string>());
    ASSERT_FALSE (j.contains("error"));

    ASSERT_EQ (2u, j["files"].size());
    ASSERT_EQ ("YSxi", j["files"][0]["content_base64"].get<std::string>());
    ASSERT_EQ ("h1", j["files"][0]["handle"].get<std::string>());
    ASSERT_TRUE (j["files"][1]["oversized"].get<bool>());
    ASSERT_FALSE (j["files"][1].contains("content_base64"));

    ASSERT_EQ (1u, j["charts"].size());
    ASSERT_EQ ("cG5n", j["charts"][0]["png_base64"].get<std::string>());
    ASSERT_EQ (1u, j["notices"].size());
}

TEST(Protocol, FailedResultCarriesError)
{
    ExecutionResult r = ExecutionResult::failure("s1", ErrorKind::Timeout, "Execution exceeded the 1s time limit");
    Json response = Protocol::execution_response(3, r);
    ASSERT_FALSE (response["ok"].get<bool>());
    ASSERT_EQ (3, response["id"].get<int>());
    ASSERT_EQ ("timeout", response["result"]["error"]["kind"].get<std::string>());
    ASSERT_TRUE (response["result"]["result"].is_null());
}

TEST(Protocol, EncodeIsOneLine)
{
    Json response = Protocol::ok_response("x", Json("line1\nline2\xff"));
    std::string line = Protocol::encode(response);
    ASSERT_EQ (std::string::npos, line.find('\n'));
}
