/*
 * sandkernel C++ - JSON-lines Protocol
 *
 * One request object per input line, one response object per output
 * line. Requests carry an "id" that is echoed back unchanged.
 *
 *   {"id": 1, "op": "execute", "session_id": "s1", "code": "print(1)",
 *    "timeout": 30, "memory_limit_mb": 512}
 *   {"id": 1, "ok": true, "result": {...}}
 *   {"id": 1, "ok": false, "error": {"kind": "invalid_request", "message": "..."}}
 *
 * Binary payloads (chart PNGs, inlined files) are base64 encoded.
 */
#ifndef sandkernel_CORE_PROTOCOL_HPP
#define sandkernel_CORE_PROTOCOL_HPP

#include "json.hpp"
#include "sandbox_engine.hpp"
#include "types.hpp"
#include <string>
#include <cstdint>

namespace sandkernel {

enum class RequestOp {
    Execute,
    CreateSession,
    ListFiles,
    ResetSession,
    SessionInfo,
    ListSessions,
    FetchUrl,
    Ping
};

const char* request_op_name(RequestOp op);

struct ProtocolRequest {
    Json id;
    RequestOp op;
    std::string session_id;
    std::string url;
    std::string filename;
    bool purge;
    ExecutionRequest execution;

    ProtocolRequest() : op(RequestOp::Ping), purge(false) {}
};

class Protocol {
public:
    explicit Protocol(SandboxEngine& engine);

    // false with error_response filled when the line is not a valid request
    static bool parse_request(const std::string& line, ProtocolRequest& out, Json& error_response);

    // Everything except execute
    Json handle(const ProtocolRequest& request);

    // execute with a lease already taken through SandboxEngine::reserve()
    Json handle_execute(const ProtocolRequest& request, SessionLease& lease);

    static bool runs_in_background(RequestOp op) { return op == RequestOp::Execute || op == RequestOp::FetchUrl; }

    static Json error_response(const Json& id, ErrorKind kind, const std::string& message);
    static Json ok_response(const Json& id, const Json& result);
    static Json execution_response(const Json& id, const ExecutionResult& result);

    static Json result_to_json(const ExecutionResult& result);
    static Json session_to_json(const SessionInfo& info);

    static std::string encode(const Json& response);

private:
    SandboxEngine& engine_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_PROTOCOL_HPP
