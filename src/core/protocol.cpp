#include <sandkernel/core/protocol.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>
#include <limits>

namespace sandkernel {

const char* request_op_name(RequestOp op) {
    switch (op) {
        case RequestOp::Execute: return "execute";
        case RequestOp::CreateSession: return "create_session";
        case RequestOp::ListFiles: return "list_files";
        case RequestOp::ResetSession: return "reset_session";
        case RequestOp::SessionInfo: return "session_info";
        case RequestOp::ListSessions: return "list_sessions";
        case RequestOp::FetchUrl: return "fetch_url";
        case RequestOp::Ping: return "ping";
    }
    return "unknown";
}

namespace {

bool op_from_name(const std::string& name, RequestOp& out) {
    static const RequestOp all[] = {
        RequestOp::Execute, RequestOp::CreateSession, RequestOp::ListFiles, RequestOp::ResetSession,
        RequestOp::SessionInfo, RequestOp::ListSessions, RequestOp::FetchUrl, RequestOp::Ping
    };
    for (RequestOp op : all) {
        if (name == request_op_name(op)) {
            out = op;
            return true;
        }
    }
    return false;
}

bool read_string(const Json& obj, const char* key, std::string& out, std::string& error) {
    if (!obj.contains(key) || obj[key].is_null()) return true;
    if (!obj[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = obj[key].get<std::string>();
    return true;
}

bool read_integer(const Json& obj, const char* key, bool& present, int64_t& out, std::string& error) {
    present = false;
    if (!obj.contains(key) || obj[key].is_null()) return true;
    if (!obj[key].is_number()) {
        error = std::string("'") + key + "' must be a number";
        return false;
    }
    double value = obj[key].get<double>();
    if (value > static_cast<double>(std::numeric_limits<int>::max()) ||
        value < static_cast<double>(std::numeric_limits<int>::min())) {
        error = std::string("'") + key + "' is out of range";
        return false;
    }
    present = true;
    out = static_cast<int64_t>(value);
    return true;
}

bool requires_session(RequestOp op) {
    return op == RequestOp::Execute || op == RequestOp::ListFiles || op == RequestOp::ResetSession ||
           op == RequestOp::SessionInfo || op == RequestOp::FetchUrl;
}

Json error_to_json(const ExecutionError& error) {
    Json j;
    j["kind"] = error_kind_name(error.kind);
    j["message"] = error.message;
    if (!error.traceback.empty()) j["traceback"] = error.traceback;
    return j;
}

} // anonymous namespace

// ============================================================================
// Protocol Implementation
// ============================================================================

Protocol::Protocol(SandboxEngine& engine)
    : engine_(engine)
{}

bool Protocol::parse_request(const std::string& line, ProtocolRequest& out, Json& error_response) {
    Json obj;
    try {
        obj = Json::parse(line);
    } catch (const std::exception& e) {
        error_response = Protocol::error_response(Json(), ErrorKind::InvalidRequest,
                                                  std::string("malformed JSON: ") + e.what());
        return false;
    }
    if (!obj.is_object()) {
        error_response = Protocol::error_response(Json(), ErrorKind::InvalidRequest, "request must be an object");
        return false;
    }

    out = ProtocolRequest();
    if (obj.contains("id")) out.id = obj["id"];

    std::string error;
    std::string op_name;
    if (!read_string(obj, "op", op_name, error) || op_name.empty()) {
        error_response = Protocol::error_response(out.id, ErrorKind::InvalidRequest,
                                                  error.empty() ? "missing 'op'" : error);
        return false;
    }
    if (!op_from_name(op_name, out.op)) {
        error_response = Protocol::error_response(out.id, ErrorKind::InvalidRequest, "unknown op '" + op_name + "'");
        return false;
    }

    int64_t timeout = 0;
    int64_t memory = 0;
    bool ok = read_string(obj, "session_id", out.session_id, error) &&
              read_string(obj, "code", out.execution.code, error) &&
              read_string(obj, "url", out.url, error) &&
              read_string(obj, "filename", out.filename, error) &&
              read_integer(obj, "timeout", out.execution.has_timeout, timeout, error) &&
              read_integer(obj, "memory_limit_mb", out.execution.has_memory_limit, memory, error);
    if (ok && obj.contains("purge") && !obj["purge"].is_null()) {
        if (!obj["purge"].is_boolean()) {
            error = "'purge' must be a boolean";
            ok = false;
        } else {
            out.purge = obj["purge"].get<bool>();
        }
    }
    if (!ok) {
        error_response = Protocol::error_response(out.id, ErrorKind::InvalidRequest, error);
        return false;
    }

    if (requires_session(out.op) && out.session_id.empty()) {
        error_response = Protocol::error_response(out.id, ErrorKind::InvalidRequest, "missing 'session_id'");
        return false;
    }
    if (out.op == RequestOp::FetchUrl && out.url.empty()) {
        error_response = Protocol::error_response(out.id, ErrorKind::InvalidRequest, "missing 'url'");
        return false;
    }

    out.execution.session_id = out.session_id;
    out.execution.timeout_seconds = static_cast<int>(timeout);
    out.execution.memory_limit_mb = memory;
    return true;
}

Json Protocol::handle(const ProtocolRequest& request) {
    LOG_DEBUG("[Protocol] %s %s", request_op_name(request.op), request.session_id.c_str());

    ExecutionError error;
    switch (request.op) {
        case RequestOp::Ping: {
            Json result;
            result["pong"] = true;
            result["sessions"] = engine_.list_sessions().size();
            return ok_response(request.id, result);
        }

        case RequestOp::Execute:
            return execution_response(request.id, engine_.execute(request.execution));

        case RequestOp::CreateSession: {
            SessionInfo info;
            if (!engine_.create_session(request.session_id, info, error)) break;
            return ok_response(request.id, session_to_json(info));
        }

        case RequestOp::ListFiles: {
            std::vector<FileEntry> files;
            if (!engine_.list_files(request.session_id, files, error)) break;
            Json list = Json::array();
            for (const auto& f : files) {
                Json entry;
                entry["filename"] = f.filename;
                entry["size"] = f.size;
                entry["modified_at"] = format_timestamp(f.modified_at);
                list.push_back(entry);
            }
            Json result;
            result["session_id"] = request.session_id;
            result["files"] = list;
            return ok_response(request.id, result);
        }

        case RequestOp::ResetSession: {
            if (!engine_.reset_session(request.session_id, request.purge, error)) break;
            Json result;
            result["session_id"] = request.session_id;
            result["reset"] = true;
            return ok_response(request.id, result);
        }

        case RequestOp::SessionInfo: {
            SessionDetails details;
            if (!engine_.session_info(request.session_id, details, error)) break;
            Json result = session_to_json(details.info);
            Json vars = Json::object();
            for (const auto& v : details.variables) vars[v.first] = v.second;
            result["variables"] = vars;
            return ok_response(request.id, result);
        }

        case RequestOp::ListSessions: {
            Json list = Json::array();
            for (const auto& info : engine_.list_sessions()) list.push_back(session_to_json(info));
            Json result;
            result["sessions"] = list;
            return ok_response(request.id, result);
        }

        case RequestOp::FetchUrl: {
            FetchResult fetched = engine_.fetch_url(request.url, request.filename, request.session_id);
            if (!fetched.success) {
                return error_response(request.id, ErrorKind::InvalidRequest, fetched.error);
            }
            Json result;
            result["session_id"] = request.session_id;
            result["filename"] = fetched.filename;
            result["path"] = fetched.path;
            result["size_bytes"] = fetched.size;
            return ok_response(request.id, result);
        }
    }
    return error_response(request.id, error.kind, error.message);
}

Json Protocol::handle_execute(const ProtocolRequest& request, SessionLease& lease) {
    return execution_response(request.id, engine_.execute(request.execution, lease));
}

Json Protocol::error_response(const Json& id, ErrorKind kind, const std::string& message) {
    Json j;
    j["id"] = id;
    j["ok"] = false;
    j["error"] = error_to_json(ExecutionError(kind, message));
    return j;
}

Json Protocol::ok_response(const Json& id, const Json& result) {
    Json j;
    j["id"] = id;
    j["ok"] = true;
    j["result"] = result;
    return j;
}

Json Protocol::execution_response(const Json& id, const ExecutionResult& result) {
    Json j;
    j["id"] = id;
    j["ok"] = result.success;
    j["result"] = result_to_json(result);
    return j;
}

Json Protocol::result_to_json(const ExecutionResult& result) {
    Json j;
    j["success"] = result.success;
    j["session_id"] = result.session_id;
    j["stdout"] = result.stdout_text;
    j["stderr"] = result.stderr_text;
    j["output_truncated"] = result.output_truncated;
    j["execution_time_ms"] = result.execution_time_ms;
    j["memory_peak_bytes"] = result.memory_peak_bytes;
    if (!result.success) j["error"] = error_to_json(result.error);

    if (!result.result_json.empty()) {
        try {
            j["result"] = Json::parse(result.result_json);
        } catch (const std::exception& e) {
            LOG_WARN("[Protocol] RESULT is not valid JSON: %s", e.what());
            j["result"] = result.result_json;
        }
    } else {
        j["result"] = nullptr;
    }

    Json vars = Json::object();
    for (const auto& v : result.variables) vars[v.first] = v.second;
    j["variables"] = vars;

    Json files = Json::array();
    for (const auto& a : result.artifacts) {
        Json f;
        f["filename"] = a.filename;
        f["size"] = a.size;
        f["created"] = a.created;
        f["oversized"] = a.oversized;
        if (!a.sha256.empty()) f["sha256"] = a.sha256;
        if (!a.handle.empty()) f["handle"] = a.handle;
        if (!a.download_url.empty()) f["download_url"] = a.download_url;
        if (!a.oversized) f["content_base64"] = base64_encode(a.content);
        files.push_back(f);
    }
    j["files"] = files;

    Json charts = Json::array();
    for (const auto& c : result.charts) {
        Json chart;
        chart["index"] = c.index;
        chart["figure"] = c.figure;
        chart["source"] = c.source;
        chart["png_base64"] = base64_encode(c.png);
        charts.push_back(chart);
    }
    j["charts"] = charts;

    Json notices = Json::array();
    for (const auto& n : result.notices) notices.push_back(n);
    j["notices"] = notices;
    return j;
}

Json Protocol::session_to_json(const SessionInfo& info) {
    Json j;
    j["session_id"] = info.id;
    j["directory"] = info.dir;
    j["created_at"] = format_timestamp(info.created_at);
    j["idle_seconds"] = info.idle_seconds;
    j["executions"] = info.executions;
    j["busy"] = info.busy;
    j["uses_charts"] = info.uses_charts;
    return j;
}

std::string Protocol::encode(const Json& response) {
    return response.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace sandkernel
