/*
 * sandkernel C++ - Shared Types
 *
 * Request/result structures passed between the engine, the runner and
 * the protocol layer.
 */
#ifndef sandkernel_CORE_TYPES_HPP
#define sandkernel_CORE_TYPES_HPP

#include <string>
#include <vector>
#include <utility>
#include <cstdint>

namespace sandkernel {

enum class ErrorKind {
    None,
    BlockedCapability,
    PathRejected,
    Timeout,
    ResourceExceeded,
    ScriptRuntimeError,
    CapacityExceeded,
    InvalidRequest,
    InternalError
};

const char* error_kind_name(ErrorKind kind);
bool parse_error_kind(const std::string& name, ErrorKind& out);

struct ExecutionError {
    ErrorKind kind;
    std::string message;
    std::string traceback;

    ExecutionError() : kind(ErrorKind::None) {}
    ExecutionError(ErrorKind k, const std::string& msg) : kind(k), message(msg) {}
};

// A file created or modified in the session directory by one run
struct ArtifactFile {
    std::string filename;       // relative to the session directory
    std::string path;           // absolute path on disk
    int64_t size;
    int64_t modified_at;        // unix seconds
    bool created;               // false when an existing file was modified
    bool oversized;             // above limits.max_file_size_mb, content left empty
    std::string sha256;
    std::string content;
    std::string handle;         // set once stored
    std::string download_url;

    ArtifactFile() : size(0), modified_at(0), created(true), oversized(false) {}
};

struct ChartImage {
    std::string png;
    int index;                  // capture order within the run
    int figure;                 // matplotlib figure number, -1 when unknown
    std::string source;         // "show", "savefig" or "sweep"

    ChartImage() : index(0), figure(-1) {}
};

struct ExecutionRequest {
    std::string session_id;
    std::string code;
    bool has_timeout;
    int timeout_seconds;
    bool has_memory_limit;
    int64_t memory_limit_mb;

    ExecutionRequest() : has_timeout(false), timeout_seconds(0), has_memory_limit(false), memory_limit_mb(0) {}
};

struct ExecutionResult {
    bool success;
    std::string session_id;
    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated;
    ExecutionError error;
    std::string result_json;    // JSON text of RESULT, empty when unset
    std::vector<std::pair<std::string, std::string>> variables;     // name -> type name
    std::vector<ArtifactFile> artifacts;
    std::vector<ChartImage> charts;
    std::vector<std::string> notices;
    int64_t execution_time_ms;
    int64_t memory_peak_bytes;

    ExecutionResult()
        : success(false), output_truncated(false), execution_time_ms(0), memory_peak_bytes(0) {}

    static ExecutionResult failure(const std::string& session_id, ErrorKind kind, const std::string& message) {
        ExecutionResult r;
        r.session_id = session_id;
        r.success = false;
        r.error = ExecutionError(kind, message);
        return r;
    }
};

} // namespace sandkernel

#endif // sandkernel_CORE_TYPES_HPP
