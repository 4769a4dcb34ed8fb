/*
 * sandkernel C++ - URL Fetcher
 *
 * Downloads a file over HTTP(S) straight into a session directory so the
 * next script can open it. The destination goes through the Path Guard
 * like any script write; the body streams to a hidden part file and is
 * renamed once complete.
 */
#ifndef sandkernel_CORE_URL_FETCHER_HPP
#define sandkernel_CORE_URL_FETCHER_HPP

#include "path_guard.hpp"
#include "settings.hpp"
#include <string>
#include <cstdint>

namespace sandkernel {

struct FetchResult {
    bool success;
    std::string filename;
    std::string path;
    int64_t size;
    long status_code;
    std::string error;

    FetchResult() : success(false), size(0), status_code(0) {}

    static FetchResult ok(const std::string& name, const std::string& p, int64_t bytes) {
        FetchResult r;
        r.success = true;
        r.filename = name;
        r.path = p;
        r.size = bytes;
        return r;
    }

    static FetchResult fail(const std::string& err) {
        FetchResult r;
        r.error = err;
        return r;
    }
};

class UrlFetcher {
public:
    UrlFetcher(const SandboxSettings& settings, const PathGuard& guard);

    // filename may be empty: it is then taken from Content-Disposition or
    // the URL path
    FetchResult fetch(const std::string& url, const std::string& filename, const std::string& session_id) const;

    static int timeout_seconds() { return 60; }
    static const char* user_agent() { return "sandkernel/1.0"; }

    // "http" or "https", lowercased; empty when the URL has no scheme
    static std::string url_scheme(const std::string& url);

    static std::string infer_filename(const std::string& url, const std::string& content_disposition);

    // Last path component with everything outside [A-Za-z0-9_.-] replaced
    // by '_' and runs of '_' collapsed
    static std::string sanitize_filename(const std::string& filename);

    static bool is_allowed_extension(const std::string& filename);

private:
    const SandboxSettings& settings_;
    const PathGuard& guard_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_URL_FETCHER_HPP
