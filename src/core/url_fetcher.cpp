#include <sandkernel/core/url_fetcher.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <curl/curl.h>
#include <regex>
#include <set>
#include <cstdio>
#include <cctype>
#include <unistd.h>

namespace sandkernel {

namespace {

const std::set<std::string>& fetch_extensions() {
    static const std::set<std::string> exts = {
        "xlsx", "xls", "csv", "tsv", "json", "jsonl", "parquet", "pdf", "txt", "md",
        "png", "jpg", "jpeg", "gif", "svg", "zip", "tar", "gz", "db", "sqlite"
    };
    return exts;
}

struct Transfer {
    FILE* file;
    int64_t limit;
    int64_t written;
    bool too_large;
    bool write_failed;
    std::string content_disposition;

    Transfer() : file(nullptr), limit(0), written(0), too_large(false), write_failed(false) {}
};

size_t body_cb(char* data, size_t size, size_t nmemb, void* userp) {
    Transfer* t = static_cast<Transfer*>(userp);
    size_t bytes = size * nmemb;
    if (t->written + static_cast<int64_t>(bytes) > t->limit) {
        t->too_large = true;
        return 0;
    }
    if (fwrite(data, 1, bytes, t->file) != bytes) {
        t->write_failed = true;
        return 0;
    }
    t->written += static_cast<int64_t>(bytes);
    return bytes;
}

size_t header_cb(char* data, size_t size, size_t nitems, void* userp) {
    Transfer* t = static_cast<Transfer*>(userp);
    size_t bytes = size * nitems;
    std::string line(data, bytes);
    size_t colon = line.find(':');
    if (colon != std::string::npos && to_lower(trim(line.substr(0, colon))) == "content-disposition") {
        t->content_disposition = trim(line.substr(colon + 1));
    }
    // A redirect starts a new header block
    if (starts_with(line, "HTTP/")) t->content_disposition.clear();
    return bytes;
}

std::string allowed_list() {
    std::vector<std::string> names;
    for (const auto& ext : fetch_extensions()) names.push_back("." + ext);
    return join(names, ", ");
}

} // anonymous namespace

UrlFetcher::UrlFetcher(const SandboxSettings& settings, const PathGuard& guard)
    : settings_(settings)
    , guard_(guard)
{}

std::string UrlFetcher::url_scheme(const std::string& url) {
    size_t pos = url.find("://");
    if (pos == std::string::npos) return "";
    return to_lower(url.substr(0, pos));
}

std::string UrlFetcher::infer_filename(const std::string& url, const std::string& content_disposition) {
    if (!content_disposition.empty()) {
        static const std::regex pattern("filename[^;=\\n]*=([\"']?)([^\"'\\n;]+)\\1");
        std::smatch match;
        if (std::regex_search(content_disposition, match, pattern)) {
            std::string name = trim(match[2].str());
            if (!name.empty()) return name;
        }
    }

    std::string path = url;
    size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        size_t slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? "" : path.substr(slash);
    }
    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos) path = path.substr(0, cut);

    std::string name = base_name(path);
    if (!name.empty() && name.find('.') != std::string::npos) return name;
    return "downloaded_file";
}

std::string UrlFetcher::sanitize_filename(const std::string& filename) {
    std::string name = filename;
    size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) name = name.substr(slash + 1);

    std::string out;
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        bool keep = std::isalnum(u) || c == '_' || c == '-' || c == '.';
        char next = keep ? c : '_';
        if (next == '_' && !out.empty() && out.back() == '_') continue;
        out += next;
    }
    if (out.empty() || out == "." || out == "..") return "file";
    return out;
}

bool UrlFetcher::is_allowed_extension(const std::string& filename) {
    return fetch_extensions().count(file_extension(filename)) > 0;
}

FetchResult UrlFetcher::fetch(const std::string& url, const std::string& filename,
                              const std::string& session_id) const {
    LOG_INFO("[Fetch] %s: %s", session_id.c_str(), url.c_str());

    std::string scheme = url_scheme(url);
    if (scheme != "http" && scheme != "https") {
        return FetchResult::fail("Only http/https URLs are supported. Got: '" + scheme + "'");
    }
    if (!PathGuard::is_valid_session_id(session_id)) {
        return FetchResult::fail("invalid session id");
    }

    std::string name;
    if (!filename.empty()) {
        name = sanitize_filename(filename);
        if (!is_allowed_extension(name)) {
            return FetchResult::fail("File extension '." + file_extension(name) + "' not allowed. Permitted: " +
                                     allowed_list());
        }
    }

    std::string dir = guard_.session_dir(session_id);
    if (!ensure_directory(dir)) {
        LOG_ERROR("[Fetch] Cannot create %s", dir.c_str());
        return FetchResult::fail("session directory unavailable");
    }

    std::string part = join_path(dir, ".fetch-" + generate_uuid() + ".part");
    Transfer transfer;
    transfer.limit = settings_.max_fetch_size_mb * 1024 * 1024;
    transfer.file = fopen(part.c_str(), "wb");
    if (!transfer.file) {
        LOG_ERROR("[Fetch] Cannot open %s", part.c_str());
        return FetchResult::fail("cannot write into the session directory");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        fclose(transfer.file);
        unlink(part.c_str());
        return FetchResult::fail("curl initialization failed");
    }

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(transfer.limit));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, body_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    bool closed = fclose(transfer.file) == 0;

    FetchResult failure;
    if (transfer.too_large || res == CURLE_FILESIZE_EXCEEDED) {
        failure = FetchResult::fail("File exceeds maximum size of " + std::to_string(settings_.max_fetch_size_mb) +
                                    "MB");
    } else if (transfer.write_failed || !closed) {
        failure = FetchResult::fail("writing the download failed");
    } else if (res != CURLE_OK) {
        failure = FetchResult::fail(std::string("URL error: ") + (errbuf[0] ? errbuf : curl_easy_strerror(res)));
    } else if (status >= 400) {
        failure = FetchResult::fail("HTTP " + std::to_string(status));
    }
    if (!failure.error.empty()) {
        failure.status_code = status;
        unlink(part.c_str());
        LOG_WARN("[Fetch] %s: %s", url.c_str(), failure.error.c_str());
        return failure;
    }

    if (name.empty()) {
        name = sanitize_filename(infer_filename(url, transfer.content_disposition));
        if (!is_allowed_extension(name)) {
            unlink(part.c_str());
            FetchResult r = FetchResult::fail("File extension '." + file_extension(name) +
                                              "' not allowed. Permitted: " + allowed_list());
            r.status_code = status;
            return r;
        }
    }

    PathDecision dest = guard_.resolve(name, session_id, AccessMode::Write);
    if (dest.kind != PathDecision::Confined) {
        unlink(part.c_str());
        return FetchResult::fail("destination rejected: " + dest.message);
    }
    if (rename(part.c_str(), dest.path.c_str()) != 0) {
        LOG_ERROR("[Fetch] Cannot move download to %s", dest.path.c_str());
        unlink(part.c_str());
        return FetchResult::fail("cannot store the download");
    }

    LOG_INFO("[Fetch] %s: saved %s (%lld bytes)", session_id.c_str(), name.c_str(),
             static_cast<long long>(transfer.written));
    FetchResult r = FetchResult::ok(name, dest.path, transfer.written);
    r.status_code = status;
    return r;
}

} // namespace sandkernel
