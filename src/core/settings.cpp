#include <sandkernel/core/settings.hpp>
#include <sandkernel/core/utils.hpp>

#include <climits>
#include <cstdlib>
#include <sstream>

namespace sandkernel {

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = getenv("HOME");
    std::string base = (home && home[0] != '\0') ? home : "/tmp";
    return base + path.substr(1);
}

namespace {

// Out-of-range values saturate so validate() rejects them instead of a wrapped value
int get_limit(const Config& cfg, const std::string& key, int default_val) {
    int64_t value = cfg.get_int(key, default_val);
    if (value > INT_MAX) return INT_MAX;
    if (value < INT_MIN) return INT_MIN;
    return static_cast<int>(value);
}

} // anonymous namespace

SandboxSettings::SandboxSettings()
    : retain_session_dirs(true)
    , enforce_memory_limit(true)
    , max_execution_time(300)
    , default_execution_time(30)
    , max_memory_mb(4096)
    , max_concurrent_kernels(6)
    , max_file_size_mb(50)
    , idle_timeout(1800)
    , max_output_size(1048576)
    , max_fetch_size_mb(500)
    , kill_grace_seconds(3)
    , storage_enabled(true)
    , ttl_hours(72)
{
    sessions_root = expand_home("~/.sandkernel/sessions");
    upload_dir = expand_home("~/.sandkernel/uploads");
    db_path = expand_home("~/.sandkernel/db/artifacts.db");
    kernel_binary = "/proc/self/exe";
}

SandboxSettings SandboxSettings::from_config(const Config& cfg) {
    SandboxSettings s;

    s.sessions_root = normalize_path(expand_home(cfg.get_string("sandbox.dir", s.sessions_root)));
    s.upload_dir = normalize_path(expand_home(cfg.get_string("sandbox.upload_dir", s.upload_dir)));
    for (const auto& dir : cfg.get_string_list("sandbox.shared_dirs")) {
        s.shared_dirs.push_back(normalize_path(expand_home(dir)));
    }
    std::string temp = cfg.get_string("sandbox.temp_dir", "");
    if (!temp.empty()) {
        s.temp_dir = normalize_path(expand_home(temp));
    }
    s.retain_session_dirs = cfg.get_bool("sandbox.retain_session_dirs", s.retain_session_dirs);
    s.enforce_memory_limit = cfg.get_bool("sandbox.enforce_memory_limit", s.enforce_memory_limit);
    s.kernel_binary = cfg.get_string("sandbox.kernel_binary", s.kernel_binary);

    s.max_execution_time = get_limit(cfg, "limits.max_execution_time", s.max_execution_time);
    s.default_execution_time = get_limit(cfg, "limits.default_execution_time", s.default_execution_time);
    s.max_memory_mb = cfg.get_int("limits.max_memory_mb", s.max_memory_mb);
    s.max_concurrent_kernels = get_limit(cfg, "limits.max_concurrent_kernels", s.max_concurrent_kernels);
    s.max_file_size_mb = cfg.get_int("limits.max_file_size_mb", s.max_file_size_mb);
    s.idle_timeout = get_limit(cfg, "limits.idle_timeout", s.idle_timeout);
    s.max_output_size = cfg.get_int("limits.max_output_size", s.max_output_size);
    s.max_fetch_size_mb = cfg.get_int("limits.max_fetch_size_mb", s.max_fetch_size_mb);
    s.kill_grace_seconds = get_limit(cfg, "limits.kill_grace_seconds", s.kill_grace_seconds);

    s.extra_capabilities = cfg.get_string_list("capabilities.extra");

    s.storage_enabled = cfg.get_bool("storage.enabled", s.storage_enabled);
    s.db_path = expand_home(cfg.get_string("storage.db_path", s.db_path));
    s.ttl_hours = get_limit(cfg, "storage.ttl_hours", s.ttl_hours);
    s.public_url = cfg.get_string("storage.public_url", "");
    while (!s.public_url.empty() && s.public_url.back() == '/') {
        s.public_url.pop_back();
    }

    return s;
}

namespace {

bool check_range(const char* key, int64_t value, int64_t lo, int64_t hi, std::string& error) {
    if (value >= lo && value <= hi) return true;
    std::ostringstream oss;
    oss << key << " = " << value << " is outside [" << lo << ", " << hi << "]";
    error = oss.str();
    return false;
}

} // anonymous namespace

bool SandboxSettings::validate(std::string& error) const {
    if (!check_range("limits.max_execution_time", max_execution_time, 1, 3600, error)) return false;
    if (!check_range("limits.default_execution_time", default_execution_time, 1, max_execution_time, error)) return false;
    if (!check_range("limits.max_memory_mb", max_memory_mb, 16, 65536, error)) return false;
    if (!check_range("limits.max_concurrent_kernels", max_concurrent_kernels, 1, 256, error)) return false;
    if (!check_range("limits.max_file_size_mb", max_file_size_mb, 1, 2048, error)) return false;
    if (!check_range("limits.idle_timeout", idle_timeout, 10, 7 * 24 * 3600, error)) return false;
    if (!check_range("limits.max_output_size", max_output_size, 1024, 64LL * 1024 * 1024, error)) return false;
    if (!check_range("limits.max_fetch_size_mb", max_fetch_size_mb, 1, 4096, error)) return false;
    if (!check_range("limits.kill_grace_seconds", kill_grace_seconds, 1, 60, error)) return false;
    if (!check_range("storage.ttl_hours", ttl_hours, 1, 24 * 365, error)) return false;

    if (kernel_binary.empty() || kernel_binary[0] != '/') {
        error = "sandbox.kernel_binary must be an absolute path";
        return false;
    }
    if (sessions_root.empty() || sessions_root[0] != '/' || sessions_root == "/") {
        error = "sandbox.dir must be an absolute directory other than /";
        return false;
    }
    if (upload_dir.empty() || upload_dir[0] != '/') {
        error = "sandbox.upload_dir must be an absolute path";
        return false;
    }
    if (starts_with(upload_dir + "/", sessions_root + "/") || starts_with(sessions_root + "/", upload_dir + "/")) {
        error = "sandbox.upload_dir and sandbox.dir must not overlap";
        return false;
    }
    for (const auto& dir : shared_dirs) {
        if (dir.empty() || dir[0] != '/' || dir == "/") {
            error = "sandbox.shared_dirs entries must be absolute directories other than /";
            return false;
        }
        if (starts_with(dir + "/", sessions_root + "/") || starts_with(sessions_root + "/", dir + "/")) {
            error = "sandbox.shared_dirs entry " + dir + " overlaps sandbox.dir";
            return false;
        }
    }
    if (storage_enabled && db_path.empty()) {
        error = "storage.db_path is required when storage is enabled";
        return false;
    }
    return true;
}

Json SandboxSettings::to_json() const {
    Json j;
    j["sandbox"]["dir"] = sessions_root;
    j["sandbox"]["upload_dir"] = upload_dir;
    j["sandbox"]["shared_dirs"] = shared_dirs;
    j["sandbox"]["temp_dir"] = temp_dir;
    j["sandbox"]["retain_session_dirs"] = retain_session_dirs;
    j["sandbox"]["enforce_memory_limit"] = enforce_memory_limit;
    j["sandbox"]["kernel_binary"] = kernel_binary;

    j["limits"]["max_execution_time"] = max_execution_time;
    j["limits"]["default_execution_time"] = default_execution_time;
    j["limits"]["max_memory_mb"] = max_memory_mb;
    j["limits"]["max_concurrent_kernels"] = max_concurrent_kernels;
    j["limits"]["max_file_size_mb"] = max_file_size_mb;
    j["limits"]["idle_timeout"] = idle_timeout;
    j["limits"]["max_output_size"] = max_output_size;
    j["limits"]["max_fetch_size_mb"] = max_fetch_size_mb;
    j["limits"]["kill_grace_seconds"] = kill_grace_seconds;

    j["capabilities"]["extra"] = extra_capabilities;

    j["storage"]["enabled"] = storage_enabled;
    j["storage"]["db_path"] = db_path;
    j["storage"]["ttl_hours"] = ttl_hours;
    j["storage"]["public_url"] = public_url;
    return j;
}

int SandboxSettings::effective_timeout(bool present, int requested) const {
    if (!present) return default_execution_time;
    if (requested <= 0) return -1;
    return requested > max_execution_time ? max_execution_time : requested;
}

int64_t SandboxSettings::effective_memory_mb(bool present, int64_t requested) const {
    if (!present) return max_memory_mb;
    if (requested <= 0) return -1;
    return requested > max_memory_mb ? max_memory_mb : requested;
}

} // namespace sandkernel
