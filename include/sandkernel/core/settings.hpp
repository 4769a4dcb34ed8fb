/*
 * sandkernel C++ - Sandbox Settings
 *
 * Typed view over Config with range validation. Every limit the
 * engine enforces comes from here.
 */
#ifndef sandkernel_CORE_SETTINGS_HPP
#define sandkernel_CORE_SETTINGS_HPP

#include "config.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace sandkernel {

struct SandboxSettings {
    // Directories
    std::string sessions_root;              // sandbox.dir
    std::string upload_dir;                 // sandbox.upload_dir (read-only to scripts)
    std::vector<std::string> shared_dirs;   // sandbox.shared_dirs (read-only to scripts)
    std::string temp_dir;                   // sandbox.temp_dir (stripped to session-relative)
    bool retain_session_dirs;
    bool enforce_memory_limit;
    std::string kernel_binary;              // sandbox.kernel_binary, started with --kernel

    // Limits
    int max_execution_time;                 // seconds
    int default_execution_time;             // seconds
    int64_t max_memory_mb;
    int max_concurrent_kernels;
    int64_t max_file_size_mb;
    int idle_timeout;                       // seconds
    int64_t max_output_size;                // bytes
    int64_t max_fetch_size_mb;
    int kill_grace_seconds;                 // past the deadline before a kernel is killed

    // Capabilities added on top of the built-in catalog
    std::vector<std::string> extra_capabilities;

    // Artifact storage
    bool storage_enabled;
    std::string db_path;
    int ttl_hours;
    std::string public_url;

    SandboxSettings();

    static SandboxSettings from_config(const Config& cfg);

    bool validate(std::string& error) const;

    // Same keys from_config() reads; how a kernel process gets its settings
    Json to_json() const;

    int64_t max_file_size_bytes() const { return max_file_size_mb * 1024 * 1024; }

    // Missing -> default, above the maximum -> clamped.
    // Returns -1 when the request is invalid (zero or negative).
    int effective_timeout(bool present, int requested) const;

    // Missing -> max_memory_mb, otherwise the same contract as above
    int64_t effective_memory_mb(bool present, int64_t requested) const;
};

// "~" and "~/x" expand against $HOME
std::string expand_home(const std::string& path);

} // namespace sandkernel

#endif // sandkernel_CORE_SETTINGS_HPP
