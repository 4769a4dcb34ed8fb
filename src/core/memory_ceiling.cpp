#include <sandkernel/core/memory_ceiling.hpp>
#include <sandkernel/core/logger.hpp>

#include <cstdio>
#include <cstring>
#include <cerrno>
#include <unistd.h>

namespace sandkernel {

MemoryCeiling::MemoryCeiling()
    : armed_(false)
    , suspended_(0)
    , limit_(0)
    , suspended_at_(0)
    , rss_at_arm_(0)
{
    saved_.rlim_cur = RLIM_INFINITY;
    saved_.rlim_max = RLIM_INFINITY;
}

MemoryCeiling::~MemoryCeiling() {
    disarm();
}

int64_t MemoryCeiling::address_space_bytes() {
    FILE* f = fopen("/proc/self/statm", "r");
    if (!f) return -1;
    long long pages = 0;
    int matched = fscanf(f, "%lld", &pages);
    fclose(f);
    if (matched != 1) return -1;
    return static_cast<int64_t>(pages) * static_cast<int64_t>(sysconf(_SC_PAGESIZE));
}

int64_t MemoryCeiling::status_bytes(const char* field) {
    FILE* f = fopen("/proc/self/status", "r");
    if (!f) return -1;

    size_t len = strlen(field);
    char line[256];
    int64_t out = -1;
    while (fgets(line, sizeof(line), f)) {
        if (strncmp(line, field, len) != 0 || line[len] != ':') continue;
        long long kb = 0;
        if (sscanf(line + len + 1, "%lld", &kb) == 1) {
            out = static_cast<int64_t>(kb) * 1024;
        }
        break;
    }
    fclose(f);
    return out;
}

bool MemoryCeiling::apply(rlim_t soft) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = saved_.rlim_max;
    if (rl.rlim_max != RLIM_INFINITY && soft > rl.rlim_max) {
        rl.rlim_cur = rl.rlim_max;
    }
    if (setrlimit(RLIMIT_AS, &rl) != 0) {
        LOG_WARN("[Memory] setrlimit(RLIMIT_AS) failed: %s", strerror(errno));
        return false;
    }
    return true;
}

bool MemoryCeiling::arm(int64_t bytes) {
    if (armed_ || bytes <= 0) return false;

    if (getrlimit(RLIMIT_AS, &saved_) != 0) {
        LOG_WARN("[Memory] getrlimit(RLIMIT_AS) failed: %s", strerror(errno));
        return false;
    }
    int64_t mapped = address_space_bytes();
    if (mapped < 0) {
        LOG_WARN("[Memory] Cannot read the address space size; no ceiling for this run");
        return false;
    }

    // Reset VmHWM so the peak reflects this run only
    FILE* f = fopen("/proc/self/clear_refs", "w");
    if (f) {
        fputs("5", f);
        fclose(f);
    }
    rss_at_arm_ = status_bytes("VmRSS");

    limit_ = mapped + bytes;
    suspended_ = 0;
    if (!apply(static_cast<rlim_t>(limit_))) return false;
    armed_ = true;
    LOG_DEBUG("[Memory] Ceiling at %lld MB (%lld MB mapped)", static_cast<long long>(limit_ >> 20),
              static_cast<long long>(mapped >> 20));
    return true;
}

void MemoryCeiling::disarm() {
    if (!armed_) return;
    armed_ = false;
    suspended_ = 0;
    if (setrlimit(RLIMIT_AS, &saved_) != 0) {
        LOG_WARN("[Memory] Restoring RLIMIT_AS failed: %s", strerror(errno));
    }
}

void MemoryCeiling::suspend() {
    if (!armed_) return;
    if (suspended_++ > 0) return;
    suspended_at_ = address_space_bytes();
    apply(saved_.rlim_cur);
}

void MemoryCeiling::resume() {
    if (!armed_ || suspended_ == 0) return;
    if (--suspended_ > 0) return;

    int64_t now = address_space_bytes();
    if (now > suspended_at_ && suspended_at_ >= 0) {
        limit_ += now - suspended_at_;
    }
    apply(static_cast<rlim_t>(limit_));
}

int64_t MemoryCeiling::peak_growth() const {
    int64_t peak = status_bytes("VmHWM");
    if (peak < 0 || rss_at_arm_ < 0 || peak < rss_at_arm_) return 0;
    return peak - rss_at_arm_;
}

} // namespace sandkernel
