/*
 * sandkernel C++ - Memory Ceiling
 *
 * Address-space cap for the script running in a kernel process. arm()
 * lowers the soft RLIMIT_AS to what the process maps now plus the run's
 * budget, so every allocator in the process (the interpreter's and the
 * ones native libraries bring) fails past it. The hard limit is never
 * touched, which lets disarm() put the old soft limit back.
 */
#ifndef sandkernel_CORE_MEMORY_CEILING_HPP
#define sandkernel_CORE_MEMORY_CEILING_HPP

#include <sys/resource.h>
#include <cstdint>

namespace sandkernel {

class MemoryCeiling {
public:
    MemoryCeiling();
    ~MemoryCeiling();

    bool arm(int64_t bytes);
    void disarm();
    bool armed() const { return armed_; }

    // Host work done on behalf of the script (capability imports) runs
    // uncapped; whatever it maps stays granted on top of the budget.
    // Calls nest.
    void suspend();
    void resume();

    // Resident growth since arm(), at its highest
    int64_t peak_growth() const;

    // Mapped bytes of this process, from /proc/self/statm
    static int64_t address_space_bytes();

    // A "VmXXX:" field of /proc/self/status in bytes, -1 when unreadable
    static int64_t status_bytes(const char* field);

private:
    MemoryCeiling(const MemoryCeiling&);
    MemoryCeiling& operator=(const MemoryCeiling&);

    bool apply(rlim_t soft);

    bool armed_;
    int suspended_;
    struct rlimit saved_;
    int64_t limit_;
    int64_t suspended_at_;
    int64_t rss_at_arm_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_MEMORY_CEILING_HPP
