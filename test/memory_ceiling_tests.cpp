#include <gtest/gtest.h>

#include <sandkernel/core/memory_ceiling.hpp>

#include <sys/mman.h>

using namespace sandkernel;

namespace {

const size_t kLarge = 512u * 1024 * 1024;

bool can_map(size_t bytes) {
    void* p = mmap(nullptr, bytes, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (p == MAP_FAILED) return false;
    munmap(p, bytes);
    return true;
}

} // anonymous namespace

TEST(MemoryCeiling, ReadsProcessCounters)
{
    ASSERT_GT (MemoryCeiling::address_space_bytes(), 0);
    ASSERT_GT (MemoryCeiling::status_bytes("VmRSS"), 0);
    ASSERT_EQ (-1, MemoryCeiling::status_bytes("NoSuchField"));
}

TEST(MemoryCeiling, RefusesMappingsPastTheBudget)
{
    ASSERT_TRUE (can_map(kLarge));

    MemoryCeiling ceiling;
    ASSERT_TRUE (ceiling.arm(64 * 1024 * 1024));
    ASSERT_TRUE (ceiling.armed());
    ASSERT_FALSE (can_map(kLarge));
    ASSERT_TRUE (can_map(1024 * 1024));

    ceiling.disarm();
    ASSERT_FALSE (ceiling.armed());
    ASSERT_TRUE (can_map(kLarge));
}

TEST(MemoryCeiling, SuspendLiftsTheCap)
{
    MemoryCeiling ceiling;
    ASSERT_TRUE (ceiling.arm(64 * 1024 * 1024));

    ceiling.suspend();
    ceiling.suspend();
    ASSERT_TRUE (can_map(kLarge));
    ceiling.resume();
    ASSERT_TRUE (can_map(kLarge));
    ceiling.resume();
    ASSERT_FALSE (can_map(kLarge));
}

TEST(MemoryCeiling, DestructorRestoresTheLimit)
{
    struct rlimit before;
    ASSERT_EQ (0, getrlimit(RLIMIT_AS, &before));
    {
        MemoryCeiling ceiling;
        ASSERT_TRUE (ceiling.arm(64 * 1024 * 1024));
        ASSERT_FALSE (ceiling.arm(64 * 1024 * 1024));
    }
    struct rlimit after;
    ASSERT_EQ (0, getrlimit(RLIMIT_AS, &after));
    ASSERT_EQ (before.rlim_cur, after.rlim_cur);
    ASSERT_TRUE (can_map(kLarge));
}
