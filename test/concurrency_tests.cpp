#include <gtest/gtest.h>

#include <sandkernel/core/thread_pool.hpp>
#include <sandkernel/core/ticket_mutex.hpp>
#include <sandkernel/core/utils.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sandkernel;

TEST(TicketMutex, ServesInTicketOrder)
{
    TicketMutex tm;
    TicketMutex::Ticket a = tm.take();
    TicketMutex::Ticket b = tm.take();
    ASSERT_EQ (2u, tm.queued());

    std::atomic<bool> b_served(false);
    std::thread waiter([&]() {
        tm.wait(b);
        b_served = true;
        tm.release(b);
    });

    tm.wait(a);
    sleep_ms(20);
    ASSERT_FALSE (b_served.load());
    tm.release(a);

    waiter.join();
    ASSERT_TRUE (b_served.load());
    ASSERT_EQ (0u, tm.queued());
}

TEST(TicketMutex, CancelledTicketsAreSkipped)
{
    TicketMutex tm;
    TicketMutex::Ticket a = tm.take();
    TicketMutex::Ticket b = tm.take();
    TicketMutex::Ticket c = tm.take();

    tm.cancel(b);
    ASSERT_EQ (2u, tm.queued());

    tm.wait(a);
    tm.release(a);
    tm.wait(c);
    tm.release(c);
    ASSERT_EQ (0u, tm.queued());
}

TEST(TicketMutex, CancelOfServedTicketHandsOver)
{
    TicketMutex tm;
    TicketMutex::Ticket a = tm.take();
    TicketMutex::Ticket b = tm.take();
    tm.cancel(a);
    tm.wait(b);
    tm.release(b);

    // releasing or cancelling stale tickets is ignored
    tm.release(a);
    tm.cancel(a);
    ASSERT_EQ (0u, tm.queued());
}

TEST(ThreadPool, RunsEveryJob)
{
    std::atomic<int> done(0);
    {
        ThreadPool pool(3);
        ASSERT_EQ (3u, pool.size());
        for (int i = 0; i < 50; ++i) {
            ASSERT_TRUE (pool.enqueue([&done]() { ++done; }));
        }
        pool.shutdown();
    }
    ASSERT_EQ (50, done.load());
}

TEST(ThreadPool, RejectsJobsAfterShutdown)
{
    ThreadPool pool(1);
    pool.shutdown();
    ASSERT_FALSE (pool.enqueue([]() {}));
    ASSERT_EQ (0u, pool.pending());
}

TEST(ThreadPool, ThrowingJobDoesNotKillWorker)
{
    std::atomic<int> done(0);
    ThreadPool pool(1);
    pool.enqueue([]() { throw std::runtime_error("boom"); });
    pool.enqueue([&done]() { ++done; });
    pool.shutdown();
    ASSERT_EQ (1, done.load());
}
