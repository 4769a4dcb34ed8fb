/*
 * sandkernel C++ - Ticket Mutex
 *
 * FIFO lock: callers take a numbered ticket and are served strictly in
 * ticket order. A ticket that is abandoned before it is served can be
 * cancelled so it does not stall the queue.
 */
#ifndef sandkernel_CORE_TICKET_MUTEX_HPP
#define sandkernel_CORE_TICKET_MUTEX_HPP

#include <mutex>
#include <condition_variable>
#include <set>
#include <cstdint>

namespace sandkernel {

class TicketMutex {
public:
    typedef uint64_t Ticket;

    TicketMutex();

    Ticket take();

    // Blocks until the ticket is being served
    void wait(Ticket ticket);

    // Hands the lock to the next live ticket. Only the served ticket may release.
    void release(Ticket ticket);

    // Gives up a ticket that was never waited on, or is still queued
    void cancel(Ticket ticket);

    // Tickets taken and not yet released or cancelled
    size_t queued() const;

private:
    TicketMutex(const TicketMutex&);
    TicketMutex& operator=(const TicketMutex&);

    void advance();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Ticket next_;
    Ticket serving_;
    std::set<Ticket> cancelled_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_TICKET_MUTEX_HPP
