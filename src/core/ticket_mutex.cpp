#include <sandkernel/core/ticket_mutex.hpp>
#include <sandkernel/core/logger.hpp>

namespace sandkernel {

TicketMutex::TicketMutex() : next_(0), serving_(0) {}

TicketMutex::Ticket TicketMutex::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_++;
}

void TicketMutex::wait(Ticket ticket) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, ticket]() { return serving_ == ticket; });
}

void TicketMutex::release(Ticket ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ticket != serving_) {
        LOG_ERROR("[TicketMutex] Release of ticket %llu while serving %llu",
                  static_cast<unsigned long long>(ticket), static_cast<unsigned long long>(serving_));
        return;
    }
    advance();
}

void TicketMutex::cancel(Ticket ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ticket < serving_ || ticket >= next_) return;
    if (ticket == serving_) {
        advance();
    } else {
        cancelled_.insert(ticket);
    }
}

size_t TicketMutex::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(next_ - serving_) - cancelled_.size();
}

// mutex_ held
void TicketMutex::advance() {
    ++serving_;
    while (!cancelled_.empty() && *cancelled_.begin() == serving_) {
        cancelled_.erase(cancelled_.begin());
        ++serving_;
    }
    cv_.notify_all();
}

} // namespace sandkernel
