#include <sandkernel/core/thread_pool.hpp>
#include <sandkernel/core/logger.hpp>

#include <exception>

namespace sandkernel {

ThreadPool::ThreadPool(size_t threads)
    : stopping_(false)
    , running_(0)
{
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.push_back(std::thread(&ThreadPool::worker_loop, this));
    }
    LOG_DEBUG("[ThreadPool] Started %zu worker(s)", threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            LOG_WARN("[ThreadPool] Rejecting job, pool is shutting down");
            return false;
        }
        jobs_.push_back(job);
    }
    cv_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size() + running_.load();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void ThreadPool::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) return;
            job = jobs_.front();
            jobs_.pop_front();
            ++running_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            LOG_ERROR("[ThreadPool] Job threw: %s", e.what());
        }
        --running_;
    }
}

} // namespace sandkernel
