/*
 * sandkernel C++ - Thread Pool
 *
 * Fixed set of worker threads draining a FIFO job queue. shutdown()
 * finishes queued jobs before joining.
 */
#ifndef sandkernel_CORE_THREAD_POOL_HPP
#define sandkernel_CORE_THREAD_POOL_HPP

#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace sandkernel {

class ThreadPool {
public:
    typedef std::function<void()> Job;

    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    // false once shutdown() has begun
    bool enqueue(Job job);

    // Jobs queued or running
    size_t pending() const;

    size_t size() const { return workers_.size(); }

    void shutdown();

private:
    ThreadPool(const ThreadPool&);
    ThreadPool& operator=(const ThreadPool&);

    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<Job> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_;
    std::atomic<size_t> running_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_THREAD_POOL_HPP
