#ifndef NASAMCP_WORKER_POOL_HPP
#define NASAMCP_WORKER_POOL_HPP

// Fixed-size thread pool for HTTP-bound requests. The libwebsockets event
// loop hands work over and keeps serving sockets while tools run.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace worker_pool {

class WorkerPool {
public:
    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Queue a job. Returns false once shutdown() has started.
    bool submit(std::function<void()> job);

    // Run every job already queued, then join the threads. Idempotent.
    void shutdown();

    std::size_t thread_count() const { return threads_.size(); }

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<std::function<void()>> jobs_;
    std::vector<std::thread> threads_;
    bool stopping_ = false;
};

} // namespace worker_pool

#endif // NASAMCP_WORKER_POOL_HPP
