#include "http/worker_pool.hpp"
#include "mcp/mcp_stdio.hpp"

#include <exception>
#include <utility>

namespace worker_pool {

WorkerPool::WorkerPool(std::size_t thread_count) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    threads_.reserve(thread_count);
    for (std::size_t index = 0; index < thread_count; ++index) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    condition_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    condition_.notify_all();

    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return; // stopping and drained
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        // Jobs report their own failures; anything escaping is a bug worth logging.
        try {
            job();
        } catch (const std::exception &error) {
            mcp_stdio::log_message(std::string("Worker job failed: ") + error.what());
        } catch (...) {
            mcp_stdio::log_message("Worker job failed with a non-standard exception");
        }
    }
}

} // namespace worker_pool
