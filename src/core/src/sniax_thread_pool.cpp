#include "sniax_thread_pool.hpp"
#include "sniax_logger.hpp"

namespace sniax {

ThreadPool::ThreadPool(std::string name, size_t size)
    : name_(std::move(name)) {
    if (size == 0) size = 1;

    workers_.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
    SNIAX_LOG_DEBUG(name_ + " pool started with " + std::to_string(size) + " workers");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;  // stopping and drained
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}

void ThreadPool::shutdown() {
    size_t queued = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) return;
        stopping_ = true;
        queued = queue_.size();
    }
    SNIAX_LOG_DEBUG(name_ + " pool stopping, " + std::to_string(queued) + " queued task(s) to drain");
    wake_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

} // namespace sniax
