#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace sniax {

/**
 * @brief Named fixed-size worker pool
 *
 * sniax runs two of these: "domain" bounds how many targets are
 * enumerated at once, "probe" bounds concurrent AXFR and SNI probes.
 * Domain tasks may block on probe futures; probe tasks never submit
 * work, so the two pools cannot deadlock each other.
 *
 * Tasks queued before shutdown() still run before the workers exit.
 */
class ThreadPool {
public:
    /// A size of 0 is raised to 1
    ThreadPool(std::string name, size_t size);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a nullary task. Exceptions it throws surface from the future.
    /// @throws std::runtime_error after shutdown()
    template<class F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<F>>;

    void shutdown();

    size_t size() const noexcept { return workers_.size(); }
    const std::string& name() const noexcept { return name_; }

private:
    void worker_loop();

    std::string                        name_;
    std::vector<std::thread>           workers_;
    std::deque<std::function<void()>>  queue_;
    std::mutex                         mtx_;
    std::condition_variable            wake_;
    bool                               stopping_ = false;
};

template<class F>
auto ThreadPool::submit(F&& task) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;

    auto job = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
    std::future<R> result = job->get_future();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            throw std::runtime_error("submit on stopped " + name_ + " pool");
        }
        queue_.emplace_back([job] { (*job)(); });
    }
    wake_.notify_one();
    return result;
}

} // namespace sniax
