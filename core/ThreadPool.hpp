#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace securewatch {

// Fixed-size worker pool with an optionally bounded task queue.
// With max_queue_size > 0, Enqueue() blocks the producer while the queue is
// full; this is the backpressure point for event ingestion.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency(),
                        size_t max_queue_size = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto Enqueue(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type>;

    // Blocks until the queue is empty and no task is running.
    void WaitIdle();

    // Stops accepting tasks, runs everything already queued, joins workers.
    void Shutdown();

    size_t GetActiveThreadCount() const { return workers_.size(); }
    size_t GetQueueSize() const;
    size_t GetMaxQueueSize() const { return max_queue_size_; }
    bool IsStopped() const { return stop_; }

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    const size_t max_queue_size_;
    size_t running_tasks_ = 0;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable space_condition_;
    std::condition_variable idle_condition_;
    std::atomic<bool> stop_{false};
};

template<typename F, typename... Args>
auto ThreadPool::Enqueue(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (max_queue_size_ > 0) {
            space_condition_.wait(lock, [this] {
                return stop_ || tasks_.size() < max_queue_size_;
            });
        }
        if (stop_) {
            throw std::runtime_error("Cannot enqueue on stopped ThreadPool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return res;
}

} // namespace securewatch
