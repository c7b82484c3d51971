#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace redis_objects {
namespace utils {

// Executor for non-blocking store commands
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result_t<F, Args...>>;

    // Higher number = higher priority; equal priorities run in submission order
    template<typename F, typename... Args>
    auto submit_priority(int priority, F&& f, Args&&... args) -> std::future<typename std::invoke_result_t<F, Args...>>;

    // Block until the queue is empty and no task is running
    void wait_for_all();

    size_t thread_count() const { return threads_.size(); }
    size_t pending_tasks() const;
    bool is_running() const { return !stop_; }

    // Runs every queued task, then joins the workers
    void shutdown();

private:
    struct Task {
        std::function<void()> function;
        int priority;
        uint64_t sequence;

        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };

    std::vector<std::thread> threads_;
    std::priority_queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable finished_condition_;
    std::atomic<bool> stop_{false};
    size_t active_tasks_{0};
    uint64_t next_sequence_{0};

    void worker_thread();
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result_t<F, Args...>> {
    return submit_priority(0, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submit_priority(int priority, F&& f, Args&&... args) -> std::future<typename std::invoke_result_t<F, Args...>> {
    using return_type = typename std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (stop_) {
            throw std::runtime_error("Cannot submit task to stopped ThreadPool");
        }

        tasks_.push(Task{[task]() { (*task)(); }, priority, next_sequence_++});
    }

    condition_.notify_one();
    return result;
}

// Runs `f` on a thread of its own that nothing joins. Unlike a std::async
// future, the returned future may be dropped without waiting for `f`, so `f`
// must own everything it touches.
template<typename F>
auto spawn_detached(F&& f) -> std::future<typename std::invoke_result_t<F>> {
    using return_type = typename std::invoke_result_t<F>;

    std::packaged_task<return_type()> task(std::forward<F>(f));
    std::future<return_type> result = task.get_future();
    std::thread(std::move(task)).detach();
    return result;
}

} // namespace utils
} // namespace redis_objects
