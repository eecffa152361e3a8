#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace quire::platform {

// Fixed set of workers draining a FIFO queue. Tasks still queued at
// shutdown() are run before the workers exit.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a task and get a future for the result. Throws
    // std::runtime_error once the pool is shut down.
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    size_t size() const { return workers_.size(); }
    size_t pending() const;

    // Waits for queued tasks to complete
    void shutdown();
    bool is_running() const;

private:
    void enqueue(std::function<void()> task);
    void worker_loop();

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

template<typename F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using ReturnType = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
    auto future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
}

} // namespace quire::platform
