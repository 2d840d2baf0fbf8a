#pragma once
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace linescrub {

// Fixed-size pool of worker threads fed from one task queue.
// Exceptions thrown by a task travel to the caller through its future.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t count);
    ~ThreadPool();
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    template <class F, class... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

private:
    void worker_loop();
    void shutdown();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

inline ThreadPool::ThreadPool(std::size_t count) {
    if (count == 0) count = 1;
    workers_.reserve(count);
    try {
        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    } catch (...) {
        // Join whatever was started before reporting the failure
        shutdown();
        throw;
    }
}

inline ThreadPool::~ThreadPool() {
    shutdown();
}

inline void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

inline void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

template <class F, class... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using Ret = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<Ret()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    auto fut = task->get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return fut;
}

// Run fn(begin, end) over [0, count) in contiguous chunks of chunk_size on the
// pool and wait for all of them. No task is still running when this returns
// or throws; the first failure (from submit or from a task) is rethrown.
template <class Pool, class F>
void run_chunks(Pool& pool, std::size_t count, std::size_t chunk_size, F fn) {
    if (count == 0) return;
    if (chunk_size == 0) chunk_size = count;
    // Reserved up front so keeping a future never reallocates after its task is queued
    std::vector<std::future<void>> pending;
    pending.reserve((count + chunk_size - 1) / chunk_size);

    std::exception_ptr failure;
    try {
        for (std::size_t begin = 0; begin < count; begin += chunk_size) {
            std::size_t end = std::min(begin + chunk_size, count);
            pending.push_back(pool.submit([&fn, begin, end] { fn(begin, end); }));
        }
    } catch (...) {
        failure = std::current_exception();
    }

    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) std::rethrow_exception(failure);
}

} // namespace linescrub
