#pragma once
#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace fluxbin {

class ThreadPool {
public:
    explicit ThreadPool(unsigned nthreads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    template <class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /*
     * Split [0, n) into contiguous chunks, run fn(begin, end) for each on
     * the pool and wait for all of them.  The first exception thrown by a
     * chunk (or by queueing one) is rethrown here, after every queued chunk
     * has finished.
     */
    template <class F>
    void for_each_chunk(std::size_t n, std::size_t chunk, F&& fn);

private:
    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
};

template <class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using Ret = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<Ret()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<Ret> res = task->get_future();
    {
        std::lock_guard lk(mtx_);
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return res;
}

template <class F>
void ThreadPool::for_each_chunk(std::size_t n, std::size_t chunk, F&& fn)
{
    if (n == 0) return;
    if (chunk == 0) chunk = (n + size() - 1) / std::max<std::size_t>(size(), 1);

    std::exception_ptr first;
    std::vector<std::future<void>> pending;
    try {
        pending.reserve((n + chunk - 1) / chunk);
        for (std::size_t b = 0; b < n; b += chunk) {
            const std::size_t e = std::min(n, b + chunk);
            pending.push_back(enqueue([&fn, b, e] { fn(b, e); }));
        }
    } catch (...) {
        // queued chunks still reference fn: drain them before rethrowing
        first = std::current_exception();
    }

    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first) first = std::current_exception();
        }
    }
    if (first) std::rethrow_exception(first);
}

} // namespace fluxbin
