#include "fluxbin/ThreadPool.hpp"

namespace fluxbin {

ThreadPool::ThreadPool(unsigned nthreads)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);

    for (unsigned i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this] {
            for (;;) {
                std::function<void()> task;
                {
                    std::unique_lock lk(mtx_);
                    cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();     // packaged_task stores any exception in its future
            }
        });
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    // std::jthread joins on destruction
    workers_.clear();
}

} // namespace fluxbin
