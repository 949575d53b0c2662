// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "thread_pool.hpp"

namespace rangejoin {

ThreadPool::ThreadPool(const std::size_t n_threads)
: stop_ {false}
{
    workers_.reserve(n_threads);
    for (std::size_t i {0}; i < n_threads; ++i) {
        workers_.emplace_back([this] { work(); });
    }
}

ThreadPool::~ThreadPool() noexcept
{
    {
        std::lock_guard<std::mutex> lk {mutex_};
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

std::size_t ThreadPool::size() const noexcept
{
    return workers_.size();
}

void ThreadPool::work()
{
    std::function<void()> task;
    while (true) {
        {
            std::unique_lock<std::mutex> lk {mutex_};
            cv_.wait(lk, [this] () { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace rangejoin
