// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

// This thread pool implementation is mostly derived from https://github.com/progschj/ThreadPool

#ifndef thread_pool_hpp
#define thread_pool_hpp

#include <cstddef>
#include <vector>
#include <queue>
#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <atomic>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace rangejoin {

class ThreadPool
{
public:
    ThreadPool() = delete;
    
    explicit ThreadPool(std::size_t n_threads);
    
    ThreadPool(const ThreadPool&)             = delete;
    ThreadPool& operator=(const ThreadPool&)  = delete;
    ThreadPool(ThreadPool&& other) noexcept   = delete;
    ThreadPool& operator=(ThreadPool&& other) = delete;
    
    // Finishes every queued task before joining the workers.
    ~ThreadPool() noexcept;
    
    std::size_t size() const noexcept;
    
    template <typename F, typename... Args>
    auto push(F&& f, Args&&... args) -> std::future<std::result_of_t<F(Args...)>>;
    
private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_;
    
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    
    void work();
};

template <typename F, typename... Args>
auto ThreadPool::push(F&& f, Args&&... args) -> std::future<std::result_of_t<F(Args...)>>
{
    using f_result_type = std::result_of_t<F(Args...)>;
    auto task = std::make_shared<std::packaged_task<f_result_type()>>(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    auto result = task->get_future();
    {
        std::lock_guard<std::mutex> lk {mutex_};
        if (stop_) throw std::runtime_error {"ThreadPool: calling push on stopped pool"};
        tasks_.emplace([task] () { (*task)(); });
    }
    cv_.notify_one();
    return result;
}

/**
 Applies op to every element of values on pool and returns the results in input order.
 An exception thrown by op is rethrown here, for the first failing element.
 */
template <typename T, typename UnaryOp>
auto ordered_transform(ThreadPool& pool, const std::vector<T>& values, UnaryOp op)
{
    using result_type = std::result_of_t<UnaryOp(const T&)>;
    std::vector<std::future<result_type>> futures {};
    futures.reserve(values.size());
    for (const auto& value : values) {
        futures.push_back(pool.push(op, std::cref(value)));
    }
    std::vector<result_type> result {};
    result.reserve(values.size());
    for (auto& future : futures) {
        result.push_back(future.get());
    }
    return result;
}

} // namespace rangejoin

#endif
