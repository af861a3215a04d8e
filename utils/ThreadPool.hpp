#pragma once
#include <vector>
#include <queue>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <stdexcept>
#include <type_traits>

// Fixed-size worker pool. With zero workers every task runs inline on the
// calling thread, which keeps single-threaded runs free of synchronization.
class ThreadPool {
public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    // Applies fn to every item and returns the results in input order,
    // whatever order the workers finish in.
    template<class T, class F>
    auto mapOrdered(const std::vector<T> &items, F&& fn)
        -> std::vector<std::invoke_result_t<F, const T&>>;

    size_t threadCount() const;

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop;
};

#include "ThreadPool.tpp"
