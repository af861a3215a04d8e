#ifndef THREADPOOL_TPP
#define THREADPOOL_TPP

#include "ThreadPool.hpp"

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [func = std::forward<F>(f), ... capturedArgs = std::forward<Args>(args)]() mutable {
            return func(capturedArgs...);
        }
    );

    std::future<return_type> res = task->get_future();
    if(workers.empty()) {
        (*task)();
        return res;
    }
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if(stop) throw std::runtime_error("enqueue on stopped ThreadPool");
        tasks.emplace([task]{ (*task)(); });
    }
    condition.notify_one();
    return res;
}

template<class T, class F>
auto ThreadPool::mapOrdered(const std::vector<T> &items, F&& fn)
    -> std::vector<std::invoke_result_t<F, const T&>>
{
    using return_type = std::invoke_result_t<F, const T&>;

    std::vector<std::future<return_type>> pending;
    pending.reserve(items.size());
    for(const T &item : items) {
        pending.push_back(enqueue([&fn, &item]() { return fn(item); }));
    }

    // Every task borrows fn and items, so all must finish before anything is rethrown
    for(auto &future : pending) {
        future.wait();
    }

    std::vector<return_type> results;
    results.reserve(items.size());
    for(auto &future : pending) {
        results.push_back(future.get());
    }
    return results;
}

#endif // THREADPOOL_TPP
