#pragma once
#include <algorithm>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <future>
#include <stdexcept>
#include <type_traits>
#include <vector>

// Fixed worker count with a bounded backlog: enqueue blocks while
// max_pending tasks are already waiting, so callers cannot outrun the workers.
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads = 1, size_t maxPending = 0)
        : max_pending(maxPending ? maxPending : std::max<size_t>(1, numThreads) * 2), stop(false) {
        for(size_t i = 0; i < std::max<size_t>(1, numThreads); ++i) {
            workers.emplace_back([this] {
                for(;;) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(this->queue_mutex);
                        this->condition.wait(lock, [this]{ return this->stop || !this->tasks.empty(); });
                        if(this->stop && this->tasks.empty()) return;
                        task = std::move(this->tasks.front());
                        this->tasks.pop();
                    }
                    this->space.notify_one();
                    task();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            stop = true;
        }
        condition.notify_all();
        space.notify_all();
        for(std::thread &worker: workers)
            worker.join();
    }

    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using return_type = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            space.wait(lock, [this]{ return stop || tasks.size() < max_pending; });
            if(stop) throw std::runtime_error("enqueue on stopped ThreadPool");
            tasks.emplace([task](){ (*task)(); });
        }
        condition.notify_one();
        return res;
    }

    size_t pending() const {
        std::unique_lock<std::mutex> lock(queue_mutex);
        return tasks.size();
    }

    size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    const size_t max_pending;
    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable space;
    std::atomic<bool> stop;
};
