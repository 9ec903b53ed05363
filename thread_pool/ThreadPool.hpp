#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// 固定大小的工作线程池
// ChunkStore::get_range_async 把会阻塞的读取循环投递到这里执行。
// 注意：任务可能长时间阻塞在尚未到达的数据上，stop() 会等待所有已投递任务结束，
// 因此停止线程池之前应先 end() 或 destroy() 对应的 ChunkStore。
class ThreadPool {
public:
    using Task = std::function<void()>;
    static constexpr std::size_t kMaxThreads = 64;

    explicit ThreadPool(std::size_t thread_count = std::thread::hardware_concurrency()) {
        if (thread_count == 0) thread_count = 1;
        if (thread_count > kMaxThreads)
            throw std::invalid_argument("thread_count exceeds maximum allowed threads");

        running_.store(true, std::memory_order_release);
        idle_count_.store(static_cast<int>(thread_count), std::memory_order_release);
        workers_.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() noexcept {
        stop();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // 投递任务，任务抛出的异常保存在返回的 future 中
    template<class F, class... Args>
    auto post_task(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>
    {
        using return_type = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        std::future<return_type> res = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.load(std::memory_order_relaxed)) {
                throw std::runtime_error("post_task on stopped ThreadPool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        task_cv_.notify_one();
        return res;
    }

    int idle_thread_count() const noexcept {
        return idle_count_.load(std::memory_order_acquire);
    }

    std::size_t thread_count() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return workers_.size();
    }

    // 已投递但尚未被工作线程取走的任务数
    std::size_t pending_tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    // 拒绝新任务，执行完队列中剩余任务后回收线程；可重复调用
    void stop() noexcept {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
            return;
        }

        {
            // 持锁通知，避免工作线程在检查条件与进入等待之间错过唤醒
            std::lock_guard<std::mutex> lock(mutex_);
            task_cv_.notify_all();
        }

        std::vector<std::thread> to_join;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            to_join.swap(workers_);
        }
        for (auto& t : to_join) {
            if (t.joinable()) t.join();
        }
    }

private:
    void worker_loop() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                task_cv_.wait(lock, [this] {
                    return !running_.load(std::memory_order_acquire) || !tasks_.empty();
                });

                if (tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
                idle_count_.fetch_sub(1, std::memory_order_acq_rel);
            }

            task();

            idle_count_.fetch_add(1, std::memory_order_acq_rel);
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    std::condition_variable task_cv_;
    std::atomic<bool> running_{false};
    std::atomic<int> idle_count_{0};
};
