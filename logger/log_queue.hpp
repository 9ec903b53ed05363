#ifndef LOGGER_LOG_QUEUE_H
#define LOGGER_LOG_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace logger {

// 有界阻塞队列：异步日志线程的生产/消费通道
template<typename T>
class LogQueue {
public:
    explicit LogQueue(size_t capacity)
        : capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("LogQueue capacity must be greater than 0");
        }
    }

    LogQueue(const LogQueue&) = delete;
    LogQueue& operator=(const LogQueue&) = delete;

    /**
     * 入队
     * @param timeout_ms >0 最多等待的毫秒数；0 队满立即失败；<0 一直等待
     * @return 入队成功返回true；超时、队满或已关闭返回false，此时 item 保持原值
     */
    bool push(T&& item, int timeout_ms = -1) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto writable = [this] { return closed_ || items_.size() < capacity_; };

        if (timeout_ms > 0) {
            if (!not_full_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), writable)) {
                return false;
            }
        } else if (timeout_ms == 0) {
            if (!writable()) return false;
        } else {
            not_full_cv_.wait(lock, writable);
        }

        if (closed_) return false;

        items_.push_back(std::move(item));
        not_empty_cv_.notify_one();
        return true;
    }

    /**
     * 出队，timeout_ms 语义同 push
     * 关闭后仍可取出剩余元素，取空后返回false
     */
    bool pop(T& item, int timeout_ms = -1) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto readable = [this] { return closed_ || !items_.empty(); };

        if (timeout_ms > 0) {
            if (!not_empty_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), readable)) {
                return false;
            }
        } else if (timeout_ms == 0) {
            if (items_.empty()) return false;
        } else {
            not_empty_cv_.wait(lock, readable);
        }

        if (items_.empty()) return false;

        item = std::move(items_.front());
        items_.pop_front();
        not_full_cv_.notify_one();
        return true;
    }

    // 关闭队列并唤醒所有等待者，之后push一律失败
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_cv_.notify_all();
        not_full_cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::deque<T> items_;
    bool closed_{false};

    mutable std::mutex mutex_;
    std::condition_variable not_empty_cv_;
    std::condition_variable not_full_cv_;
};

} // namespace logger

#endif // LOGGER_LOG_QUEUE_H
