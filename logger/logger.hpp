#ifndef LOGGER_LOGGER_H
#define LOGGER_LOGGER_H

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "log_queue.hpp"

namespace logger {

class Logger {
public:
    // 日志级别：ERROR > WARN > INFO > DEBUG
    enum class Level {
        ERROR,
        WARN,
        INFO,
        DEBUG
    };

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    struct Config {
        std::string filename;                  // 日志文件路径，如 "logs/replay.log"
        Level       level          = Level::INFO;
        size_t      max_lines      = 5000;     // 单个文件最大行数，0 表示不切割
        size_t      queue_capacity = 10000;    // 异步队列容量
        bool        async          = false;    // 是否由后台线程写文件
        bool        stdout_fallback = true;    // 文件不可写时改写标准输出
    };

    /**
     * 初始化日志器
     * @return 成功返回true；重复初始化或无法创建日志文件返回false
     */
    bool initialize(const Config& config);

    bool is_initialized() const { return initialized_; }

    // 停止后台线程，写完队列中剩余日志并关闭文件；之后可再次 initialize
    void shutdown();

    void set_level(Level level);
    Level get_level() const;

    void flush();

    // 当前正在写入的日志文件完整路径
    std::string current_file() const;

    // 建议通过 LOG_* 宏调用
    void write(Level level, const char* file, const char* func, int line,
               const char* format, ...) __attribute__((format(printf, 6, 7)));

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void async_write_thread();
    void sync_write(const std::string& log);

    // 打开下一个编号的日志文件（调用方持有 file_mutex_）
    bool open_next_file();

    std::string get_formatted_time() const;

    std::atomic<bool>  initialized_{false};
    std::atomic<Level> current_level_{Level::INFO};

    std::string        dir_name_;
    std::string        base_name_;
    std::string        current_path_;
    size_t             max_lines_{0};
    uint64_t           line_count_{0};
    int                file_index_{0};
    bool               stdout_fallback_{true};

    FILE*              file_{nullptr};

    bool               async_{false};
    std::unique_ptr<LogQueue<std::string>> log_queue_;
    std::thread        async_thread_;

    mutable std::mutex file_mutex_;
};

#define LOG_DEBUG(format, ...) \
    logger::Logger::instance().write(logger::Logger::Level::DEBUG, \
                                     __FILE__, __FUNCTION__, __LINE__, \
                                     format, ##__VA_ARGS__)

#define LOG_INFO(format, ...) \
    logger::Logger::instance().write(logger::Logger::Level::INFO, \
                                     __FILE__, __FUNCTION__, __LINE__, \
                                     format, ##__VA_ARGS__)

#define LOG_WARN(format, ...) \
    logger::Logger::instance().write(logger::Logger::Level::WARN, \
                                     __FILE__, __FUNCTION__, __LINE__, \
                                     format, ##__VA_ARGS__)

#define LOG_ERROR(format, ...) \
    logger::Logger::instance().write(logger::Logger::Level::ERROR, \
                                     __FILE__, __FUNCTION__, __LINE__, \
                                     format, ##__VA_ARGS__)

} // namespace logger

#endif // LOGGER_LOGGER_H
