#ifndef LOGGER_PR_H
#define LOGGER_PR_H

#include <stdio.h>
#include <atomic>
#include <cstdint>
#include <string>

namespace logger {

// 控制台调试输出级别，数值越大输出越详细
enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

extern std::atomic<LogLevel> g_pr_level;

// 读写时不加锁，原子变量保证多线程可见
void pr_set_level(LogLevel level);
LogLevel pr_get_level();

// 控制台输出目标，默认 stdout；标准输出另作数据通道的程序应改为 stderr
void pr_set_output(FILE* stream);
FILE* pr_get_output();

// 当前线程ID的字符串形式
std::string thread_id_to_string();

// 串行化一行输出，避免多线程交错
void pr_write_line(const char* tag, const char* func, int line, const char* format, ...)
    __attribute__((format(printf, 4, 5)));

#define PR_INTERNAL(level, tag, format, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(logger::g_pr_level.load(std::memory_order_relaxed))) { \
            logger::pr_write_line(tag, __FUNCTION__, __LINE__, format, ##__VA_ARGS__); \
        } \
    } while (0)

#define PR_DEBUG(format, ...) \
    PR_INTERNAL(logger::LogLevel::DEBUG, "DEBUG", format, ##__VA_ARGS__)

#define PR_INFO(format, ...) \
    PR_INTERNAL(logger::LogLevel::INFO, "INFO", format, ##__VA_ARGS__)

#define PR_WARN(format, ...) \
    PR_INTERNAL(logger::LogLevel::WARN, "WARN", format, ##__VA_ARGS__)

#define PR_ERROR(format, ...) \
    PR_INTERNAL(logger::LogLevel::ERROR, "ERROR", format, ##__VA_ARGS__)

} // namespace logger

#endif // LOGGER_PR_H
