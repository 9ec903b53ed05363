#include "pr.hpp"
#include <cstdarg>
#include <mutex>
#include <sstream>
#include <thread>

namespace logger {

std::atomic<LogLevel> g_pr_level{LogLevel::INFO};

namespace {
    std::mutex g_pr_mutex;
    std::atomic<FILE*> g_pr_output{stdout};
}

void pr_set_level(LogLevel level) {
    g_pr_level.store(level, std::memory_order_relaxed);
}

LogLevel pr_get_level() {
    return g_pr_level.load(std::memory_order_relaxed);
}

void pr_set_output(FILE* stream) {
    g_pr_output.store(stream ? stream : stdout, std::memory_order_relaxed);
}

FILE* pr_get_output() {
    return g_pr_output.load(std::memory_order_relaxed);
}

std::string thread_id_to_string() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

void pr_write_line(const char* tag, const char* func, int line, const char* format, ...) {
    char message[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    std::string tid = thread_id_to_string();

    std::lock_guard<std::mutex> lock(g_pr_mutex);
    FILE* out = g_pr_output.load(std::memory_order_relaxed);
    fprintf(out, "[%-5s][%s:%d][TID:%s] %s\n", tag, func, line, tid.c_str(), message);
    fflush(out);
}

} // namespace logger
