#include "logger.hpp"
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace logger {

namespace {

const char* level_name(Logger::Level level) {
    switch (level) {
        case Logger::Level::DEBUG: return "DEBUG";
        case Logger::Level::INFO:  return "INFO";
        case Logger::Level::WARN:  return "WARN";
        case Logger::Level::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// __FILE__ 只保留文件名部分
const char* base_of(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

// 从 "<base>_<n>.log" 中解析 n，不匹配返回0
int parse_index(const std::string& filename, const std::string& base) {
    const std::string prefix = base + "_";
    const std::string suffix = ".log";
    if (filename.size() <= prefix.size() + suffix.size()) return 0;
    if (filename.compare(0, prefix.size(), prefix) != 0) return 0;
    if (filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) return 0;

    std::string digits = filename.substr(prefix.size(),
                                         filename.size() - prefix.size() - suffix.size());
    int index = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return 0;
        index = index * 10 + (c - '0');
    }
    return index;
}

} // namespace

Logger::Logger() = default;

Logger::~Logger() {
    shutdown();
}

// 格式：YYYY-MM-DD HH:MM:SS.mmm
std::string Logger::get_formatted_time() const {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    char time_buf[64];
    snprintf(time_buf, sizeof(time_buf),
             "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<int>(ms.count()));
    return std::string(time_buf);
}

bool Logger::open_next_file() {
    if (file_) {
        fflush(file_);
        fclose(file_);
        file_ = nullptr;
    }

    ++file_index_;
    std::string filename = base_name_ + "_" + std::to_string(file_index_) + ".log";
    current_path_ = dir_name_.empty() ? filename : dir_name_ + "/" + filename;

    file_ = fopen(current_path_.c_str(), "a");
    if (!file_) {
        std::cerr << "Failed to open log file: " << current_path_
                  << ", error: " << std::strerror(errno) << std::endl;
        return false;
    }

    line_count_ = 0;
    return true;
}

void Logger::sync_write(const std::string& log) {
    std::lock_guard<std::mutex> lock(file_mutex_);

    bool rotate = !file_ || (max_lines_ > 0 && line_count_ >= max_lines_);
    if (rotate && !open_next_file()) {
        if (stdout_fallback_) {
            std::fwrite(log.data(), 1, log.size(), stdout);
        }
        return;
    }

    size_t written = fwrite(log.data(), 1, log.size(), file_);
    if (written != log.size()) {
        std::cerr << "Write incomplete: " << written << " of " << log.size() << " bytes" << std::endl;
    }
    fflush(file_);
    ++line_count_;
}

void Logger::write(Level level, const char* file, const char* func, int line,
                   const char* format, ...) {
    if (!initialized_) return;

    if (static_cast<int>(level) > static_cast<int>(current_level_.load())) {
        return;
    }

    char message[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    std::string log = get_formatted_time() + " [" + level_name(level) + "] " +
                      "[" + base_of(file) + ":" + func + ":" + std::to_string(line) + "] " +
                      message + "\n";

    if (async_ && log_queue_) {
        if (!log_queue_->push(std::move(log), 100) && stdout_fallback_) {
            std::fwrite(log.data(), 1, log.size(), stdout);
        }
        return;
    }
    sync_write(log);
}

void Logger::async_write_thread() {
    std::string log;
    // 队列关闭且取空后 pop 返回false，线程退出
    while (log_queue_->pop(log)) {
        sync_write(log);
    }
}

void Logger::set_level(Level level) {
    current_level_ = level;
}

Logger::Level Logger::get_level() const {
    return current_level_.load();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_) fflush(file_);
}

std::string Logger::current_file() const {
    std::lock_guard<std::mutex> lock(file_mutex_);
    return current_path_;
}

bool Logger::initialize(const Config& config) {
    if (initialized_) {
        std::cerr << "Logger already initialized" << std::endl;
        return false;
    }
    if (config.filename.empty()) {
        std::cerr << "Logger filename is empty" << std::endl;
        return false;
    }

    current_level_ = config.level;
    max_lines_ = config.max_lines;
    stdout_fallback_ = config.stdout_fallback;

    std::filesystem::path path(config.filename);
    dir_name_ = path.parent_path().string();
    base_name_ = path.stem().string();

    // 续接目录中已有的最大编号，避免覆盖旧日志
    file_index_ = 0;
    std::error_code ec;
    if (!dir_name_.empty()) {
        std::filesystem::create_directories(dir_name_, ec);
        if (ec) {
            std::cerr << "Failed to create log directory " << dir_name_
                      << ": " << ec.message() << std::endl;
            return false;
        }
    }
    std::filesystem::directory_iterator it(dir_name_.empty() ? "." : dir_name_, ec);
    if (!ec) {
        for (const auto& entry : it) {
            int index = parse_index(entry.path().filename().string(), base_name_);
            if (index > file_index_) file_index_ = index;
        }
    }

    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        if (!open_next_file()) {
            std::cerr << "Failed to create initial log file" << std::endl;
            return false;
        }
    }

    async_ = config.async && config.queue_capacity > 0;
    if (async_) {
        log_queue_ = std::make_unique<LogQueue<std::string>>(config.queue_capacity);
        async_thread_ = std::thread(&Logger::async_write_thread, this);
    }

    initialized_ = true;
    return true;
}

void Logger::shutdown() {
    if (!initialized_.exchange(false)) return;

    if (async_thread_.joinable()) {
        log_queue_->close();
        async_thread_.join();
    }
    async_ = false;

    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_) {
        fflush(file_);
        fclose(file_);
        file_ = nullptr;
    }
}

} // namespace logger
