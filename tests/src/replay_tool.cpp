// replay_tool.cpp
// 把标准输入写入 ChunkStore，同时用一个从0开始的游标把数据回放到标准输出
#include "chunk_store.hpp"
#include "range_cursor.hpp"
#include "pipe.hpp"
#include "fd_feed.hpp"
#include "logger.hpp"
#include "pr.hpp"
#include <atomic>
#include <csignal>
#include <cstdio>
#include <pthread.h>
#include <unistd.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std;

atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

// 不带 SA_RESTART：阻塞中的 read 返回 EINTR，生产者得以检查 g_running
void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

sigset_t stop_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

// 写到标准输出的 ByteSink
class StdoutSink : public ByteSink {
public:
    bool submit(Bytes bytes) override {
        size_t written = fwrite(bytes.data(), 1, bytes.size(), stdout);
        if (written != bytes.size()) {
            throw runtime_error("short write to stdout: " + to_string(written) +
                                " of " + to_string(bytes.size()) + " bytes");
        }
        bytes_written_ += written;
        return true;
    }

    void complete() override {
        fflush(stdout);
        LOG_INFO("[StdoutSink] completed, %zu bytes written", bytes_written_);
    }

    void fail(exception_ptr error) override {
        fflush(stdout);
        try {
            rethrow_exception(error);
        } catch (const exception& e) {
            LOG_ERROR("[StdoutSink] failed after %zu bytes: %s", bytes_written_, e.what());
        }
    }

    size_t bytes_written() const { return bytes_written_; }

private:
    size_t bytes_written_{0};
};

// "unbounded" 或 "-" 表示不限
size_t parse_size(const string& arg) {
    if (arg == "unbounded" || arg == "-") {
        return kUnbounded;
    }
    size_t pos = 0;
    unsigned long long value = stoull(arg, &pos);
    if (pos != arg.size()) {
        throw invalid_argument("not a size: " + arg);
    }
    return static_cast<size_t>(value);
}

// 生产者：读取标准输入写入 store，EOF 或收到信号后 end()
// 只有这个线程接收 SIGINT/SIGTERM，信号才能打断它阻塞中的 read
void produce(ChunkStore& store, size_t chunk_size) {
    sigset_t set = stop_signals();
    pthread_sigmask(SIG_UNBLOCK, &set, nullptr);

    try {
        feed_from_fd(STDIN_FILENO, store, chunk_size, g_running);
    } catch (const StoreDestroyedError& e) {
        // 回放失败时存储已被拆除，生产者随之退出
        LOG_WARN("[Producer] store gone: %s", e.what());
    } catch (const exception& e) {
        LOG_ERROR("[Producer] %s", e.what());
        store.destroy(current_exception());
    }
}

int main(int argc, char* argv[]) {
    try {
        // 先屏蔽停止信号，之后创建的线程（含异步日志线程）都继承该屏蔽，只有生产者解除
        sigset_t set = stop_signals();
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
        install_signal_handlers();

        // 标准输出是数据通道，控制台诊断改走 stderr
        logger::pr_set_output(stderr);
        logger::pr_set_level(logger::LogLevel::WARN);

        // 参数解析
        ChunkStore::Config store_config;
        size_t chunk_size = 64 * 1024;
        string log_file = "logs/replay_tool.log";

        if (argc >= 2) store_config.max_size = parse_size(argv[1]);
        if (argc >= 3) store_config.max_buffer_size = parse_size(argv[2]);
        if (argc >= 4) chunk_size = parse_size(argv[3]);
        if (argc >= 5) log_file = argv[4];
        if (chunk_size == 0 || chunk_size == kUnbounded) {
            throw invalid_argument("chunk_size must be a positive number");
        }

        // 日志初始化
        logger::Logger::Config log_config;
        log_config.filename = log_file;
        log_config.level = logger::Logger::Level::INFO;
        log_config.async = true;
        log_config.queue_capacity = 10000;

        if (!logger::Logger::instance().initialize(log_config)) {
            cerr << "Failed to initialize logger!" << endl;
            return 1;
        }

        LOG_INFO("Starting replay: retention=%zu read_cap=%zu chunk_size=%zu",
                 store_config.max_size, store_config.max_buffer_size, chunk_size);

        // ===== 核心对象 =====
        ChunkStore store(store_config);
        store.set_resize_callback([](size_t size, size_t old_size) {
            LOG_DEBUG("[ChunkStore] resize %zu -> %zu", old_size, size);
        });

        RangeCursor cursor = store.open_cursor(kUnbounded, 0);
        StdoutSink sink;

        thread producer(produce, ref(store), chunk_size);

        int rc = 0;
        try {
            size_t moved = pipe(cursor, sink);
            LOG_INFO("Replay finished: %zu bytes, retained %zu, low water mark %zu",
                     moved, store.size(), store.low_water_mark());
        } catch (const exception& e) {
            LOG_ERROR("Replay failed at offset %zu: %s", cursor.position(), e.what());
            cerr << "replay failed: " << e.what() << endl;
            // 让生产者退出；原因与回放失败相同，并打断它阻塞中的 read
            store.destroy(current_exception());
            g_running = false;
            pthread_kill(producer.native_handle(), SIGTERM);
            rc = 1;
        }

        producer.join();
        logger::Logger::instance().shutdown();
        return rc;
    }
    catch (const std::exception& e) {
        LOG_ERROR("uncaught exception: %s", e.what());
        cerr << "replay_tool: " << e.what() << endl;
        logger::Logger::instance().shutdown();
        return 1;
    }
}
