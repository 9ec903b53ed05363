#ifndef CHUNK_STORE_HPP
#define CHUNK_STORE_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <future>
#include <mutex>
#include <optional>

#include "byte_stream.hpp"
#include "chunk.hpp"
#include "range_cursor.hpp"
#include "store_error.hpp"
#include "ThreadPool.hpp"

/**
 * @brief 有界、只追加的字节存储
 *
 * 单一生产者按到达顺序追加数据块；任意多个读者可以读取任意区间，
 * 包括尚未写入的区间（阻塞等待数据到达）。账本跨度超过保留窗口时从头部淘汰旧块，
 * 但最新的一块永远保留。
 *
 * 线程模型：append/end/destroy 由调用方串行化，可与任意数量的读取并发。
 * 账本、状态和共享游标都由同一把互斥锁保护；每次变更递增代数并广播唤醒，
 * 等待者各自重新检查条件。
 */
class ChunkStore : public ByteSink {
public:
    struct Config {
        size_t max_size        = kUnbounded;   // 保留窗口：低水位到高水位的最大跨度
        size_t max_buffer_size = kUnbounded;   // 单次 get_range 最多累计的字节数
    };

    enum class State {
        OPEN,       // 可继续写入
        ENDED,      // 不再写入，current_end 已确定
        DESTROYED   // 已拆除，所有操作失败
    };

    // 参数：追加（及淘汰）之后的大小、之前的大小
    using ResizeCallback = std::function<void(size_t size, size_t old_size)>;

    ChunkStore();
    explicit ChunkStore(const Config& config);
    ~ChunkStore() override = default;

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;
    ChunkStore(ChunkStore&&) = delete;
    ChunkStore& operator=(ChunkStore&&) = delete;

    // ---- 写入端 ----

    /**
     * 追加一个数据块并按保留窗口淘汰旧块，唤醒所有等待者
     * 只在已拆除时失败；结束后的写入由 submit 拒绝
     * @throws StoreDestroyedError
     */
    void append(Bytes bytes);

    /**
     * ByteSink 写入：结束后写入抛 WriteAfterEndError
     * @return false 表示最慢的未完成读者已落后满一个保留窗口，生产者应当放慢；
     *         没有未完成的读者或窗口无界时总是 true
     */
    bool submit(Bytes bytes) override;
    void complete() override { end(); }
    void fail(std::exception_ptr error) override { destroy(std::move(error)); }

    // OPEN -> ENDED，解析未知游标并唤醒等待者；重复调用无效果
    void end();

    // 进入 DESTROYED，丢弃全部数据并唤醒等待者；第一次给出的原因生效
    void destroy(std::exception_ptr cause = nullptr);

    // ---- 读取端 ----

    /**
     * 查找从 offset 开始、不超过 limit 的下一段连续数据
     * @return 数据尚未到达返回 std::nullopt；流已结束且恰好读到末尾的空区间返回空切片
     * @throws OutOfBoundsError / ChunkEvictedError / StoreDestroyedError
     */
    std::optional<ByteSlice> locate(size_t offset, size_t limit) const;

    /**
     * 阻塞读取 [offset, offset + length)
     * @param length kUnbounded 表示读到流结束
     * @param offset std::nullopt 表示使用当前游标
     * 游标在进入等待之前就被推进到本次读取的终点
     */
    Bytes get_range(size_t length = kUnbounded, std::optional<size_t> offset = std::nullopt);

    // 同 get_range，但在调用线程上完成偏移解析和游标推进，等待循环交给线程池
    // 线程池拒绝投递时抛出其异常，并撤销本次游标推进
    std::future<Bytes> get_range_async(ThreadPool& pool,
                                       size_t length = kUnbounded,
                                       std::optional<size_t> offset = std::nullopt);

    // 立即返回惰性游标，偏移解析和游标推进规则同 get_range
    RangeCursor open_cursor(size_t length = kUnbounded, std::optional<size_t> offset = std::nullopt);

    // ---- 共享游标 ----

    // std::nullopt 表示"未知"，即最终长度确定后的末尾
    std::optional<size_t> get_seek() const;

    // kUnbounded 与 std::nullopt 等价；流已结束时立即解析为 current_end
    std::optional<size_t> set_seek(std::optional<size_t> seek);

    // ---- 查询 ----

    size_t size() const;
    size_t current_end() const;     // 高水位
    size_t low_water_mark() const;  // 最低仍可读取的偏移
    State state() const;
    const Config& config() const { return config_; }

    void set_resize_callback(ResizeCallback cb);

private:
    friend class RangeCursor;

    // 已解析的读取计划；offset 为空表示要等流结束后以 current_end 为起点
    struct ReadPlan {
        std::optional<size_t> offset;
        size_t length;
        size_t end;
    };

    ReadPlan plan_read_locked(size_t length, std::optional<size_t> offset);
    // 有限长度的终点越界时抛 OutOfBoundsError
    static size_t checked_range_end(size_t offset, size_t length);
    Bytes collect_locked(std::unique_lock<std::mutex>& lock, ReadPlan plan);

    // RangeCursor 的一次拉取：pos/end 由游标持有，end 可能在流结束后被收紧
    bool next_slice(uint64_t reader_id, size_t& pos, size_t& end, ByteSlice& out);

    // 未完成读者的位置登记；id 0 表示未登记
    uint64_t register_reader_locked(size_t pos);
    void release_reader(uint64_t id);
    bool slowest_reader_lagging_locked() const;

    std::optional<ByteSlice> locate_locked(size_t offset, size_t limit) const;
    void set_seek_locked(std::optional<size_t> seek);
    size_t size_locked() const;
    void evict_locked();

    // 等待下一次账本变更（append/end/destroy）
    void wait_locked(std::unique_lock<std::mutex>& lock);
    void notify_locked();

private:
    const Config config_;

    std::deque<Chunk> chunks_;
    size_t current_end_{0};
    State state_{State::OPEN};
    std::exception_ptr destroy_cause_;

    std::optional<size_t> seek_{0};

    std::map<uint64_t, size_t> readers_;   // reader id -> 当前位置
    uint64_t next_reader_id_{1};

    ResizeCallback resize_cb_;

    mutable std::mutex mutex_;
    std::condition_variable changed_cv_;
    uint64_t generation_{0};
};

#endif // CHUNK_STORE_HPP
