#ifndef RANGE_CURSOR_HPP
#define RANGE_CURSOR_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include "byte_stream.hpp"

class ChunkStore;

// ChunkStore 上 [pos, end) 区间的惰性拉取视图，由 ChunkStore::open_cursor 创建
// 游标不持有数据，保留边界由 ChunkStore 的账本决定；游标不能比所属的 ChunkStore 活得更久
// 未读完的游标在 ChunkStore 中登记当前位置，供背压提示参考
class RangeCursor : public ByteSource {
public:
    ~RangeCursor() override;

    RangeCursor(const RangeCursor&) = delete;
    RangeCursor& operator=(const RangeCursor&) = delete;
    RangeCursor(RangeCursor&& other) noexcept;
    RangeCursor& operator=(RangeCursor&& other) noexcept;

    /**
     * 拉取下一段数据，数据未到达时阻塞
     * @return 区间读完或流结束返回false
     * @throws OutOfBoundsError / ChunkEvictedError / StoreDestroyedError，
     *         失败后每次拉取都会再次抛出同一错误
     */
    bool pull(ByteSlice& out) override;

    // 让游标进入失败状态，下一次 pull 抛出 error
    void fail(std::exception_ptr error);

    size_t position() const { return pos_; }
    // 流结束前的无界游标返回 kUnbounded
    size_t end_position() const { return end_; }
    bool finished() const { return finished_; }
    bool failed() const { return static_cast<bool>(error_); }

private:
    friend class ChunkStore;

    RangeCursor(ChunkStore& store, size_t start, size_t end, uint64_t reader_id);

    // 撤销在 ChunkStore 中的位置登记
    void release();

    ChunkStore* store_;
    uint64_t reader_id_;
    size_t pos_;
    size_t end_;
    bool finished_{false};
    std::exception_ptr error_;
};

#endif // RANGE_CURSOR_HPP
