#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

using Bytes = std::vector<uint8_t>;

// 无上限：用于长度、区间终点、保留窗口和单次读取上限
constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

// offset + length；length 为 kUnbounded 时得到 kUnbounded
// 有限长度的区间终点达到或越过 kUnbounded 时返回 std::nullopt，这样的区间永远无法满足
inline std::optional<size_t> range_end(size_t offset, size_t length) {
    if (length == kUnbounded) {
        return kUnbounded;
    }
    if (offset >= kUnbounded - length) {
        return std::nullopt;
    }
    return offset + length;
}

// 只读字节视图，与所在数据块共享载荷所有权，切片不拷贝数据
class ByteSlice {
public:
    ByteSlice() = default;
    ByteSlice(std::shared_ptr<const Bytes> owner, size_t pos, size_t len)
        : owner_(std::move(owner)), pos_(pos), len_(len) {}

    const uint8_t* data() const { return owner_ ? owner_->data() + pos_ : nullptr; }
    size_t size() const { return len_; }
    bool empty() const { return len_ == 0; }

    uint8_t operator[](size_t i) const { return (*owner_)[pos_ + i]; }

    const uint8_t* begin() const { return data(); }
    const uint8_t* end() const { return data() + len_; }

    Bytes to_bytes() const { return len_ == 0 ? Bytes() : Bytes(begin(), end()); }

private:
    std::shared_ptr<const Bytes> owner_;
    size_t pos_{0};
    size_t len_{0};
};

// 写入端能力：外部生产者通过它推送数据
class ByteSink {
public:
    virtual ~ByteSink() = default;

    // 写入一段数据；返回false表示生产者应当放慢（背压提示，不是错误）
    virtual bool submit(Bytes bytes) = 0;
    // 不再有数据
    virtual void complete() = 0;
    // 以给定原因拆除
    virtual void fail(std::exception_ptr error) = 0;
};

// 读取端能力：消费者逐段拉取
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // 阻塞直到拿到下一段数据；正常结束返回false，失败时抛出对应异常
    virtual bool pull(ByteSlice& out) = 0;
};

#endif // BYTE_STREAM_HPP
