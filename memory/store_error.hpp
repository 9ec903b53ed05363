#ifndef STORE_ERROR_HPP
#define STORE_ERROR_HPP

#include <exception>
#include <stdexcept>
#include <string>

// ChunkStore 读写失败的公共基类
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// 流已结束，请求的非空区间超出最终长度
class OutOfBoundsError : public StoreError {
public:
    explicit OutOfBoundsError(const std::string& msg)
        : StoreError(msg) {}
};

// 请求区间与已被保留窗口淘汰的数据重叠
class ChunkEvictedError : public StoreError {
public:
    explicit ChunkEvictedError(const std::string& msg)
        : StoreError(msg) {}
};

// 单次批量读取累计的字节数超过上限
class BufferCapExceededError : public StoreError {
public:
    explicit BufferCapExceededError(const std::string& msg)
        : StoreError(msg) {}
};

// end() 之后继续写入
class WriteAfterEndError : public StoreError {
public:
    explicit WriteAfterEndError(const std::string& msg)
        : StoreError(msg) {}
};

// 存储已被拆除；cause() 为调用方给出的原因，未给出时为空
class StoreDestroyedError : public StoreError {
public:
    explicit StoreDestroyedError(std::exception_ptr cause = nullptr);

    const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

#endif // STORE_ERROR_HPP
