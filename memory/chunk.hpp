#ifndef CHUNK_HPP
#define CHUNK_HPP

#include <cstddef>
#include <memory>
#include "byte_stream.hpp"

// 账本中的一个数据块：写入后不可修改，[start, end) 为它在整条流中的绝对偏移
struct Chunk {
    size_t start;
    size_t end;
    std::shared_ptr<const Bytes> payload;

    Chunk(size_t start_offset, Bytes bytes);

    size_t length() const { return end - start; }

    // 按绝对偏移截取 [from, to)，要求 start <= from <= to <= end
    ByteSlice slice(size_t from, size_t to) const;
};

#endif // CHUNK_HPP
