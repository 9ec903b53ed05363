#include "chunk.hpp"
#include <stdexcept>
#include <string>
#include <utility>

// 数据移入共享的不可变载荷，之后只做结构性切片
Chunk::Chunk(size_t start_offset, Bytes bytes)
    : start(start_offset)
    , end(start_offset + bytes.size())
    , payload(std::make_shared<const Bytes>(std::move(bytes))) {
}

ByteSlice Chunk::slice(size_t from, size_t to) const {
    if (from < start || to > end || from > to) {
        throw std::out_of_range("chunk slice [" + std::to_string(from) + ", " +
                                std::to_string(to) + ") outside [" +
                                std::to_string(start) + ", " + std::to_string(end) + ")");
    }
    return ByteSlice(payload, from - start, to - from);
}
