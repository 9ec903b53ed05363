#ifndef PIPE_HPP
#define PIPE_HPP

#include <cstddef>
#include "byte_stream.hpp"

/**
 * 把 source 的全部数据转交给 sink
 * 正常结束时调用 sink.complete()；source 或 sink 失败时以同一原因调用 sink.fail() 并重新抛出
 * @return 转交的字节数
 */
size_t pipe(ByteSource& source, ByteSink& sink);

#endif // PIPE_HPP
