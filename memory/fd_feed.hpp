#ifndef FD_FEED_HPP
#define FD_FEED_HPP

#include <atomic>
#include <cstddef>
#include "chunk_store.hpp"

/**
 * 从文件描述符按 chunk_size 读取数据写入 store，直到 EOF 或 running 变为 false，然后 end()
 * read 被信号中断（EINTR）时重新检查 running，因此信号处理函数清除 running 即可让它返回
 * @return 写入的字节数
 * @throws std::system_error 读取失败；StoreError 写入失败（store 已被拆除或已结束）
 */
size_t feed_from_fd(int fd, ChunkStore& store, size_t chunk_size, const std::atomic<bool>& running);

#endif // FD_FEED_HPP
