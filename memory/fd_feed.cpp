#include "fd_feed.hpp"
#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include "logger.hpp"

size_t feed_from_fd(int fd, ChunkStore& store, size_t chunk_size, const std::atomic<bool>& running) {
    if (chunk_size == 0 || chunk_size == kUnbounded) {
        throw std::invalid_argument("chunk_size must be a positive number");
    }

    size_t total = 0;
    size_t chunks = 0;
    while (running.load()) {
        Bytes buf(chunk_size);
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "read fd " + std::to_string(fd));
        }
        if (n == 0) {
            break;
        }

        buf.resize(static_cast<size_t>(n));
        if (!store.submit(std::move(buf))) {
            LOG_DEBUG("feed fd %d: readers lagging at chunk %zu", fd, chunks);
        }
        total += static_cast<size_t>(n);
        ++chunks;
    }

    store.end();
    LOG_INFO("feed fd %d finished%s, %zu chunks, %zu bytes",
             fd, running.load() ? "" : " (stopped)", chunks, total);
    return total;
}
