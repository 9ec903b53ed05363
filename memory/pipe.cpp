#include "pipe.hpp"
#include <exception>
#include "logger.hpp"

size_t pipe(ByteSource& source, ByteSink& sink) {
    size_t moved = 0;
    size_t throttled = 0;
    ByteSlice slice;

    try {
        while (source.pull(slice)) {
            moved += slice.size();
            // 背压提示只记录，不阻塞等待读者追上
            if (!sink.submit(slice.to_bytes())) {
                ++throttled;
            }
        }
    } catch (const std::exception& e) {
        // source 或 sink 任一方失败都以同一原因拆除 sink
        LOG_WARN("pipe aborted after %zu bytes: %s", moved, e.what());
        sink.fail(std::current_exception());
        throw;
    }

    if (throttled > 0) {
        LOG_INFO("pipe: sink asked to slow down on %zu of its writes", throttled);
    }
    sink.complete();
    LOG_DEBUG("pipe finished, %zu bytes", moved);
    return moved;
}
