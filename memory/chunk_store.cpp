#include "chunk_store.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include "pr.hpp"

ChunkStore::ChunkStore()
    : ChunkStore(Config{}) {
}

ChunkStore::ChunkStore(const Config& config)
    : config_(config) {
}

// ---------------------------------------------------------------------------
// 写入端
// ---------------------------------------------------------------------------

void ChunkStore::append(Bytes bytes) {
    size_t old_size = 0;
    size_t new_size = 0;
    ResizeCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::DESTROYED) {
            throw StoreDestroyedError(destroy_cause_);
        }

        old_size = size_locked();
        chunks_.emplace_back(current_end_, std::move(bytes));
        current_end_ = chunks_.back().end;
        PR_DEBUG("append [%zu, %zu)", chunks_.back().start, chunks_.back().end);

        evict_locked();
        new_size = size_locked();
        notify_locked();
        cb = resize_cb_;
    }

    // 回调在锁外执行，回调内可以再调用本对象的查询接口
    if (cb) {
        cb(new_size, old_size);
    }
}

bool ChunkStore::submit(Bytes bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::ENDED) {
            PR_WARN("write of %zu bytes after end rejected", bytes.size());
            throw WriteAfterEndError("write after end");
        }
    }

    append(std::move(bytes));

    std::lock_guard<std::mutex> lock(mutex_);
    return !slowest_reader_lagging_locked();
}

bool ChunkStore::slowest_reader_lagging_locked() const {
    if (config_.max_size == kUnbounded || readers_.empty()) {
        return false;
    }
    size_t slowest = kUnbounded;
    for (const auto& reader : readers_) {
        slowest = std::min(slowest, reader.second);
    }
    // 落后满一个保留窗口：再追加就会淘汰它还没读到的数据
    return slowest < current_end_ && current_end_ - slowest >= config_.max_size;
}

void ChunkStore::end() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::DESTROYED) {
        throw StoreDestroyedError(destroy_cause_);
    }
    if (state_ == State::ENDED) {
        return;
    }

    state_ = State::ENDED;
    // 最终长度已知，未知游标就此确定
    set_seek_locked(seek_);
    notify_locked();
    PR_DEBUG("stream ended at %zu", current_end_);
}

void ChunkStore::destroy(std::exception_ptr cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::DESTROYED) {
        return;
    }

    state_ = State::DESTROYED;
    destroy_cause_ = std::move(cause);
    chunks_.clear();
    notify_locked();
    PR_WARN("chunk store destroyed at offset %zu", current_end_);
}

void ChunkStore::evict_locked() {
    // 最新的一块永不淘汰，即使它本身已超过保留窗口
    while (chunks_.size() > 1 && size_locked() > config_.max_size) {
        PR_DEBUG("evict [%zu, %zu), %zu bytes", chunks_.front().start, chunks_.front().end,
                 chunks_.front().length());
        chunks_.pop_front();
    }
}

// ---------------------------------------------------------------------------
// 查找
// ---------------------------------------------------------------------------

std::optional<ByteSlice> ChunkStore::locate(size_t offset, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locate_locked(offset, limit);
}

std::optional<ByteSlice> ChunkStore::locate_locked(size_t offset, size_t limit) const {
    if (state_ == State::DESTROYED) {
        throw StoreDestroyedError(destroy_cause_);
    }
    if (limit < offset) {
        throw std::invalid_argument("locate limit " + std::to_string(limit) +
                                    " before offset " + std::to_string(offset));
    }

    // 块首尾相接，end 单调不减：第一个 end > offset 的块就是候选
    auto it = std::upper_bound(chunks_.begin(), chunks_.end(), offset,
                               [](size_t off, const Chunk& chunk) { return off < chunk.end; });

    if (it == chunks_.end()) {
        if (state_ == State::ENDED) {
            // 恰好在末尾的空区间或无界区间：干净地读到"无"
            if (offset == current_end_ && (limit == kUnbounded || limit == offset)) {
                return ByteSlice();
            }
            PR_DEBUG("offset %zu out of bounds, stream length %zu", offset, current_end_);
            throw OutOfBoundsError("chunk-offset " + std::to_string(offset) +
                                   " out of bounds, stream length " + std::to_string(current_end_));
        }
        // 以后可能到达
        return std::nullopt;
    }

    if (offset < it->start) {
        PR_DEBUG("offset %zu already evicted, low water mark %zu", offset, it->start);
        throw ChunkEvictedError("chunk at offset " + std::to_string(offset) +
                                " gone, low water mark " + std::to_string(it->start));
    }

    return it->slice(offset, std::min(limit, it->end));
}

// ---------------------------------------------------------------------------
// 批量读取
// ---------------------------------------------------------------------------

ChunkStore::ReadPlan ChunkStore::plan_read_locked(size_t length, std::optional<size_t> offset) {
    if (!offset) {
        offset = seek_;
    }

    ReadPlan plan{offset, length, kUnbounded};
    if (plan.offset) {
        plan.end = checked_range_end(*plan.offset, length);
        // 同步推进游标，后续的默认偏移读取无需等待本次完成
        set_seek_locked(plan.end);
    }
    return plan;
}

size_t ChunkStore::checked_range_end(size_t offset, size_t length) {
    std::optional<size_t> end = range_end(offset, length);
    if (!end) {
        throw OutOfBoundsError("range of " + std::to_string(length) + " bytes at offset " +
                               std::to_string(offset) + " exceeds the addressable stream");
    }
    return *end;
}

Bytes ChunkStore::collect_locked(std::unique_lock<std::mutex>& lock, ReadPlan plan) {
    if (!plan.offset) {
        // 游标未知：只有最终长度确定后才知道从哪里开始
        while (state_ == State::OPEN) {
            wait_locked(lock);
        }
        if (state_ == State::DESTROYED) {
            throw StoreDestroyedError(destroy_cause_);
        }
        plan.offset = current_end_;
        plan.end = checked_range_end(current_end_, plan.length);
        set_seek_locked(plan.end);
    }

    const size_t start = *plan.offset;
    size_t pos = start;
    size_t end = plan.end;
    Bytes out;

    // 读取期间登记位置，背压提示据此判断最慢的读者
    struct ReaderGuard {
        ChunkStore* store;
        uint64_t id;
        ~ReaderGuard() { store->readers_.erase(id); }
    } guard{this, register_reader_locked(pos)};

    while (pos < end) {
        std::optional<ByteSlice> slice = locate_locked(pos, end);
        if (!slice) {
            wait_locked(lock);
        } else {
            // 不变式：pos - start <= max_buffer_size
            if (slice->size() > config_.max_buffer_size - (pos - start)) {
                PR_ERROR("read from %zu exceeds max buffer size %zu", start, config_.max_buffer_size);
                throw BufferCapExceededError("maxBufferSize " + std::to_string(config_.max_buffer_size) +
                                             " exceeded reading from offset " + std::to_string(start));
            }
            out.insert(out.end(), slice->begin(), slice->end());
            pos += slice->size();
            readers_[guard.id] = pos;
        }

        if (state_ == State::ENDED && end == kUnbounded) {
            end = current_end_;
        }
    }

    return out;
}

Bytes ChunkStore::get_range(size_t length, std::optional<size_t> offset) {
    std::unique_lock<std::mutex> lock(mutex_);
    ReadPlan plan = plan_read_locked(length, offset);
    return collect_locked(lock, plan);
}

std::future<Bytes> ChunkStore::get_range_async(ThreadPool& pool, size_t length,
                                               std::optional<size_t> offset) {
    ReadPlan plan;
    std::optional<size_t> seek_before;
    std::optional<size_t> seek_after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seek_before = seek_;
        plan = plan_read_locked(length, offset);
        seek_after = seek_;
    }

    try {
        return pool.post_task([this, plan]() {
            std::unique_lock<std::mutex> lock(mutex_);
            return collect_locked(lock, plan);
        });
    } catch (const std::runtime_error& e) {
        // 读取没有投递出去：期间无人改动游标时撤销本次推进
        std::lock_guard<std::mutex> lock(mutex_);
        if (seek_ == seek_after) {
            set_seek_locked(seek_before);
        }
        PR_WARN("async read not scheduled: %s", e.what());
        throw;
    }
}

// ---------------------------------------------------------------------------
// 惰性游标
// ---------------------------------------------------------------------------

RangeCursor ChunkStore::open_cursor(size_t length, std::optional<size_t> offset) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<size_t> start = offset ? offset : seek_;
    if (!start) {
        // 起点未知：退化为高水位处的零长度游标；要求非空有界区间则直接失败
        RangeCursor cursor(*this, current_end_, current_end_, 0);
        if (length != 0 && length != kUnbounded) {
            cursor.fail(std::make_exception_ptr(
                OutOfBoundsError("cursor offset unknown, cannot read " + std::to_string(length) + " bytes")));
        }
        return cursor;
    }

    std::optional<size_t> end = range_end(*start, length);
    if (!end) {
        // 终点越过可寻址范围，游标不会有数据；游标位置不变
        RangeCursor cursor(*this, *start, *start, 0);
        cursor.fail(std::make_exception_ptr(
            OutOfBoundsError("cursor of " + std::to_string(length) + " bytes at offset " +
                             std::to_string(*start) + " exceeds the addressable stream")));
        return cursor;
    }

    set_seek_locked(*end);
    uint64_t id = *start < *end ? register_reader_locked(*start) : 0;
    return RangeCursor(*this, *start, *end, id);
}

uint64_t ChunkStore::register_reader_locked(size_t pos) {
    uint64_t id = next_reader_id_++;
    readers_[id] = pos;
    return id;
}

void ChunkStore::release_reader(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    readers_.erase(id);
}

bool ChunkStore::next_slice(uint64_t reader_id, size_t& pos, size_t& end, ByteSlice& out) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (pos >= end) {
            return false;
        }

        std::optional<ByteSlice> slice = locate_locked(pos, end);
        if (!slice) {
            wait_locked(lock);
        }

        if (state_ == State::ENDED && end == kUnbounded) {
            end = current_end_;
        }

        // 末尾的空切片不交给消费者，收紧 end 后下一轮自然结束
        if (slice && !slice->empty()) {
            pos += slice->size();
            auto it = readers_.find(reader_id);
            if (it != readers_.end()) {
                it->second = pos;
            }
            out = std::move(*slice);
            return true;
        }
    }
}

// ---------------------------------------------------------------------------
// 共享游标与查询
// ---------------------------------------------------------------------------

std::optional<size_t> ChunkStore::get_seek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seek_;
}

std::optional<size_t> ChunkStore::set_seek(std::optional<size_t> seek) {
    std::lock_guard<std::mutex> lock(mutex_);
    set_seek_locked(seek);
    return seek_;
}

void ChunkStore::set_seek_locked(std::optional<size_t> seek) {
    if (seek && *seek == kUnbounded) {
        seek.reset();
    }
    if (!seek && state_ == State::ENDED) {
        seek = current_end_;
    }
    seek_ = seek;
}

size_t ChunkStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_locked();
}

size_t ChunkStore::size_locked() const {
    if (chunks_.empty()) {
        return 0;
    }
    return chunks_.back().end - chunks_.front().start;
}

size_t ChunkStore::current_end() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_end_;
}

size_t ChunkStore::low_water_mark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.empty() ? current_end_ : chunks_.front().start;
}

ChunkStore::State ChunkStore::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ChunkStore::set_resize_callback(ResizeCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    resize_cb_ = std::move(cb);
}

// ---------------------------------------------------------------------------
// 等待 / 唤醒
// ---------------------------------------------------------------------------

void ChunkStore::wait_locked(std::unique_lock<std::mutex>& lock) {
    const uint64_t seen = generation_;
    changed_cv_.wait(lock, [this, seen] { return generation_ != seen; });
}

void ChunkStore::notify_locked() {
    ++generation_;
    changed_cv_.notify_all();
}
