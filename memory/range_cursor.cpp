#include "range_cursor.hpp"
#include <utility>
#include "chunk_store.hpp"
#include "pr.hpp"

RangeCursor::RangeCursor(ChunkStore& store, size_t start, size_t end, uint64_t reader_id)
    : store_(&store)
    , reader_id_(reader_id)
    , pos_(start)
    , end_(end) {
}

RangeCursor::~RangeCursor() {
    release();
}

RangeCursor::RangeCursor(RangeCursor&& other) noexcept
    : store_(other.store_)
    , reader_id_(std::exchange(other.reader_id_, 0))
    , pos_(other.pos_)
    , end_(other.end_)
    , finished_(other.finished_)
    , error_(std::move(other.error_)) {
}

RangeCursor& RangeCursor::operator=(RangeCursor&& other) noexcept {
    if (this != &other) {
        release();
        store_ = other.store_;
        reader_id_ = std::exchange(other.reader_id_, 0);
        pos_ = other.pos_;
        end_ = other.end_;
        finished_ = other.finished_;
        error_ = std::move(other.error_);
    }
    return *this;
}

void RangeCursor::release() {
    if (reader_id_ != 0) {
        store_->release_reader(reader_id_);
        reader_id_ = 0;
    }
}

bool RangeCursor::pull(ByteSlice& out) {
    if (error_) {
        std::rethrow_exception(error_);
    }
    if (finished_) {
        return false;
    }

    try {
        if (!store_->next_slice(reader_id_, pos_, end_, out)) {
            finished_ = true;
            release();
            return false;
        }
        return true;
    } catch (const StoreError& e) {
        PR_DEBUG("cursor at %zu failed: %s", pos_, e.what());
        error_ = std::current_exception();
        release();
        throw;
    }
}

void RangeCursor::fail(std::exception_ptr error) {
    if (!error_ && !finished_) {
        error_ = std::move(error);
        release();
    }
}
