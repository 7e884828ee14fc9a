#include "partition_buffer.hpp"
#include <stdexcept>

PartitionBuffer::PartitionBuffer(const PartitionId& partition,
                                 std::unique_ptr<ChunkWriter> writer,
                                 int64_t start_offset)
    : partition_(partition)
    , writer_(std::move(writer))
    , start_offset_(start_offset)
    , state_(State::ACTIVE)
    , next_offset_(start_offset)
    , record_count_(0)
    , buffered_bytes_(0) {
    if (!writer_) {
        throw std::invalid_argument("PartitionBuffer requires a chunk writer");
    }
}

PartitionBuffer::~PartitionBuffer() {
    discard();
}

bool PartitionBuffer::append(const SinkRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != State::ACTIVE) {
        throw std::logic_error("Partition " + partition_.toString() +
                               ": buffer is not writable");
    }

    int64_t expected = next_offset_.load();
    if (record.offset >= 0 && record.offset < expected) {
        return false;
    }

    SinkRecord positioned = record;
    if (positioned.offset < 0) {
        positioned.offset = expected;
    }

    size_t count = writer_->append(positioned);

    next_offset_ = positioned.offset + 1;
    record_count_ = count;
    buffered_bytes_ = writer_->getBufferedBytes();
    return true;
}

ChunkFiles PartitionBuffer::finalize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == State::SEALED) {
        return sealed_files_;
    }
    if (state_ == State::DISCARDED) {
        throw std::logic_error("Partition " + partition_.toString() +
                               ": cannot finalize a discarded buffer");
    }

    sealed_files_ = writer_->finalize();
    state_ = State::SEALED;
    return sealed_files_;
}

void PartitionBuffer::discard() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == State::DISCARDED) {
        return;
    }
    state_ = State::DISCARDED;
    writer_->discard();
}
