#ifndef PARTITION_BUFFER_HPP
#define PARTITION_BUFFER_HPP

#include "chunk_writer.hpp"
#include "partition_id.hpp"
#include "sink_record.hpp"
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdint>

// Buffering state of one partition: the chunk writer plus the offset range it covers.
// Accepts writes only while ACTIVE. finalize() seals the chunk and is idempotent,
// so a flush that fails after sealing can be retried with the same files.
class PartitionBuffer {
public:
    enum class State {
        ACTIVE,
        SEALED,
        DISCARDED
    };

    PartitionBuffer(const PartitionId& partition,
                    std::unique_ptr<ChunkWriter> writer,
                    int64_t start_offset);
    ~PartitionBuffer();

    PartitionBuffer(const PartitionBuffer&) = delete;
    PartitionBuffer& operator=(const PartitionBuffer&) = delete;

    // Append a record in delivery order.
    // Returns false if the record is below getNextOffset() (already buffered).
    // Throws std::logic_error unless ACTIVE; writer failures propagate unchanged.
    bool append(const SinkRecord& record);

    // Seal the chunk and return its files. Repeated calls return the same files
    // without touching the writer. A failed attempt leaves the buffer ACTIVE.
    ChunkFiles finalize();

    // Drop the chunk and its local files. Safe to call more than once.
    void discard();

    State getState() const { return state_.load(); }
    bool isSealed() const { return state_.load() == State::SEALED; }
    bool isDiscarded() const { return state_.load() == State::DISCARDED; }

    const PartitionId& getPartition() const { return partition_; }
    int64_t getStartOffset() const { return start_offset_; }
    int64_t getNextOffset() const { return next_offset_.load(); }
    size_t getRecordCount() const { return record_count_.load(); }
    size_t getBufferedBytes() const { return buffered_bytes_.load(); }

private:
    PartitionId partition_;
    std::unique_ptr<ChunkWriter> writer_;
    const int64_t start_offset_;

    // Serializes writer access between the owning partition's calls and a
    // revocation that may arrive while a flush is in flight
    mutable std::mutex mutex_;

    std::atomic<State> state_;
    std::atomic<int64_t> next_offset_;
    std::atomic<size_t> record_count_;
    std::atomic<size_t> buffered_bytes_;

    ChunkFiles sealed_files_;
};

#endif // PARTITION_BUFFER_HPP
