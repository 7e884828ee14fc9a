#ifndef SINK_COORDINATOR_HPP
#define SINK_COORDINATOR_HPP

#include "chunk_writer.hpp"
#include "object_store.hpp"
#include "partition_buffer.hpp"
#include "partition_id.hpp"
#include "sink_context.hpp"
#include "sink_record.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Point-in-time view of one partition's buffer
struct PartitionStatus {
    PartitionId partition;
    int64_t start_offset = 0;
    int64_t next_offset = 0;
    size_t record_count = 0;
    size_t buffered_bytes = 0;
    bool sealed = false;
};

// Owns one PartitionBuffer per assigned partition and implements the
// assignment / put / flush / revocation protocol against the object store.
//
// Calls for one partition must be serialized by the host. Calls for different
// partitions may run concurrently: the buffer table lock is never held across
// writer or object store I/O.
class SinkCoordinator {
public:
    SinkCoordinator(SinkContext& context,
                    ObjectStoreClient& store,
                    ChunkWriterFactory& writer_factory,
                    const std::string& local_dir,
                    size_t chunk_threshold_bytes);
    ~SinkCoordinator();

    // Recover every partition the host already has assigned
    void start();

    // Discard all buffers; the archive is the source of truth on restart
    void stop();

    // Recover newly assigned partitions from the archive. Throws ArchiverError
    // if the resume offset cannot be determined.
    void onAssigned(const std::vector<PartitionId>& partitions);

    // Discard buffers of revoked partitions; unknown partitions are ignored
    void onRevoked(const std::vector<PartitionId>& partitions);

    // Buffer records in delivery order.
    // ArchiverError for an unassigned partition, RetriableError for local
    // write failures or a partition whose sealed chunk still awaits upload.
    void put(const std::vector<SinkRecord>& records);

    // Upload every non-empty buffer named in checkpoints. Returns the offset
    // that is safe to commit for each of those partitions.
    // ArchiverError if any partition is unassigned (nothing is uploaded),
    // RetriableError if any upload or finalize failed (other partitions are
    // still flushed and their buffers replaced).
    std::map<PartitionId, int64_t> flush(const std::map<PartitionId, int64_t>& checkpoints);

    bool isAssigned(const PartitionId& partition) const;
    std::vector<PartitionStatus> getPartitionStatus() const;
    size_t getPartitionCount() const;
    size_t getTotalBufferedBytes() const;
    size_t getTotalRecordCount() const;

private:
    SinkContext& context_;
    ObjectStoreClient& store_;
    ChunkWriterFactory& writer_factory_;
    std::string local_dir_;
    size_t chunk_threshold_bytes_;

    std::map<PartitionId, std::shared_ptr<PartitionBuffer>> buffers_;
    mutable std::mutex buffers_mutex_;

    std::shared_ptr<PartitionBuffer> findBuffer(const PartitionId& partition) const;

    // Pause, look up the archived offset, create the buffer, seek and resume
    void recoverPartition(const PartitionId& partition);

    std::shared_ptr<PartitionBuffer> createBuffer(const PartitionId& partition, int64_t start_offset);

    // Returns the committed offset for the partition; throws on failure
    int64_t flushPartition(const PartitionId& partition, int64_t checkpoint);

    // True once `buffer` is no longer the partition's mapped buffer (logged)
    bool wasRevoked(const PartitionId& partition, const std::shared_ptr<PartitionBuffer>& buffer) const;

    // Swap in a fresh buffer if `expected` is still the current one
    bool replaceBuffer(const PartitionId& partition,
                       const std::shared_ptr<PartitionBuffer>& expected,
                       std::shared_ptr<PartitionBuffer> replacement);
};

#endif // SINK_COORDINATOR_HPP
